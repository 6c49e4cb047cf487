#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <thread>
#include "gtest/gtest.h"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/process_sandbox.hpp"
#include "test/python_support.hpp"
using namespace std;
using namespace grader;
namespace fs = std::filesystem;

/**
 * 需要本机安装 Python 3.8 以上版本，并且内核允许加载 seccomp 过滤器
 */
class ProcessSandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (auto &reason = test::python_sandbox_unavailable()) GTEST_SKIP() << *reason;
    }

    sandbox_run execute(const string &code, const string &input = "", limit_policy policy = limit_policy()) {
        return box.execute(code, input, policy, cancellation);
    }

    static size_t scratch_entries() {
        if (!fs::exists(SCRATCH_DIR)) return 0;
        return distance(fs::directory_iterator(SCRATCH_DIR), fs::directory_iterator());
    }

    process_sandbox box;
    cancellation_token cancellation;
};

TEST_F(ProcessSandboxTest, AcceptedTest) {
    sandbox_run run = execute("name = input()\nprint('hello, ' + name)\n", "world\n");
    EXPECT_EQ(run.status, exit_status::NORMAL);
    EXPECT_EQ(run.stdout_data, "hello, world\n");
    EXPECT_EQ(run.exit_code, 0);
    EXPECT_EQ(run.signal, 0);
    EXPECT_GT(run.peak_memory_bytes, 0);
}

TEST_F(ProcessSandboxTest, NoOutputTest) {
    sandbox_run run = execute("x = 1\n");
    EXPECT_EQ(run.status, exit_status::NORMAL);
    EXPECT_EQ(run.stdout_data, "");
}

TEST_F(ProcessSandboxTest, EmptyCodeTest) {
    sandbox_run run = execute("  \n\t\n");
    EXPECT_EQ(run.status, exit_status::RUNTIME_ERROR);
    EXPECT_FALSE(run.stderr_data.empty());
    EXPECT_EQ(scratch_entries(), 0);
}

TEST_F(ProcessSandboxTest, SyntaxErrorTest) {
    sandbox_run run = execute("def f(:\n    pass\n");
    EXPECT_EQ(run.status, exit_status::RUNTIME_ERROR);
    EXPECT_NE(last_line(run.stderr_data).find("SyntaxError"), string::npos) << run.stderr_data;
}

TEST_F(ProcessSandboxTest, RuntimeErrorTest) {
    sandbox_run run = execute("print('before')\nprint(1 / 0)\n");
    EXPECT_EQ(run.status, exit_status::RUNTIME_ERROR);
    EXPECT_EQ(run.stdout_data, "before\n");
    EXPECT_EQ(run.exit_code, 1);
    EXPECT_EQ(last_line(run.stderr_data), "ZeroDivisionError: division by zero");
}

TEST_F(ProcessSandboxTest, NonZeroExitTest) {
    sandbox_run run = execute("import sys\nsys.exit(3)\n");
    EXPECT_EQ(run.status, exit_status::RUNTIME_ERROR);
    EXPECT_EQ(run.exit_code, 3);
}

TEST_F(ProcessSandboxTest, CpuBoundTimeLimitTest) {
    limit_policy policy;
    policy.wall_clock_ms = 2000;
    elapsed_time timer;
    sandbox_run run = execute("while True:\n    pass\n", "", policy);
    auto elapsed = timer.duration<chrono::milliseconds>().count();

    EXPECT_EQ(run.status, exit_status::KILLED_TIMEOUT);
    EXPECT_LE(elapsed, 2000 + GRACE_MARGIN_MS);
}

TEST_F(ProcessSandboxTest, CpuBoundWallClockLimitTest) {
    limit_policy policy;
    policy.cpu_time_ms = 2000;
    policy.wall_clock_ms = 2000;
    elapsed_time timer;
    sandbox_run run = execute("while True:\n    pass\n", "", policy);
    auto elapsed = timer.duration<chrono::milliseconds>().count();

    EXPECT_EQ(run.status, exit_status::KILLED_TIMEOUT);
    EXPECT_LE(elapsed, 2000 + GRACE_MARGIN_MS);
}

TEST_F(ProcessSandboxTest, WallClockTimeLimitTest) {
    limit_policy policy;
    policy.cpu_time_ms = 1000;
    policy.wall_clock_ms = 1000;
    elapsed_time timer;
    sandbox_run run = execute("import time\ntime.sleep(10)\n", "", policy);
    auto elapsed = timer.duration<chrono::milliseconds>().count();

    EXPECT_EQ(run.status, exit_status::KILLED_TIMEOUT);
    EXPECT_GE(elapsed, 900);
    EXPECT_LE(elapsed, 1000 + GRACE_MARGIN_MS);
}

TEST_F(ProcessSandboxTest, MemoryLimitTest) {
    limit_policy policy;
    policy.memory_bytes = 128 << 20;
    sandbox_run run = execute("data = bytearray(512 * 1024 * 1024)\nprint(len(data))\n", "", policy);
    EXPECT_EQ(run.status, exit_status::KILLED_MEMORY);
    EXPECT_EQ(run.stdout_data, "");
}

TEST_F(ProcessSandboxTest, OutputLimitTest) {
    limit_policy policy;
    policy.max_output_bytes = 1024;
    sandbox_run run = execute("while True:\n    print('x' * 100)\n", "", policy);
    EXPECT_EQ(run.status, exit_status::KILLED_OUTPUT_OVERFLOW);
    EXPECT_EQ(run.stdout_data.size(), 1024);
}

TEST_F(ProcessSandboxTest, WriteInsideScratchTest) {
    sandbox_run run = execute("with open('data.txt', 'w') as f:\n    f.write('saved')\nprint(open('data.txt').read())\n");
    EXPECT_EQ(run.status, exit_status::NORMAL) << run.stderr_data;
    EXPECT_EQ(run.stdout_data, "saved\n");
}

TEST_F(ProcessSandboxTest, WriteOutsideScratchTest) {
    fs::path target = fs::temp_directory_path() / ("exercise-grader-escape-" + random_id());
    sandbox_run run = execute("open(" + nlohmann::json(target.string()).dump() + ", 'w').write('escaped')\n");
    EXPECT_EQ(run.status, exit_status::RUNTIME_ERROR);
    EXPECT_NE(run.stderr_data.find("PermissionError"), string::npos) << run.stderr_data;
    EXPECT_FALSE(fs::exists(target));
}

TEST_F(ProcessSandboxTest, DirFdWriteOutsideScratchTest) {
    fs::path outside = fs::temp_directory_path() / ("exercise-grader-escape-" + random_id());
    fs::create_directory(outside);
    limit_policy policy;
    policy.allowed_modules = {"os"};
    string code = "import os\n"
                  "fd = os.open(" + nlohmann::json(outside.string()).dump() + ", os.O_RDONLY)\n"
                  "w = os.open('escaped.txt', os.O_WRONLY | os.O_CREAT, 0o644, dir_fd=fd)\n"
                  "os.write(w, b'escaped')\n"
                  "print('written')\n";
    sandbox_run run = execute(code, "", policy);
    bool escaped = fs::exists(outside / "escaped.txt");
    fs::remove_all(outside);

    EXPECT_EQ(run.status, exit_status::RUNTIME_ERROR);
    EXPECT_EQ(run.stdout_data, "");
    EXPECT_NE(last_line(run.stderr_data).find("PermissionError"), string::npos) << run.stderr_data;
    EXPECT_FALSE(escaped);
}

TEST_F(ProcessSandboxTest, DirFdRenameOutsideScratchTest) {
    fs::path outside = fs::temp_directory_path() / ("exercise-grader-escape-" + random_id());
    fs::create_directory(outside);
    limit_policy policy;
    policy.allowed_modules = {"os"};
    string code = "import os\n"
                  "open('moved.txt', 'w').write('moved')\n"
                  "fd = os.open(" + nlohmann::json(outside.string()).dump() + ", os.O_RDONLY)\n"
                  "os.rename('moved.txt', 'moved.txt', dst_dir_fd=fd)\n";
    sandbox_run run = execute(code, "", policy);
    bool escaped = fs::exists(outside / "moved.txt");
    fs::remove_all(outside);

    EXPECT_EQ(run.status, exit_status::RUNTIME_ERROR);
    EXPECT_FALSE(escaped);
}

TEST_F(ProcessSandboxTest, DisallowedImportTest) {
    sandbox_run run = execute("import os\nprint(os.getcwd())\n");
    EXPECT_EQ(run.status, exit_status::RUNTIME_ERROR);
    EXPECT_EQ(run.stdout_data, "");
    EXPECT_NE(last_line(run.stderr_data).find("ImportError"), string::npos) << run.stderr_data;
}

TEST_F(ProcessSandboxTest, DisallowedDunderImportTest) {
    for (const char *code : {"o = __import__('os')\nprint(o.getcwd())\n",
                             "o = __import__('os', {})\nprint(o.getcwd())\n"}) {
        sandbox_run run = execute(code);
        EXPECT_EQ(run.status, exit_status::RUNTIME_ERROR) << code;
        EXPECT_EQ(run.stdout_data, "") << code;
        EXPECT_NE(last_line(run.stderr_data).find("ImportError"), string::npos) << run.stderr_data;
    }
}

TEST_F(ProcessSandboxTest, BootstrapModulesHiddenTest) {
    sandbox_run run = execute("import sys\nprint('os' in sys.modules)\n");
    EXPECT_EQ(run.status, exit_status::NORMAL) << run.stderr_data;
    EXPECT_EQ(run.stdout_data, "False\n");
}

TEST_F(ProcessSandboxTest, AllowedImportTest) {
    sandbox_run run = execute("import math\nfrom collections import Counter\nprint(math.sqrt(16), Counter('aab')['a'])\n");
    EXPECT_EQ(run.status, exit_status::NORMAL) << run.stderr_data;
    EXPECT_EQ(run.stdout_data, "4.0 2\n");
}

TEST_F(ProcessSandboxTest, NetworkDeniedTest) {
    limit_policy policy;
    policy.allowed_modules = {"socket"};
    sandbox_run run = execute("import socket\ns = socket.socket()\nprint('connected')\n", "", policy);
    EXPECT_EQ(run.status, exit_status::RUNTIME_ERROR);
    EXPECT_EQ(run.stdout_data, "");
}

TEST_F(ProcessSandboxTest, SubprocessDeniedTest) {
    limit_policy policy;
    policy.allowed_modules = {"subprocess"};
    sandbox_run run = execute("import subprocess\nsubprocess.run(['echo', 'escaped'])\n", "", policy);
    EXPECT_EQ(run.status, exit_status::RUNTIME_ERROR);
    EXPECT_EQ(run.stdout_data.find("escaped"), string::npos);
}

TEST_F(ProcessSandboxTest, ScratchRemovedTest) {
    execute("open('left-behind.txt', 'w').write('x')\n");
    execute("print(1 / 0)\n");
    EXPECT_EQ(scratch_entries(), 0);
}

TEST_F(ProcessSandboxTest, IsolatedScratchTest) {
    const int N = 4;
    vector<sandbox_run> runs(N);
    vector<thread> threads;
    for (int i = 0; i < N; ++i) {
        threads.emplace_back([&, i] {
            process_sandbox local;
            cancellation_token token;
            // 模式 x 在文件已存在时失败
            runs[i] = local.execute("open('marker.txt', 'x').write('" + to_string(i) + "')\nprint(open('marker.txt').read())\n",
                                    "", limit_policy(), token);
        });
    }
    for (auto &t : threads) t.join();
    for (int i = 0; i < N; ++i) {
        EXPECT_EQ(runs[i].status, exit_status::NORMAL) << runs[i].stderr_data;
        EXPECT_EQ(runs[i].stdout_data, to_string(i) + "\n");
    }
    EXPECT_EQ(scratch_entries(), 0);
}

TEST_F(ProcessSandboxTest, CancelTest) {
    limit_policy policy;
    policy.cpu_time_ms = 10000;
    policy.wall_clock_ms = 10000;
    thread canceller([this] {
        this_thread::sleep_for(chrono::milliseconds(200));
        cancellation.cancel();
    });
    elapsed_time timer;
    sandbox_run run = execute("while True:\n    pass\n", "", policy);
    auto elapsed = timer.duration<chrono::milliseconds>().count();
    canceller.join();

    EXPECT_EQ(run.status, exit_status::CANCELLED);
    EXPECT_LT(elapsed, 3000);
}

TEST_F(ProcessSandboxTest, CancelledBeforeStartTest) {
    cancellation.cancel();
    sandbox_run run = execute("print('never')\n");
    EXPECT_EQ(run.status, exit_status::CANCELLED);
    EXPECT_EQ(run.stdout_data, "");
}
