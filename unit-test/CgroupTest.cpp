#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>
#include <filesystem>
#include "gtest/gtest.h"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/cgroup.hpp"
#include "sandbox/process_sandbox.hpp"
#include "test/python_support.hpp"
using namespace std;
using namespace grader;
namespace fs = std::filesystem;

static const fs::path MEMORY_HIERARCHY = "/sys/fs/cgroup/memory";

/**
 * 需要以 root 运行，并且挂载了开启交换记账的 cgroup v1 memory 控制器
 */
class CgroupTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (geteuid() != 0) GTEST_SKIP() << "cgroup tests must run as root";
        if (!fs::exists(MEMORY_HIERARCHY / "memory.memsw.limit_in_bytes"))
            GTEST_SKIP() << "cgroup v1 memory controller with swap accounting is not mounted";
        name = fmt::format("{}/test-{}", CGROUP_ROOT, random_id());
    }

    fs::path directory() const {
        return MEMORY_HIERARCHY / fs::path(name).relative_path();
    }

    string name;
};

TEST_F(CgroupTest, LifecycleTest) {
    cgroup_create(name, 64 << 20);
    ASSERT_TRUE(fs::exists(directory()));

    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        while (true) pause();
    }

    cgroup_attach(name, pid);
    cgroup_usage usage = cgroup_summarize(name);
    EXPECT_GE(usage.max_usage_bytes, 0);
    EXPECT_FALSE(usage.oom_killed);

    cgroup_kill(name);
    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    EXPECT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGKILL);

    cgroup_delete(name);
    EXPECT_FALSE(fs::exists(directory()));
}

TEST_F(CgroupTest, SandboxMemoryLimitTest) {
    if (auto &reason = test::python_sandbox_unavailable()) GTEST_SKIP() << *reason;

    USE_CGROUP = true;
    process_sandbox box;
    cancellation_token cancellation;
    limit_policy policy;
    policy.memory_bytes = 128 << 20;
    sandbox_run run = box.execute("data = bytearray(512 * 1024 * 1024)\nprint(len(data))\n", "", policy, cancellation);
    sandbox_run normal = box.execute("print('fits')\n", "", limit_policy(), cancellation);
    USE_CGROUP = false;

    EXPECT_EQ(run.status, exit_status::KILLED_MEMORY) << run.stderr_data;
    EXPECT_EQ(run.stdout_data, "");
    EXPECT_EQ(normal.status, exit_status::NORMAL) << normal.stderr_data;
    EXPECT_EQ(normal.stdout_data, "fits\n");
    EXPECT_GT(normal.peak_memory_bytes, 0);

    // 每次运行的 cgroup 在返回前被删除
    fs::path root = MEMORY_HIERARCHY / fs::path(CGROUP_ROOT).relative_path();
    if (fs::exists(root))
        for (auto &entry : fs::directory_iterator(root))
            EXPECT_NE(entry.path().filename().string().rfind("run-", 0), 0u) << entry.path();
}
