#include <glog/logging.h>
#include <signal.h>
#include <unistd.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/exercise.hpp"
#include "judge/result.hpp"
#include "sandbox/process_sandbox.hpp"
#include "scheduler.hpp"
using namespace std;

enum exit_codes {
    E_SUCCESS = 0,
    E_CONFIGURATION_ERROR = 1,
    E_REJECTED = 2
};

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    // 用户程序关闭管道时不要让评测引擎退出
    signal(SIGPIPE, SIG_IGN);

    namespace po = boost::program_options;
    po::options_description desc("exercise-grader options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("exercise", po::value<string>(), "path to the exercise definition in JSON")
        ("source", po::value<string>(), "path to the submitted Python source code")
        ("caller", po::value<string>()->default_value("cli"), "caller id used by per-caller admission control")
        ("python", po::value<string>(), "set the Python 3.8+ interpreter. You can either pass it from environ PYTHON")
        ("scratch-dir", po::value<string>(), "set the directory to create per-run scratch directories in. You can either pass it from environ SCRATCHDIR")
        ("workers", po::value<size_t>()->default_value(4), "number of worker threads")
        ("queue-depth", po::value<size_t>()->default_value(64), "maximum number of queued grading requests")
        ("per-caller", po::value<size_t>()->default_value(1), "maximum number of queued or running requests per caller")
        ("grace-ms", po::value<int>(), "set the grace margin in milliseconds after the wall clock limit. You can either pass it from environ GRACEMS")
        ("use-cgroup", "limit memory of the whole process group with cgroup v1, requires root privilege")
        ("cgroup-root", po::value<string>(), "set the parent cgroup of per-run cgroups, default to /exercise-grader")
        ("no-network-isolation", "do not create a network namespace for user programs, sockets are still denied by seccomp")
        ("run-user", po::value<string>(), "set run user. You can either pass it from environ RUNUSER")
        ("run-group", po::value<string>(), "set run group. You can either pass it from environ RUNGROUP")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return E_CONFIGURATION_ERROR;
    }

    if (vm.count("help")) {
        cout << "ExerciseGrader: run a Python submission against the test cases of an exercise" << endl
             << "Prints the grading result as JSON on stdout" << endl
             << "Usage: " << argv[0] << " --exercise exercise.json --source main.py [options]" << endl;
        cout << desc << endl;
        return E_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "exercise-grader 1.0" << endl;
        return E_SUCCESS;
    }

    if (!vm.count("exercise") || !vm.count("source")) {
        cerr << "--exercise and --source are required" << endl
             << endl;
        cerr << desc << endl;
        return E_CONFIGURATION_ERROR;
    }

    if (vm.count("python")) {
        grader::PYTHON_EXECUTABLE = filesystem::path(vm.at("python").as<string>());
    } else if (getenv("PYTHON")) {
        grader::PYTHON_EXECUTABLE = filesystem::path(getenv("PYTHON"));
    }
    CHECK(filesystem::exists(grader::PYTHON_EXECUTABLE))
        << "Python interpreter " << grader::PYTHON_EXECUTABLE << " does not exist";

    if (vm.count("scratch-dir")) {
        grader::SCRATCH_DIR = filesystem::path(vm.at("scratch-dir").as<string>());
    } else if (getenv("SCRATCHDIR")) {
        grader::SCRATCH_DIR = filesystem::path(getenv("SCRATCHDIR"));
    }
    filesystem::create_directories(grader::SCRATCH_DIR);
    CHECK(filesystem::is_directory(grader::SCRATCH_DIR))
        << "Scratch directory " << grader::SCRATCH_DIR << " does not exist";

    if (vm.count("grace-ms")) {
        grader::GRACE_MARGIN_MS = vm.at("grace-ms").as<int>();
    } else if (getenv("GRACEMS")) {
        grader::GRACE_MARGIN_MS = boost::lexical_cast<int>(getenv("GRACEMS"));
    }
    CHECK(grader::GRACE_MARGIN_MS >= 0) << "Grace margin should not be negative";

    grader::USE_CGROUP = vm.count("use-cgroup") > 0;
    if (vm.count("cgroup-root"))
        grader::CGROUP_ROOT = vm.at("cgroup-root").as<string>();
    grader::ISOLATE_NETWORK = vm.count("no-network-isolation") == 0;

    string run_user = vm.count("run-user") ? vm.at("run-user").as<string>() : grader::get_env("RUNUSER", "");
    if (!run_user.empty()) {
        grader::RUN_USER_ID = grader::get_userid(run_user.c_str());
        CHECK(grader::RUN_USER_ID >= 0) << "Run user " << run_user << " does not exist";
    }

    string run_group = vm.count("run-group") ? vm.at("run-group").as<string>() : grader::get_env("RUNGROUP", "");
    if (!run_group.empty()) {
        grader::RUN_GROUP_ID = grader::get_groupid(run_group.c_str());
        CHECK(grader::RUN_GROUP_ID >= 0) << "Run group " << run_group << " does not exist";
    }

    if ((grader::RUN_USER_ID >= 0 || grader::RUN_GROUP_ID >= 0 || grader::USE_CGROUP) && getuid() != 0) {
        cerr << "--run-user, --run-group and --use-cgroup require privileged mode" << endl;
        return E_CONFIGURATION_ERROR;
    }
    if (getuid() == 0 && grader::RUN_USER_ID < 0)
        LOG(WARNING) << "Running user programs as root, consider specifying --run-user";

    grader::scheduler_options options;
    options.workers = vm.at("workers").as<size_t>();
    options.queue_depth = vm.at("queue-depth").as<size_t>();
    options.per_caller_limit = vm.at("per-caller").as<size_t>();

    try {
        shared_ptr<const grader::exercise> ex = make_shared<grader::exercise>(grader::exercise::from_json(
            nlohmann::json::parse(grader::read_file_content(vm.at("exercise").as<string>()))));
        string code = grader::read_file_content(vm.at("source").as<string>());

        grader::grading_scheduler scheduler(make_shared<grader::process_sandbox>(), options);
        grader::grading_result result = scheduler.grade(ex, code, vm.at("caller").as<string>());

        nlohmann::json j = result;
        cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << endl;
        return E_SUCCESS;
    } catch (grader::rejection_error& e) {
        cerr << "Rejected: " << e.what() << endl;
        return E_REJECTED;
    } catch (grader::configuration_error& e) {
        LOG(ERROR) << e;
        cerr << "Configuration error: " << e.what() << endl;
        return E_CONFIGURATION_ERROR;
    } catch (nlohmann::json::exception& e) {
        cerr << "Malformed exercise file: " << e.what() << endl;
        return E_CONFIGURATION_ERROR;
    } catch (system_error& e) {
        cerr << e.what() << endl;
        return E_CONFIGURATION_ERROR;
    }
}
