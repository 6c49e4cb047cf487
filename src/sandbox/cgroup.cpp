#include "sandbox/cgroup.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <libcgroup.h>
#include <signal.h>
#include <cerrno>
#include <fstream>
#include <mutex>

namespace grader {
using namespace std;

cgroup_exception::cgroup_exception(std::string cgroup_op, int err) {
    if (err == ECGOTHER) {
        errmsg += "libcgroup: ";
        errmsg += cgroup_op;
        errmsg += ": ";
        errmsg += cgroup_strerror(cgroup_get_last_errno());
    } else {
        errmsg += cgroup_op;
        errmsg += ": ";
        errmsg += cgroup_strerror(err);
    }
}

const char *cgroup_exception::what() const noexcept {
    return errmsg.c_str();
}

void cgroup_exception::ensure(std::string cgroup_op, int err) {
    if (err != 0) {
        throw cgroup_exception(cgroup_op, err);
    }
}

void cgroup_guard::init() {
    static once_flag initialized;
    call_once(initialized, [] {
        cgroup_exception::ensure(
            "cgroup_init",
            cgroup_init());
    });
}

void cgroup_ctrl::add_value(const std::string &name, int64_t value) {
    cgroup_exception::ensure(
        fmt::format("cgroup_add_value_int64({}, {})", name, value),
        cgroup_add_value_int64(ctrl, name.c_str(), value));
}

int64_t cgroup_ctrl::get_value_int64(const std::string &name) {
    int64_t value;
    cgroup_exception::ensure(
        fmt::format("cgroup_get_value_int64({})", name),
        cgroup_get_value_int64(ctrl, name.c_str(), &value));
    return value;
}

cgroup_guard::cgroup_guard(const std::string &cgroup_name) {
    cg = cgroup_new_cgroup(cgroup_name.c_str());
    if (!cg)
        throw cgroup_exception(
            fmt::format("cgroup_new_cgroup({})", cgroup_name),
            cgroup_get_last_errno());
}

cgroup_guard::~cgroup_guard() {
    cgroup_free(&cg);
}

void cgroup_guard::create_cgroup(int ignore_ownership) {
    cgroup_exception::ensure(
        fmt::format("cgroup_create_cgroup({})", ignore_ownership),
        cgroup_create_cgroup(cg, ignore_ownership));
}

cgroup_ctrl cgroup_guard::add_controller(const std::string &name) {
    struct cgroup_controller *cg_controller = cgroup_add_controller(cg, name.c_str());
    if (cg_controller == nullptr)
        throw cgroup_exception(
            fmt::format("cgroup_add_controller({})", name),
            cgroup_get_last_errno());
    return {cg_controller};
}

cgroup_ctrl cgroup_guard::get_controller(const std::string &name) {
    struct cgroup_controller *cg_controller = cgroup_get_controller(cg, name.c_str());
    if (cg_controller == nullptr)
        throw cgroup_exception(
            fmt::format("cgroup_get_controller({})", name),
            cgroup_get_last_errno());
    return {cg_controller};
}

void cgroup_guard::get_cgroup() {
    cgroup_exception::ensure(
        "cgroup_get_cgroup",
        cgroup_get_cgroup(cg));
}

void cgroup_guard::attach_task(pid_t pid) {
    cgroup_exception::ensure(
        fmt::format("cgroup_attach_task_pid({})", pid),
        cgroup_attach_task_pid(cg, pid));
}

void cgroup_guard::delete_cgroup() {
    cgroup_exception::ensure(
        "cgroup_delete_cgroup",
        cgroup_delete_cgroup_ext(cg, CGFLAG_DELETE_IGNORE_MIGRATION | CGFLAG_DELETE_RECURSIVE));
}

void cgroup_create(const string &name, int64_t memory_bytes) {
    cgroup_guard::init();
    cgroup_guard cg(name);

    cgroup_ctrl ctrl = cg.add_controller("memory");
    // 将 RAM 和 RAM+交换 的大小限制设为一样可以强制不发生交换
    ctrl.add_value("memory.limit_in_bytes", memory_bytes);
    ctrl.add_value("memory.memsw.limit_in_bytes", memory_bytes);

    cg.add_controller("cpuacct");

    cg.create_cgroup(1);
}

void cgroup_attach(const string &name, pid_t pid) {
    cgroup_guard cg(name);
    cg.get_cgroup();
    cg.attach_task(pid);
}

cgroup_usage cgroup_summarize(const string &name) {
    cgroup_usage usage;
    cgroup_guard guard(name);
    guard.get_cgroup();  // prepare for get_controller

    cgroup_ctrl ctrl = guard.get_controller("memory");
    usage.max_usage_bytes = ctrl.get_value_int64("memory.memsw.max_usage_in_bytes");

    ifstream fin("/sys/fs/cgroup/memory" + name + "/memory.oom_control");
    string token;
    while (fin >> token) {
        if (token == "oom_kill") {
            int64_t count = 0;
            fin >> count;
            usage.oom_killed = count > 0;
        }
    }
    return usage;
}

void cgroup_kill(const string &name) {
    void *ptr = nullptr;
    pid_t pid;

    while (true) {
        int ret = cgroup_get_task_begin(name.c_str(), "memory", &ptr, &pid);
        cgroup_get_task_end(&ptr);
        if (ret != 0)
            break;
        if (kill(pid, SIGKILL) != 0 && errno != ESRCH) {
            LOG(ERROR) << "unable to kill process " << pid << " in cgroup " << name;
            break;
        }
    }
}

void cgroup_delete(const string &name) {
    cgroup_guard cg(name);
    cg.add_controller("cpuacct");
    cg.add_controller("memory");
    cg.delete_cgroup();
}

}  // namespace grader
