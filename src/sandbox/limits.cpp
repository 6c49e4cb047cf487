#include "sandbox/limits.hpp"
#include <fmt/core.h>
#include <fcntl.h>
#include <grp.h>
#include <sched.h>
#include <seccomp.h>
#include <sys/resource.h>
#include <unistd.h>
#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <vector>
#include "common/defer.hpp"

namespace grader {
using namespace std;

static void set_rlimit(int resource, rlim_t cur, rlim_t max) {
    struct rlimit lim;
    lim.rlim_cur = cur;
    lim.rlim_max = max;
    if (setrlimit(resource, &lim) != 0)
        throw system_error(errno, generic_category(), fmt::format("setrlimit({})", resource));
}

static void isolate_network() {
    // 非特权用户需要借助用户命名空间
    int flags = geteuid() == 0 ? CLONE_NEWNET : CLONE_NEWUSER | CLONE_NEWNET;
    if (unshare(flags) == 0) return;
    // 内核或容器不允许创建命名空间时依靠 seccomp 拒绝 socket
    if (errno != EPERM && errno != EINVAL && errno != ENOSPC && errno != EUSERS)
        throw system_error(errno, generic_category(), "unable to unshare network namespace");
}

void set_restrictions(const child_restrictions &opt) {
    /* Setting the real hard limit one second
       higher: at the soft limit the kernel will send SIGXCPU at
       the hard limit a SIGKILL. The SIGXCPU can be caught, but is
       not by default and gives us a reliable way to detect if the
       CPU-time limit was reached. */
    rlim_t cputime_limit = (rlim_t)((opt.cpu_time_ms + 999) / 1000);
    set_rlimit(RLIMIT_CPU, cputime_limit, cputime_limit + 1);

    if (!opt.memory_in_cgroup)
        set_rlimit(RLIMIT_AS, opt.memory_bytes, opt.memory_bytes);

    set_rlimit(RLIMIT_FSIZE, opt.max_file_bytes, opt.max_file_bytes);
    set_rlimit(RLIMIT_NOFILE, opt.max_open_files, opt.max_open_files);
    set_rlimit(RLIMIT_CORE, 0, 0);

    // 必须在切换用户之前，切换后失去 CAP_SYS_ADMIN
    if (opt.isolate_network)
        isolate_network();

    if (opt.group_id >= 0) {
        if (setgid(opt.group_id))
            throw system_error(errno, generic_category(), "unable to set group id");
        gid_t aux_groups[1];
        aux_groups[0] = opt.group_id;
        if (setgroups(1, aux_groups))
            throw system_error(errno, generic_category(), "unable to clear auxiliary groups");
    }

    if (opt.user_id >= 0) {
        if (setuid(opt.user_id))
            throw system_error(errno, generic_category(), "unable to set user id");
    }

    // RLIMIT_NPROC 按真实用户计数，切换用户后再设置
    set_rlimit(RLIMIT_NPROC, opt.max_processes, opt.max_processes);
}

static const int denied_syscalls[] = {
    SCMP_SYS(socket),
    SCMP_SYS(socketpair),
    SCMP_SYS(connect),
    SCMP_SYS(bind),
    SCMP_SYS(listen),
    SCMP_SYS(accept),
    SCMP_SYS(accept4),
    SCMP_SYS(ptrace),
    SCMP_SYS(process_vm_readv),
    SCMP_SYS(process_vm_writev),
    SCMP_SYS(mount),
    SCMP_SYS(umount2),
    SCMP_SYS(pivot_root),
    SCMP_SYS(chroot),
    SCMP_SYS(unshare),
    SCMP_SYS(setns),
    SCMP_SYS(setsid),
    SCMP_SYS(setpgid),
    SCMP_SYS(bpf),
    SCMP_SYS(perf_event_open),
    SCMP_SYS(keyctl),
    SCMP_SYS(add_key),
    SCMP_SYS(request_key),
    SCMP_SYS(init_module),
    SCMP_SYS(finit_module),
    SCMP_SYS(delete_module),
    SCMP_SYS(kexec_load),
    SCMP_SYS(reboot),
};

/**
 * @brief 以目录文件描述符为基准的路径不经过解释器内按路径的检查
 * dirfd 参数为非负的文件描述符时拒绝，AT_FDCWD 是负数，不受影响
 */
static const scmp_datum_t FD_SIGN_BIT = 0x80000000;

static const struct {
    int syscall;
    unsigned int dirfd_arg;
} dirfd_syscalls[] = {
    {SCMP_SYS(renameat), 0},
    {SCMP_SYS(renameat), 2},
    {SCMP_SYS(renameat2), 0},
    {SCMP_SYS(renameat2), 2},
    {SCMP_SYS(linkat), 0},
    {SCMP_SYS(linkat), 2},
    {SCMP_SYS(symlinkat), 1},
    {SCMP_SYS(mkdirat), 0},
    {SCMP_SYS(mknodat), 0},
    {SCMP_SYS(unlinkat), 0},
    {SCMP_SYS(fchmodat), 0},
    {SCMP_SYS(fchownat), 0},
    {SCMP_SYS(utimensat), 0},
};

static const scmp_datum_t open_write_flags[] = {O_WRONLY, O_RDWR, O_CREAT, O_TRUNC, O_APPEND};

static void add_rule(scmp_filter_ctx ctx, int syscall, const vector<scmp_arg_cmp> &args) {
    int ret = seccomp_rule_add_array(ctx, SCMP_ACT_ERRNO(EACCES), syscall, (unsigned int)args.size(), args.data());
    if (ret < 0)
        throw system_error(-ret, generic_category(), fmt::format("seccomp_rule_add({})", syscall));
}

static scmp_arg_cmp dirfd_is_descriptor(unsigned int arg) {
    return {arg, SCMP_CMP_MASKED_EQ, FD_SIGN_BIT, 0};
}

void set_seccomp() {
    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (ctx == nullptr)
        throw runtime_error("seccomp_init failed");
    defer { seccomp_release(ctx); };

    for (int syscall : denied_syscalls)
        add_rule(ctx, syscall, {});

    // openat2 的标志位在用户内存中，无法检查
    add_rule(ctx, SCMP_SYS(openat2), {});
    for (scmp_datum_t flag : open_write_flags)
        add_rule(ctx, SCMP_SYS(openat), {dirfd_is_descriptor(0), {2, SCMP_CMP_MASKED_EQ, flag, flag}});
    for (auto &rule : dirfd_syscalls)
        add_rule(ctx, rule.syscall, {dirfd_is_descriptor(rule.dirfd_arg)});

    int ret = seccomp_load(ctx);
    if (ret < 0)
        throw system_error(-ret, generic_category(), "seccomp_load");
}

}  // namespace grader
