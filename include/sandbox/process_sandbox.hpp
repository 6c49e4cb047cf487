#pragma once

#include "sandbox/sandbox.hpp"

namespace grader {

/**
 * @brief 基于操作系统进程的沙箱
 *
 * 每次运行都 fork 一个新的进程组，在 exec Python 解释器之前设置：
 * 1. 资源限制：RLIMIT_CPU、RLIMIT_AS（或 cgroup 内存限制）、RLIMIT_FSIZE、RLIMIT_NPROC
 * 2. 干净的环境变量，工作目录为独占的临时目录
 * 3. 可选地切换到低权限用户、独立的网络命名空间
 * 4. seccomp 过滤器，拒绝 socket、ptrace、mount 和离开进程组
 * 之后 bootstrap.py 在解释器内部安装审计钩子和导入白名单，再执行用户代码。
 *
 * 监督进程用 poll 读取输出并计时，超时、输出超限或取消时杀死整个进程组。
 * 本类无状态，可以被多个工作线程共享。
 */
struct process_sandbox : public sandbox {
    sandbox_run execute(const std::string &code, const std::string &input,
                        const limit_policy &policy, const cancellation_token &cancellation) override;
};

}  // namespace grader
