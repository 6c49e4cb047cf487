#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace grader {

/**
 * @brief 无论题目如何配置都允许用户代码导入的模块
 * 这些模块不提供文件系统修改、进程创建或网络访问能力
 */
const std::vector<std::string> &baseline_modules();

/**
 * @brief 生成 bootstrap.py 的内容
 *
 * bootstrap.py 是解释器执行的第一个脚本，它：
 * 1. 编译 main.py
 * 2. 安装无法移除的审计钩子 (sys.addaudithook)，拒绝临时目录之外的写操作、
 *    进程创建、socket 和 ctypes
 * 3. 替换 builtins.__import__，用户代码只能导入基线模块和 allowed_modules
 * 4. 以 __main__ 的身份执行 main.py
 *
 * 解释器内的限制只是第一道防线，资源限制和 seccomp 才是强制的。
 *
 * @param scratch 临时目录的绝对路径
 * @param allowed_modules 基线之外允许导入的模块
 */
std::string make_bootstrap(const std::filesystem::path &scratch, const std::vector<std::string> &allowed_modules);

}  // namespace grader
