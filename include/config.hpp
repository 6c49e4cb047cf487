#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 存放每次运行的临时目录的根目录
 * 每次运行都会在这里创建一个独占的目录，运行结束后删除。
 * 若将这个文件夹放进内存盘，可以加速用户程序的 IO 性能。
 *
 * SCRATCH_DIR
 * ├── run-0f8fad5b-d9cb-469f-a165-70867728950e // 随机生成的 uuid
 * │   ├── main.py // 用户代码，函数调用模式下末尾附加测试片段
 * │   ├── stdin.txt // 标准输入
 * │   └── bootstrap.py // 安装审计钩子和导入白名单后执行 main.py
 * └── run-7c9e6679-7425-40de-944b-e07fc1f90ae7
 *
 * @defaultValue /tmp/exercise-grader
 */
extern std::filesystem::path SCRATCH_DIR;

/**
 * @brief Python 解释器的路径，需要 Python 3.8 以上（sys.addaudithook）
 * @defaultValue /usr/bin/python3
 */
extern std::filesystem::path PYTHON_EXECUTABLE;

/**
 * @brief 超过墙上时间限制后，沙箱最多再等待多久（毫秒）
 * 沙箱保证在 wall_clock_ms + GRACE_MARGIN_MS 之内返回
 */
extern int GRACE_MARGIN_MS;

/**
 * @brief 是否使用 cgroup (v1) 限制整个进程组的内存
 * 不使用时通过 RLIMIT_AS 限制单个进程的地址空间
 */
extern bool USE_CGROUP;

/**
 * @brief 沙箱创建的 cgroup 的父路径，每次运行在其下创建 run-<uuid>
 */
extern std::string CGROUP_ROOT;

/**
 * @brief 运行用户代码的用户 id 和组 id，-1 表示不切换
 * 只有以 root 运行评测引擎时才能切换用户。
 */
extern int RUN_USER_ID;
extern int RUN_GROUP_ID;

/**
 * @brief 是否为用户代码创建独立的网络命名空间
 * 即使创建失败，seccomp 过滤器依然会拒绝创建 socket
 */
extern bool ISOLATE_NETWORK;

/**
 * @brief 一道题所有测试点权重之和，也是满分
 */
extern int TOTAL_WEIGHT;

/**
 * @brief 连续多少个测试点出现内部错误后中止评测
 */
extern int MAX_CONSECUTIVE_INTERNAL_ERRORS;

}  // namespace grader
