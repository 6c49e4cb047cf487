#include "sandbox/limit_policy.hpp"
#include <fmt/core.h>
#include <regex>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

static const regex module_name_regex(R"([A-Za-z_][A-Za-z0-9_]*(\.[A-Za-z_][A-Za-z0-9_]*)*)");

void validate_limit_policy(const limit_policy &policy) {
    if (policy.cpu_time_ms <= 0)
        throw configuration_error(fmt::format("cpu_time_ms must be positive, got {}", policy.cpu_time_ms));
    if (policy.wall_clock_ms <= 0)
        throw configuration_error(fmt::format("wall_clock_ms must be positive, got {}", policy.wall_clock_ms));
    if (policy.memory_bytes <= 0)
        throw configuration_error(fmt::format("memory_bytes must be positive, got {}", policy.memory_bytes));
    if (policy.max_output_bytes <= 0)
        throw configuration_error(fmt::format("max_output_bytes must be positive, got {}", policy.max_output_bytes));
    if (policy.max_processes <= 0)
        throw configuration_error(fmt::format("max_processes must be positive, got {}", policy.max_processes));
    if (policy.max_file_bytes <= 0)
        throw configuration_error(fmt::format("max_file_bytes must be positive, got {}", policy.max_file_bytes));
    if (policy.wall_clock_ms < policy.cpu_time_ms)
        throw configuration_error(fmt::format("wall_clock_ms ({}) must not be less than cpu_time_ms ({})",
                                              policy.wall_clock_ms, policy.cpu_time_ms));
    for (auto &module : policy.allowed_modules)
        if (!regex_match(module, module_name_regex))
            throw configuration_error(fmt::format("invalid module name '{}'", module));
}

void from_json(const json &j, limit_policy &policy) {
    limit_policy def;
    policy.cpu_time_ms = get_value_def<int64_t>(j, def.cpu_time_ms, "cpu_time_ms");
    policy.wall_clock_ms = get_value_def<int64_t>(j, def.wall_clock_ms, "wall_clock_ms");
    policy.memory_bytes = get_value_def<int64_t>(j, def.memory_bytes, "memory_bytes");
    policy.max_output_bytes = get_value_def<int64_t>(j, def.max_output_bytes, "max_output_bytes");
    policy.allowed_modules = get_value_def<vector<string>>(j, {}, "allowed_modules");
    policy.max_processes = get_value_def<int>(j, def.max_processes, "max_processes");
    policy.max_file_bytes = get_value_def<int64_t>(j, def.max_file_bytes, "max_file_bytes");
}

void to_json(json &j, const limit_policy &policy) {
    j = {{"cpu_time_ms", policy.cpu_time_ms},
         {"wall_clock_ms", policy.wall_clock_ms},
         {"memory_bytes", policy.memory_bytes},
         {"max_output_bytes", policy.max_output_bytes},
         {"allowed_modules", policy.allowed_modules},
         {"max_processes", policy.max_processes},
         {"max_file_bytes", policy.max_file_bytes}};
}

}  // namespace grader
