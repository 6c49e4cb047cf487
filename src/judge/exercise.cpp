#include "judge/exercise.hpp"
#include <fmt/core.h>
#include <set>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "config.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

static test_case_mode parse_mode(const string &mode) {
    if (mode == "stdin") return test_case_mode::STDIN;
    if (mode == "function_call") return test_case_mode::FUNCTION_CALL;
    throw configuration_error(fmt::format("unknown test case mode '{}'", mode));
}

static const char *get_mode_name(test_case_mode mode) {
    return mode == test_case_mode::FUNCTION_CALL ? "function_call" : "stdin";
}

exercise exercise::from_json(const json &j) {
    exercise ex;
    try {
        ex.id = get_value<string>(j, "id");
        ex.source_template = get_value_def<string>(j, "", "source_template");
        ex.comparator = parse_comparator_kind(get_value_def<string>(j, "exact", "comparator"));
        ex.numeric_tolerance = get_value_def<double>(j, 1e-6, "numeric_tolerance");
        if (exists(j, "limits"))
            ex.limits = j.at("limits").get<limit_policy>();

        const json &cases = access(j, "test_cases");
        if (!cases.is_array())
            throw configuration_error(fmt::format("exercise {}: test_cases must be an array", ex.id));
        for (auto &item : cases) {
            test_case kase;
            kase.id = get_value<string>(item, "id");
            kase.name = get_value_def<string>(item, kase.id, "name");
            kase.mode = parse_mode(get_value_def<string>(item, "stdin", "mode"));
            kase.input = get_value_def<string>(item, "", "input");
            kase.expected_output = get_value<string>(item, "expected_output");
            kase.weight = get_value<int>(item, "weight");
            kase.is_hidden = get_value_def<bool>(item, false, "hidden");
            ex.test_cases.push_back(move(kase));
        }
    } catch (invalid_argument &e) {
        throw configuration_error(e.what());
    } catch (json::exception &e) {
        throw configuration_error(e.what());
    }

    validate_exercise(ex);
    return ex;
}

void validate_exercise(const exercise &ex) {
    if (ex.id.empty())
        throw configuration_error("exercise id must not be empty");
    if (ex.test_cases.empty())
        throw configuration_error(fmt::format("exercise {} has no test cases", ex.id));
    if (!(ex.numeric_tolerance >= 0))
        throw configuration_error(fmt::format("exercise {}: numeric_tolerance must be non-negative", ex.id));

    validate_limit_policy(ex.limits);

    set<string> ids;
    int64_t total = 0;
    for (auto &kase : ex.test_cases) {
        if (kase.id.empty())
            throw configuration_error(fmt::format("exercise {}: test case id must not be empty", ex.id));
        if (!ids.insert(kase.id).second)
            throw configuration_error(fmt::format("exercise {}: duplicate test case id {}", ex.id, kase.id));
        if (kase.weight < 0)
            throw configuration_error(fmt::format("exercise {}: test case {} has negative weight {}", ex.id, kase.id, kase.weight));
        if (kase.weight > TOTAL_WEIGHT)
            throw configuration_error(fmt::format("exercise {}: test case {} has weight {} above total {}", ex.id, kase.id, kase.weight, TOTAL_WEIGHT));
        if (ex.comparator == comparator_kind::STRUCTURED &&
            json::parse(kase.expected_output, nullptr, false).is_discarded())
            throw configuration_error(fmt::format("exercise {}: expected output of test case {} is not valid JSON", ex.id, kase.id));
        total += kase.weight;
    }

    if (total != TOTAL_WEIGHT)
        throw configuration_error(fmt::format("exercise {}: test case weights sum to {}, expected {}", ex.id, total, TOTAL_WEIGHT));
}

string assemble_program(const test_case &kase, const string &code) {
    if (kase.mode != test_case_mode::FUNCTION_CALL)
        return code;

    string program = code;
    if (!program.empty() && program.back() != '\n')
        program += '\n';
    program += "\n" + kase.input;
    if (program.back() != '\n')
        program += '\n';
    return program;
}

string program_input(const test_case &kase) {
    return kase.mode == test_case_mode::STDIN ? kase.input : "";
}

void to_json(json &j, const exercise &ex) {
    json cases = json::array();
    for (auto &kase : ex.test_cases) {
        cases.push_back({{"id", kase.id},
                         {"name", kase.name},
                         {"mode", get_mode_name(kase.mode)},
                         {"input", kase.input},
                         {"expected_output", kase.expected_output},
                         {"weight", kase.weight},
                         {"hidden", kase.is_hidden}});
    }
    j = {{"id", ex.id},
         {"source_template", ex.source_template},
         {"comparator", get_comparator_name(ex.comparator)},
         {"numeric_tolerance", ex.numeric_tolerance},
         {"limits", ex.limits},
         {"test_cases", cases}};
}

}  // namespace grader
