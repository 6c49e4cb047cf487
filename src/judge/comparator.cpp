#include "judge/comparator.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <vector>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

static const size_t MAX_EXCERPT = 80;

static string excerpt(const string &text) {
    if (text.size() <= MAX_EXCERPT) return text;
    return text.substr(0, MAX_EXCERPT) + "...";
}

static string strip_trailing_newline(const string &text) {
    if (!text.empty() && text.back() == '\n')
        return text.substr(0, text.size() - 1);
    return text;
}

static vector<string> split_lines(const string &text) {
    vector<string> lines;
    boost::algorithm::split(lines, text, boost::algorithm::is_any_of("\n"));
    return lines;
}

static vector<string> split_tokens(const string &text) {
    vector<string> tokens;
    string trimmed = boost::algorithm::trim_copy(text);
    if (trimmed.empty()) return tokens;
    boost::algorithm::split(tokens, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
    return tokens;
}

/**
 * @brief 找到第一处不同的行
 */
static string describe_line_difference(const string &expected, const string &actual) {
    vector<string> expected_lines = split_lines(expected), actual_lines = split_lines(actual);
    size_t common = min(expected_lines.size(), actual_lines.size());
    for (size_t i = 0; i < common; ++i) {
        if (expected_lines[i] != actual_lines[i])
            return fmt::format("line {}: expected \"{}\", got \"{}\"", i + 1,
                               excerpt(expected_lines[i]), excerpt(actual_lines[i]));
    }
    return fmt::format("expected {} lines, got {}", expected_lines.size(), actual_lines.size());
}

static comparison compare_exact(const string &expected, const string &actual) {
    string lhs = strip_trailing_newline(expected), rhs = strip_trailing_newline(actual);
    if (lhs == rhs) return {true, ""};
    return {false, describe_line_difference(lhs, rhs)};
}

string normalize_whitespace(const string &text) {
    return boost::algorithm::join(split_tokens(text), " ");
}

static comparison compare_whitespace(const string &expected, const string &actual) {
    vector<string> lhs = split_tokens(expected), rhs = split_tokens(actual);
    if (lhs == rhs) return {true, ""};
    size_t common = min(lhs.size(), rhs.size());
    for (size_t i = 0; i < common; ++i) {
        if (lhs[i] != rhs[i])
            return {false, fmt::format("token {}: expected \"{}\", got \"{}\"", i + 1, excerpt(lhs[i]), excerpt(rhs[i]))};
    }
    return {false, fmt::format("expected {} tokens, got {}", lhs.size(), rhs.size())};
}

static bool parse_number(const string &token, double &value) {
    try {
        value = boost::lexical_cast<double>(token);
        return true;
    } catch (boost::bad_lexical_cast &) {
        return false;
    }
}

static bool within_tolerance(double expected, double actual, double tolerance) {
    if (std::isnan(expected) || std::isnan(actual))
        return std::isnan(expected) && std::isnan(actual);
    if (expected == actual) return true;  // 同号的无穷大
    double diff = fabs(expected - actual);
    return diff <= tolerance * max(fabs(expected), fabs(actual)) || diff <= tolerance;
}

static comparison compare_numeric(const string &expected, const string &actual, double tolerance) {
    vector<string> lhs = split_tokens(expected), rhs = split_tokens(actual);
    if (lhs.size() != rhs.size())
        return {false, fmt::format("expected {} numbers, got {}", lhs.size(), rhs.size())};

    for (size_t i = 0; i < lhs.size(); ++i) {
        double a, b;
        if (!parse_number(lhs[i], a))
            return {false, fmt::format("token {}: expected output \"{}\" is not a number", i + 1, excerpt(lhs[i]))};
        if (!parse_number(rhs[i], b))
            return {false, fmt::format("token {}: \"{}\" is not a number", i + 1, excerpt(rhs[i]))};
        if (!within_tolerance(a, b, tolerance))
            return {false, fmt::format("token {}: expected {}, got {}", i + 1, excerpt(lhs[i]), excerpt(rhs[i]))};
    }
    return {true, ""};
}

static comparison compare_structured(const string &expected, const string &actual) {
    json lhs = json::parse(expected, nullptr, false);
    if (lhs.is_discarded())
        return {false, "expected output is not valid JSON"};
    json rhs = json::parse(actual, nullptr, false);
    if (rhs.is_discarded())
        return {false, "output is not valid JSON"};
    if (lhs == rhs) return {true, ""};

    json patch = json::diff(lhs, rhs);
    if (patch.empty() || !patch[0].count("path"))
        return {false, "values differ"};
    string path = patch[0]["path"].get<string>();
    return {false, fmt::format("first difference at \"{}\"", path.empty() ? "/" : path)};
}

comparison compare_output(comparator_kind kind, const string &expected, const string &actual, double tolerance) {
    switch (kind) {
        case comparator_kind::EXACT_TEXT:
            return compare_exact(expected, actual);
        case comparator_kind::WHITESPACE_NORMALIZED:
            return compare_whitespace(expected, actual);
        case comparator_kind::NUMERIC_TOLERANCE:
            return compare_numeric(expected, actual, tolerance);
        case comparator_kind::STRUCTURED:
            return compare_structured(expected, actual);
    }
    throw invalid_argument("unknown comparator kind");
}

comparator_kind parse_comparator_kind(const string &name) {
    if (name == "exact") return comparator_kind::EXACT_TEXT;
    if (name == "whitespace") return comparator_kind::WHITESPACE_NORMALIZED;
    if (name == "numeric") return comparator_kind::NUMERIC_TOLERANCE;
    if (name == "json") return comparator_kind::STRUCTURED;
    throw configuration_error(fmt::format("unknown comparator '{}'", name));
}

const char *get_comparator_name(comparator_kind kind) {
    switch (kind) {
        case comparator_kind::EXACT_TEXT: return "exact";
        case comparator_kind::WHITESPACE_NORMALIZED: return "whitespace";
        case comparator_kind::NUMERIC_TOLERANCE: return "numeric";
        case comparator_kind::STRUCTURED: return "json";
    }
    return "exact";
}

}  // namespace grader
