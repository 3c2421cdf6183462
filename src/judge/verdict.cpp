#include "judge/verdict.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace codejudge {
using namespace std;

compare_policy DEFAULT_COMPARE_POLICY = compare_policy::IGNORE_TRAILING_NEWLINES;

// clang-format off
static const unordered_map<compare_policy, const char *> policy_names = boost::assign::map_list_of
    (compare_policy::EXACT, "exact")
    (compare_policy::IGNORE_TRAILING_NEWLINES, "ignore_trailing_newlines")
    (compare_policy::IGNORE_TRAILING_WHITESPACE, "ignore_trailing_whitespace")
    (compare_policy::IGNORE_SURROUNDING_WHITESPACE, "ignore_surrounding_whitespace");
// clang-format on

compare_policy parse_compare_policy(const string &name) {
    for (auto &[policy, policy_name] : policy_names)
        if (name == policy_name) return policy;
    throw invalid_argument("unknown compare policy " + name);
}

const char *get_display_message(compare_policy policy) {
    return policy_names.at(policy);
}

static string strip_trailing_newlines(string text) {
    while (!text.empty() && text.back() == '\n') text.pop_back();
    return text;
}

static string strip_trailing_whitespace(const string &text) {
    string result;
    size_t begin = 0;
    while (begin <= text.length()) {
        size_t end = text.find('\n', begin);
        if (end == string::npos) end = text.length();
        size_t line_end = end;
        while (line_end > begin && (text[line_end - 1] == ' ' || text[line_end - 1] == '\t' || text[line_end - 1] == '\r'))
            --line_end;
        result.append(text, begin, line_end - begin);
        result += '\n';
        begin = end + 1;
    }
    return strip_trailing_newlines(move(result));
}

static string normalize(const string &text, compare_policy policy) {
    if (policy == compare_policy::EXACT) return text;
    string result = boost::algorithm::replace_all_copy(text, "\r\n", "\n");
    switch (policy) {
        case compare_policy::IGNORE_TRAILING_NEWLINES:
            return strip_trailing_newlines(move(result));
        case compare_policy::IGNORE_TRAILING_WHITESPACE:
            return strip_trailing_whitespace(result);
        case compare_policy::IGNORE_SURROUNDING_WHITESPACE:
            return boost::algorithm::trim_copy(result);
        default:
            throw invalid_argument("unknown compare policy");
    }
}

bool outputs_match(const string &expected, const string &actual, compare_policy policy) {
    return normalize(expected, policy) == normalize(actual, policy);
}

verdict evaluate(const execution_result &result, const string &expected_output, compare_policy policy) noexcept {
    try {
        switch (result.outcome) {
            case run_outcome::TIMED_OUT:
                return verdict::TIME_LIMIT_EXCEEDED;
            case run_outcome::MEMORY_EXCEEDED:
                return verdict::MEMORY_LIMIT_EXCEEDED;
            case run_outcome::CRASHED:
                return verdict::RUNTIME_ERROR;
            case run_outcome::COMPILE_ERROR:
                return verdict::COMPILATION_ERROR;
            case run_outcome::COMPLETED:
                // 被截断的输出比任何合法的期望输出都长
                if (result.output_truncated) return verdict::WRONG_ANSWER;
                return outputs_match(expected_output, result.output, policy) ? verdict::ACCEPTED : verdict::WRONG_ANSWER;
        }
        LOG(ERROR) << "Submission " << result.sub_id << " has unknown run outcome " << (int)result.outcome;
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to evaluate submission " << result.sub_id << ": " << ex.what();
    }
    return verdict::INTERNAL_ERROR;
}

verdict evaluate(const execution_result &result, const string &expected_output) noexcept {
    return evaluate(result, expected_output, DEFAULT_COMPARE_POLICY);
}

}  // namespace codejudge
