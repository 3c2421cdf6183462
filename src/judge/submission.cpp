#include "judge/submission.hpp"
#include "common/json_utils.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const submission &submit) {
    j = {{"submissionId", submit.sub_id},
         {"language", submit.lang},
         {"sourceCode", submit.source_code},
         {"input", submit.input},
         {"expectedOutput", submit.expected_output},
         {"timeLimit", submit.limits.time_limit},
         {"memoryLimit", submit.limits.memory_limit},
         {"callbackUrl", submit.callback_url},
         {"createdAt", submit.created_at}};
}

void from_json(const json &j, submission &submit) {
    j.at("submissionId").get_to(submit.sub_id);
    j.at("language").get_to(submit.lang);
    j.at("sourceCode").get_to(submit.source_code);
    submit.input = get_value_def<string>(j, "", "input");
    j.at("expectedOutput").get_to(submit.expected_output);
    j.at("timeLimit").get_to(submit.limits.time_limit);
    j.at("memoryLimit").get_to(submit.limits.memory_limit);
    submit.callback_url = get_value_def<string>(j, "", "callbackUrl");
    submit.created_at = get_value_def<time_t>(j, 0, "createdAt");
}

const char *get_display_message(run_outcome outcome) {
    switch (outcome) {
        case run_outcome::COMPLETED: return "completed";
        case run_outcome::TIMED_OUT: return "timed-out";
        case run_outcome::MEMORY_EXCEEDED: return "memory-exceeded";
        case run_outcome::CRASHED: return "crashed";
        case run_outcome::COMPILE_ERROR: return "compile-error";
    }
    return "unknown";
}

void to_json(json &j, const judge_result &result) {
    j = {{"submissionId", result.sub_id},
         {"status", result.status},
         {"verdict", result.result},
         {"output", result.output},
         {"callbackUrl", result.callback_url}};
    if (result.run_time >= 0) j["time"] = result.run_time;
    if (result.memory >= 0) j["memory"] = result.memory;
}

void from_json(const json &j, judge_result &result) {
    j.at("submissionId").get_to(result.sub_id);
    j.at("status").get_to(result.status);
    j.at("verdict").get_to(result.result);
    result.output = get_value_def<string>(j, "", "output");
    result.callback_url = get_value_def<string>(j, "", "callbackUrl");
    result.run_time = get_value_def<double>(j, -1, "time");
    result.memory = get_value_def<int64_t>(j, -1, "memory");
}

}  // namespace codejudge
