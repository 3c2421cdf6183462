#include "server/intake.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string/predicate.hpp>
#include <algorithm>
#include <cctype>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"

namespace codejudge::server {
using namespace std;
using namespace nlohmann;

// 提交 id 的最大长度
const size_t MAX_ID_LENGTH = 128;

static bool is_valid_id(const string &sub_id) {
    return !sub_id.empty() && sub_id.length() <= MAX_ID_LENGTH &&
           all_of(sub_id.begin(), sub_id.end(), [](unsigned char c) { return isalnum(c) || c == '_' || c == '-'; });
}

static void check_size(const string &field, const string &value, size_t limit) {
    if (value.length() > limit)
        throw invalid_submission(field + " exceeds " + to_string(limit) + " bytes");
}

submission parse_submission(const json &payload) {
    if (!payload.is_object())
        throw invalid_submission("submission should be a JSON object");

    submission submit;
    try {
        if (exists(payload, "submissionId")) {
            submit.sub_id = get_value<string>(payload, "submissionId");
            if (!is_valid_id(submit.sub_id))
                throw invalid_submission("submissionId should consist of at most " + to_string(MAX_ID_LENGTH) + " letters, digits, '_' or '-'");
        } else {
            submit.sub_id = generate_uuid();
        }

        submit.lang = parse_language(get_value<string>(payload, "language"));

        submit.source_code = get_value<string>(payload, "sourceCode");
        if (submit.source_code.empty())
            throw invalid_submission("sourceCode should not be empty");
        check_size("sourceCode", submit.source_code, MAX_SOURCE_SIZE);

        submit.input = get_value_def<string>(payload, "", "input");
        check_size("input", submit.input, MAX_DATA_SIZE);

        submit.expected_output = get_value<string>(payload, "expectedOutput");
        // 沙箱只保存用户程序 stdout 的前 OUTPUT_LIMIT 字节（加上少量余量），更长的期望输出无法比较
        check_size("expectedOutput", submit.expected_output, OUTPUT_LIMIT);

        submit.callback_url = get_value_def<string>(payload, "", "callbackUrl");
        if (!submit.callback_url.empty() &&
            !boost::algorithm::starts_with(submit.callback_url, "http://") &&
            !boost::algorithm::starts_with(submit.callback_url, "https://"))
            throw invalid_submission("callbackUrl should be an http or https URL");

        submit.limits.time_limit = get_value_def<double>(payload, DEFAULT_TIME_LIMIT, "timeLimit");
        if (!(submit.limits.time_limit > 0) || submit.limits.time_limit > MAX_TIME_LIMIT)
            throw invalid_submission("timeLimit should be in (0, " + to_string(MAX_TIME_LIMIT) + "] seconds");

        submit.limits.memory_limit = get_value_def<int64_t>(payload, DEFAULT_MEMORY_LIMIT, "memoryLimit");
        if (submit.limits.memory_limit <= 0 || submit.limits.memory_limit > MAX_MEMORY_LIMIT)
            throw invalid_submission("memoryLimit should be in (0, " + to_string(MAX_MEMORY_LIMIT) + "] KB");
    } catch (invalid_argument &e) {
        throw invalid_submission(e.what());
    }
    return submit;
}

intake::intake(state_store &store, message_queue &submission_queue)
    : store(store), queue(submission_queue) {}

intake_ack intake::accept(const json &payload) {
    submission submit = parse_submission(payload);
    submit.created_at = time(nullptr);

    submission_record record;
    record.sub_id = submit.sub_id;
    record.status = submission_status::QUEUED;
    record.language = get_language_tag(submit.lang);
    record.callback_url = submit.callback_url;
    record.created_at = submit.created_at;
    if (!store.create(record))
        throw duplicate_submission(submit.sub_id);

    string token = queue.enqueue(submit);
    LOG(INFO) << "Accepted submission " << submit.sub_id << " (" << record.language << "), message " << token;
    return {submit.sub_id, token};
}

}  // namespace codejudge::server
