#include "server/state_store.hpp"
#include <glog/logging.h>
#include <stdexcept>
#include "common/json_utils.hpp"

namespace codejudge::server {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const submission_record &record) {
    j = {{"submissionId", record.sub_id},
         {"status", record.status},
         {"language", record.language},
         {"callbackUrl", record.callback_url},
         {"output", record.output},
         {"createdAt", record.created_at},
         {"startedAt", record.started_at},
         {"finishedAt", record.finished_at}};
    if (record.result) j["verdict"] = *record.result;
    if (record.run_time >= 0) j["time"] = record.run_time;
    if (record.memory >= 0) j["memory"] = record.memory;
}

void from_json(const json &j, submission_record &record) {
    j.at("submissionId").get_to(record.sub_id);
    j.at("status").get_to(record.status);
    if (exists(j, "verdict"))
        record.result = j.at("verdict").get<verdict>();
    else
        record.result.reset();
    record.language = get_value_def<string>(j, "", "language");
    record.callback_url = get_value_def<string>(j, "", "callbackUrl");
    record.output = get_value_def<string>(j, "", "output");
    record.run_time = get_value_def<double>(j, -1, "time");
    record.memory = get_value_def<int64_t>(j, -1, "memory");
    record.created_at = get_value_def<time_t>(j, 0, "createdAt");
    record.started_at = get_value_def<time_t>(j, 0, "startedAt");
    record.finished_at = get_value_def<time_t>(j, 0, "finishedAt");
}

state_store::~state_store() {}

void check_transition(submission_status from, submission_status to, const optional<completion> &done) {
    if (!is_valid_transition(from, to))
        throw invalid_argument(string("illegal transition from ") + get_wire_name(from) + " to " + get_wire_name(to));
    if (is_terminal(to) && !done)
        throw invalid_argument(string("transition to ") + get_wire_name(to) + " requires a verdict");
}

void apply_transition(submission_record &record, submission_status to, const optional<completion> &done, time_t now) {
    record.status = to;
    if (to == submission_status::RUNNING)
        record.started_at = now;
    if (is_terminal(to)) {
        record.finished_at = now;
        record.result = done->result;
        record.output = done->output;
        record.run_time = done->run_time;
        record.memory = done->memory;
    }
}

bool memory_state_store::create(const submission_record &record) {
    scoped_lock guard(mut);
    return records.emplace(record.sub_id, record).second;
}

bool memory_state_store::transition(const string &sub_id, submission_status from, submission_status to, const optional<completion> &done) {
    check_transition(from, to, done);
    scoped_lock guard(mut);
    auto it = records.find(sub_id);
    if (it == records.end() || it->second.status != from)
        return false;
    apply_transition(it->second, to, done, time(nullptr));
    return true;
}

optional<submission_record> memory_state_store::get(const string &sub_id) {
    scoped_lock guard(mut);
    auto it = records.find(sub_id);
    if (it == records.end()) return nullopt;
    return it->second;
}

}  // namespace codejudge::server
