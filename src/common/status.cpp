#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace codejudge {
using namespace std;

// clang-format off
static const unordered_map<verdict, const char *> verdict_string = boost::assign::map_list_of
    (verdict::ACCEPTED, "Accepted")
    (verdict::WRONG_ANSWER, "Wrong Answer")
    (verdict::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (verdict::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (verdict::RUNTIME_ERROR, "Runtime Error")
    (verdict::COMPILATION_ERROR, "Compilation Error")
    (verdict::INTERNAL_ERROR, "Internal Error");

static const unordered_map<verdict, const char *> verdict_wire = boost::assign::map_list_of
    (verdict::ACCEPTED, "AC")
    (verdict::WRONG_ANSWER, "WA")
    (verdict::TIME_LIMIT_EXCEEDED, "TLE")
    (verdict::MEMORY_LIMIT_EXCEEDED, "MLE")
    (verdict::RUNTIME_ERROR, "RE")
    (verdict::COMPILATION_ERROR, "CE")
    (verdict::INTERNAL_ERROR, "IE");

static const unordered_map<submission_status, const char *> status_string = boost::assign::map_list_of
    (submission_status::QUEUED, "Queued")
    (submission_status::RUNNING, "Running")
    (submission_status::COMPLETED, "Completed")
    (submission_status::FAILED, "Failed");

static const unordered_map<submission_status, const char *> status_wire = boost::assign::map_list_of
    (submission_status::QUEUED, "QUEUED")
    (submission_status::RUNNING, "RUNNING")
    (submission_status::COMPLETED, "COMPLETED")
    (submission_status::FAILED, "FAILED");
// clang-format on

const char *get_display_message(verdict value) {
    return verdict_string.at(value);
}

const char *get_display_message(submission_status value) {
    return status_string.at(value);
}

const char *get_wire_name(verdict value) {
    return verdict_wire.at(value);
}

const char *get_wire_name(submission_status value) {
    return status_wire.at(value);
}

verdict parse_verdict(const string &name) {
    for (auto &[value, wire] : verdict_wire)
        if (name == wire) return value;
    throw invalid_argument("unknown verdict " + name);
}

submission_status parse_submission_status(const string &name) {
    for (auto &[value, wire] : status_wire)
        if (name == wire) return value;
    throw invalid_argument("unknown submission status " + name);
}

bool is_terminal(submission_status status) {
    return status == submission_status::COMPLETED || status == submission_status::FAILED;
}

bool is_valid_transition(submission_status from, submission_status to) {
    switch (from) {
        case submission_status::QUEUED:
            return to == submission_status::RUNNING;
        case submission_status::RUNNING:
            return is_terminal(to);
        default:
            return false;
    }
}

void to_json(nlohmann::json &j, const verdict &value) {
    j = get_wire_name(value);
}

void from_json(const nlohmann::json &j, verdict &value) {
    value = parse_verdict(j.get<string>());
}

void to_json(nlohmann::json &j, const submission_status &value) {
    j = get_wire_name(value);
}

void from_json(const nlohmann::json &j, submission_status &value) {
    value = parse_submission_status(j.get<string>());
}

}  // namespace codejudge
