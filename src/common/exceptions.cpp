#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace codejudge {
using namespace std;

judge_exception::judge_exception()
    : judge_exception("") {}

judge_exception::judge_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *judge_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const judge_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : judge_exception() {}

internal_error::internal_error(const string &message)
    : judge_exception(message) {}

network_error::network_error()
    : judge_exception() {}

network_error::network_error(const string &message)
    : judge_exception(message) {}

store_error::store_error()
    : judge_exception() {}

store_error::store_error(const string &message)
    : judge_exception(message) {}

queue_error::queue_error()
    : judge_exception() {}

queue_error::queue_error(const string &message)
    : judge_exception(message) {}

invalid_submission::invalid_submission()
    : judge_exception() {}

invalid_submission::invalid_submission(const string &message)
    : judge_exception(message) {}

duplicate_submission::duplicate_submission(const string &sub_id)
    : invalid_submission("submission " + sub_id + " already exists") {}

}  // namespace codejudge
