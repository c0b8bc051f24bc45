#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace sandbox {
using namespace std;

const char *to_string(error_kind kind) {
    switch (kind) {
        case error_kind::VALIDATION:
            return "validation";
        case error_kind::UNAVAILABLE:
            return "unavailable";
        case error_kind::EXECUTION_FAILURE:
            return "execution_failure";
    }
    return "execution_failure";
}

int http_status(error_kind kind) {
    switch (kind) {
        case error_kind::VALIDATION:
            return 400;
        case error_kind::UNAVAILABLE:
            return 503;
        case error_kind::EXECUTION_FAILURE:
            return 500;
    }
    return 500;
}

sandbox_exception::sandbox_exception()
    : sandbox_exception("") {}

sandbox_exception::sandbox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *sandbox_exception::what() const noexcept {
    return message.c_str();
}

error_kind sandbox_exception::kind() const {
    return error_kind::EXECUTION_FAILURE;
}

std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex) {
    os << boost::diagnostic_information(ex) << endl
       << *ex.stacktrace;
    return os;
}

validation_error::validation_error()
    : sandbox_exception() {}

validation_error::validation_error(const string &message)
    : sandbox_exception(message) {}

error_kind validation_error::kind() const {
    return error_kind::VALIDATION;
}

runner_unavailable::runner_unavailable()
    : sandbox_exception() {}

runner_unavailable::runner_unavailable(const string &message)
    : sandbox_exception(message) {}

error_kind runner_unavailable::kind() const {
    return error_kind::UNAVAILABLE;
}

runner_error::runner_error()
    : sandbox_exception() {}

runner_error::runner_error(const string &message)
    : sandbox_exception(message) {}

error_kind runner_error::kind() const {
    return error_kind::EXECUTION_FAILURE;
}

network_error::network_error()
    : sandbox_exception() {}

network_error::network_error(const string &message)
    : sandbox_exception(message) {}

// 传输层失败说明引擎不可达
error_kind network_error::kind() const {
    return error_kind::UNAVAILABLE;
}

engine_error::engine_error(long status, const string &message)
    : sandbox_exception(message), status(status) {}

error_kind engine_error::kind() const {
    return error_kind::EXECUTION_FAILURE;
}

}  // namespace sandbox
