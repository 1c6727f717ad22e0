#include "common/exceptions.hpp"

namespace grader {
using namespace std;

grader_exception::grader_exception() {}

grader_exception::grader_exception(const string &message) : message(message) {}

const char *grader_exception::what() const noexcept {
    return message.c_str();
}

compilation_error::compilation_error(const string &what, const string &error_log)
    : grader_exception(what), error_log(error_log) {}

harness_abort::harness_abort(const string &what, int test_index, bool recoverable)
    : grader_exception(what), test_index(test_index), recoverable(recoverable) {}

}  // namespace grader
