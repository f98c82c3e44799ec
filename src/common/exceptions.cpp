#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace runbox {
using namespace std;

engine_exception::engine_exception()
    : engine_exception("") {}

engine_exception::engine_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *engine_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const engine_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : engine_exception() {}

internal_error::internal_error(const string &message)
    : engine_exception(message) {}

validation_error::validation_error(const string &message)
    : engine_exception(message) {}

unsupported_language::unsupported_language(const string &language)
    : engine_exception("Unsupported language: " + language), language(language) {}

queue_full::queue_full(const string &message)
    : engine_exception(message) {}

spawn_error::spawn_error(const string &message)
    : engine_exception(message) {}

}  // namespace runbox
