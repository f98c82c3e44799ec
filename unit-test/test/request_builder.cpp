#include "test/request_builder.hpp"

namespace runbox {
using namespace std;

request_builder::request_builder(const string &language, const string &source) {
    request.language = language;
    request.source_code = source;
}

request_builder &request_builder::id(const string &id) {
    request.id = id;
    return *this;
}

request_builder &request_builder::input(const string &input) {
    request.input = input;
    return *this;
}

request_builder &request_builder::filename(const string &filename) {
    request.filename = filename;
    return *this;
}

request_builder &request_builder::timeout(long long milliseconds) {
    request.timeout = chrono::milliseconds(milliseconds);
    return *this;
}

request_builder &request_builder::max_output(size_t bytes) {
    request.max_output_bytes = bytes;
    return *this;
}

request_builder::operator execution_request() const {
    return request;
}

}  // namespace runbox
