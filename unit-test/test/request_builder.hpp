#pragma once

#include <chrono>
#include <string>
#include "common/messages.hpp"

namespace runbox {

/**
 * @brief 构造测试用的执行请求
 * 用法：execution_request req = request_builder("python", "print(1)").input("x").timeout(2000);
 */
class request_builder {
public:
    request_builder(const std::string &language, const std::string &source);

    request_builder &id(const std::string &id);
    request_builder &input(const std::string &input);
    request_builder &filename(const std::string &filename);
    request_builder &timeout(long long milliseconds);
    request_builder &max_output(std::size_t bytes);

    operator execution_request() const;

private:
    execution_request request;
};

}  // namespace runbox
