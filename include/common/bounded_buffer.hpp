#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace runbox {

/**
 * @brief 有容量上限的输出缓冲区
 * 超过上限的数据被丢弃并记录截断标志，写入方不会因此阻塞。
 */
class bounded_buffer {
public:
    explicit bounded_buffer(std::size_t capacity) : capacity(capacity) {}

    /**
     * @brief 追加数据，超出容量的部分被丢弃
     * @return 实际保存的字节数
     */
    std::size_t append(const char *data, std::size_t size) {
        std::size_t room = capacity > content.size() ? capacity - content.size() : 0;
        std::size_t taken = size < room ? size : room;
        content.append(data, taken);
        if (taken < size) truncated_flag = true;
        return taken;
    }

    std::size_t append(const std::string &data) {
        return append(data.data(), data.size());
    }

    bool truncated() const {
        return truncated_flag;
    }

    const std::string &str() const {
        return content;
    }

    std::string release() {
        return std::move(content);
    }

private:
    std::size_t capacity;
    std::string content;
    bool truncated_flag = false;
};

}  // namespace runbox
