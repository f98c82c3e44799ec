#include "limiter/concurrency_limiter.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <stdexcept>
#include "common/exceptions.hpp"

namespace runbox {
using namespace std;

concurrency_slot::concurrency_slot() : owner(nullptr) {}

concurrency_slot::concurrency_slot(concurrency_limiter *owner) : owner(owner) {}

concurrency_slot::concurrency_slot(concurrency_slot &&other) noexcept : owner(other.owner) {
    other.owner = nullptr;
}

concurrency_slot &concurrency_slot::operator=(concurrency_slot &&other) noexcept {
    if (this != &other) {
        release();
        owner = other.owner;
        other.owner = nullptr;
    }
    return *this;
}

concurrency_slot::~concurrency_slot() {
    release();
}

void concurrency_slot::release() noexcept {
    if (!owner) return;
    owner->release();
    owner = nullptr;
}

bool concurrency_slot::valid() const {
    return owner != nullptr;
}

concurrency_limiter::concurrency_limiter(size_t max_concurrency, size_t max_queue_depth)
    : max_concurrency(max_concurrency), max_queue_depth(max_queue_depth) {
    if (max_concurrency == 0)
        throw invalid_argument("max_concurrency must be positive");
}

concurrency_slot concurrency_limiter::acquire() {
    unique_lock lock(mut);
    if (waiters.empty() && active_count < max_concurrency) {
        ++active_count;
        return concurrency_slot(this);
    }

    if (waiters.size() >= max_queue_depth)
        throw queue_full(fmt::format("execution queue is full ({} waiting, {} running)", waiters.size(), active_count));

    uint64_t ticket = next_ticket++;
    waiters.push_back(ticket);
    cond.wait(lock, [&] { return waiters.front() == ticket && active_count < max_concurrency; });
    waiters.pop_front();
    ++active_count;
    // 可能同时空出了多个槽位，唤醒下一个排队者检查
    cond.notify_all();
    return concurrency_slot(this);
}

void concurrency_limiter::release() noexcept {
    {
        scoped_lock guard(mut);
        if (active_count == 0) {
            LOG(ERROR) << "Concurrency slot released more times than acquired";
            return;
        }
        --active_count;
    }
    cond.notify_all();
}

size_t concurrency_limiter::active() const {
    scoped_lock guard(mut);
    return active_count;
}

size_t concurrency_limiter::queued() const {
    scoped_lock guard(mut);
    return waiters.size();
}

size_t concurrency_limiter::capacity() const {
    return max_concurrency;
}

}  // namespace runbox
