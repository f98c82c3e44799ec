#include "workspace/cleanup_scheduler.hpp"
#include <glog/logging.h>
#include <vector>

namespace runbox {
using namespace std;

cleanup_scheduler::cleanup_scheduler() {
    worker = thread([this] { loop(); });
}

cleanup_scheduler::~cleanup_scheduler() {
    {
        scoped_lock guard(mut);
        stopping = true;
    }
    cond.notify_all();
    worker.join();
    flush();
}

cleanup_scheduler::token cleanup_scheduler::schedule(const string &name, chrono::milliseconds delay, function<void()> action) {
    token id;
    {
        scoped_lock guard(mut);
        id = next_token++;
        tasks.emplace(clock::now() + delay, task{id, name, move(action)});
    }
    cond.notify_all();
    return id;
}

bool cleanup_scheduler::cancel(token id) {
    scoped_lock guard(mut);
    for (auto it = tasks.begin(); it != tasks.end(); ++it) {
        if (it->second.id == id) {
            LOG(INFO) << "Cancelled cleanup task " << it->second.name;
            tasks.erase(it);
            return true;
        }
    }
    return false;
}

void cleanup_scheduler::flush() {
    vector<task> due;
    {
        unique_lock lock(mut);
        for (auto &[time, t] : tasks) due.push_back(move(t));
        tasks.clear();
        running += due.size();
    }

    for (auto &t : due) run(t);

    unique_lock lock(mut);
    running -= due.size();
    idle_cond.notify_all();
    idle_cond.wait(lock, [this] { return running == 0; });
}

size_t cleanup_scheduler::pending() const {
    scoped_lock guard(mut);
    return tasks.size();
}

void cleanup_scheduler::run(task &t) {
    try {
        t.action();
    } catch (std::exception &ex) {
        LOG(ERROR) << "Cleanup task " << t.name << " failed: " << ex.what();
    }
}

void cleanup_scheduler::loop() {
    unique_lock lock(mut);
    while (!stopping) {
        if (tasks.empty()) {
            cond.wait(lock);
            continue;
        }

        auto due_time = tasks.begin()->first;
        if (clock::now() < due_time) {
            // 被 schedule 唤醒时，新任务可能比当前队首更早到期，因此需要重新检查
            cond.wait_until(lock, due_time);
            continue;
        }

        task t = move(tasks.begin()->second);
        tasks.erase(tasks.begin());
        ++running;
        lock.unlock();
        run(t);
        lock.lock();
        --running;
        idle_cond.notify_all();
    }
}

}  // namespace runbox
