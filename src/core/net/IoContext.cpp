#include "wxdown/core/net/IoContext.h"

namespace wxdown::core::net {
bool IoContext::post(Task task) {
    if (!task) return false;
    std::lock_guard lock(guard);
    if (closed) return false;
    tasks.push_back(std::move(task));
    return true;
}

std::size_t IoContext::poll(std::size_t max_tasks) {
    std::size_t ran = 0;
    while (ran < max_tasks) {
        Task task;
        {
            std::lock_guard lock(guard);
            if (tasks.empty()) break;
            task = std::move(tasks.front());
            tasks.pop_front();
        }
        task();
        ++ran;
    }
    return ran;
}

std::size_t IoContext::stop() {
    std::deque<Task> dropped;
    {
        std::lock_guard lock(guard);
        closed = true;
        dropped.swap(tasks);
    }
    return dropped.size();
}

bool IoContext::stopped() const {
    std::lock_guard lock(guard);
    return closed;
}

std::size_t IoContext::pending() const {
    std::lock_guard lock(guard);
    return tasks.size();
}
}
