#pragma once
#include <cstddef>
#include <deque>
#include <functional>
#include <limits>
#include <mutex>

namespace wxdown::core::net {
// Deferred work for one owning thread, which drains it with poll().
class IoContext {
public:
    using Task = std::function<void()>;

    // Refused (returns false) once stop() has been called.
    bool post(Task task);
    // Runs up to max_tasks queued tasks in FIFO order; returns how many ran.
    std::size_t poll(std::size_t max_tasks = std::numeric_limits<std::size_t>::max());
    // Refuses new work and drops what is still queued; returns the number dropped.
    std::size_t stop();
    bool stopped() const;
    std::size_t pending() const;

private:
    mutable std::mutex guard;
    std::deque<Task> tasks;
    bool closed{false};
};
}
