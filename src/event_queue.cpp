#include "event_queue.hpp"

#include <iterator>
#include <utility>

void EventQueue::push(Event event)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }
    available_.notify_one();
}

std::optional<Event> EventQueue::tryPop()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty())
    {
        return std::nullopt;
    }
    Event event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<Event> EventQueue::waitPop(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (!available_.wait_for(lock, timeout, [this] { return !events_.empty(); }))
    {
        return std::nullopt;
    }
    Event event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::vector<Event> EventQueue::drain()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Event> result(std::make_move_iterator(events_.begin()),
                              std::make_move_iterator(events_.end()));
    events_.clear();
    return result;
}

bool EventQueue::empty() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.empty();
}
