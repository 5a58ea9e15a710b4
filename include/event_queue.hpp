#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class EventType
{
    FileProgress,    // value: percent 0-100 of the file in flight
    OverallProgress, // value: percent 0-100 of the whole run
    Log,             // text: one log line
    TotalFileCount,  // value: files found by the counting pass
    TimeRemaining,   // text: human-readable estimate
    Completed,       // terminal
    Canceled,        // terminal
    Failed           // terminal, text: error description
};

/**
 * One notification pushed by the session worker to the UI boundary.
 */
struct Event
{
    EventType type = EventType::Log;
    int value = 0;
    std::string text;

    bool isTerminal() const
    {
        return type == EventType::Completed || type == EventType::Canceled || type == EventType::Failed;
    }

    static Event log(std::string line) { return {EventType::Log, 0, std::move(line)}; }
    static Event fileProgress(int percent) { return {EventType::FileProgress, percent, {}}; }
    static Event overallProgress(int percent) { return {EventType::OverallProgress, percent, {}}; }
    static Event totalFileCount(int count) { return {EventType::TotalFileCount, count, {}}; }
    static Event timeRemaining(std::string text) { return {EventType::TimeRemaining, 0, std::move(text)}; }
    static Event completed() { return {EventType::Completed, 0, {}}; }
    static Event canceled() { return {EventType::Canceled, 0, {}}; }
    static Event failed(std::string reason) { return {EventType::Failed, 0, std::move(reason)}; }
};

/**
 * Unbounded FIFO channel from the worker to the consumer.
 * Events come out in the order they were pushed.
 */
class EventQueue
{
public:
    void push(Event event);

    /** Pop the oldest event without blocking. */
    std::optional<Event> tryPop();

    /** Pop the oldest event, waiting up to timeout for one to arrive. */
    std::optional<Event> waitPop(std::chrono::milliseconds timeout);

    /** Remove and return everything queued so far. */
    std::vector<Event> drain();

    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::deque<Event> events_;
};
