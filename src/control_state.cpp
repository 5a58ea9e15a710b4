#include "control_state.hpp"

void ControlState::pause()
{
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = true;
    changed_.notify_all();
}

void ControlState::resume()
{
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = false;
    changed_.notify_all();
}

void ControlState::cancel()
{
    std::lock_guard<std::mutex> lock(mutex_);
    canceled_ = true;
    changed_.notify_all();
}

void ControlState::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    paused_ = false;
    canceled_ = false;
}

bool ControlState::waitWhilePaused()
{
    if (!paused_)
    {
        return !canceled_;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait(lock, [this] { return !paused_ || canceled_; });
    return !canceled_;
}

bool ControlState::sleepFor(std::chrono::milliseconds delay)
{
    std::unique_lock<std::mutex> lock(mutex_);
    changed_.wait_for(lock, delay, [this] { return canceled_.load(); });
    return !canceled_;
}
