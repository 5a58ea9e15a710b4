#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * Pause/cancel flags shared between the control thread (writer) and the
 * session worker (reader). The worker checks them at every suspension point:
 * after each body chunk, before each listing entry, and while sleeping
 * before a retry.
 *
 * Cancel is sticky until reset(); pause toggles freely.
 */
class ControlState
{
public:
    void pause();
    void resume();
    void cancel();

    /** Clear both flags before a new run. */
    void reset();

    bool isPaused() const { return paused_.load(); }
    bool isCanceled() const { return canceled_.load(); }

    /**
     * Block while paused.
     * @return false if the run was canceled (before or while waiting)
     */
    bool waitWhilePaused();

    /**
     * Sleep for delay, waking early on cancel.
     * @return false if the run was canceled
     */
    bool sleepFor(std::chrono::milliseconds delay);

private:
    std::atomic<bool> paused_{false};
    std::atomic<bool> canceled_{false};

    // Only used to wake sleepers promptly; the flags themselves are atomic
    std::mutex mutex_;
    std::condition_variable changed_;
};
