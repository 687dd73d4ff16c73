// =================================================================
// include/Quorum/CancellationToken.hpp
// =================================================================
// Shared cancellation flag with interruptible waits.

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

namespace Quorum {

/**
 * @brief Cooperative cancellation handle
 *
 * Copies share the same state, so a token handed to worker tasks is
 * cancelled for all of them at once. Sleeps taken through waitFor() wake
 * up as soon as the token is cancelled.
 */
class CancellationToken {
public:
    CancellationToken();

    /**
     * @brief Cancel every holder of this token
     */
    void cancel();

    /**
     * @brief Check whether cancel() was called
     */
    bool isCancelled() const;

    /**
     * @brief Sleep for up to the given duration
     * @param duration Maximum time to wait
     * @return True if the token was cancelled before or during the wait
     */
    bool waitFor(std::chrono::milliseconds duration) const;

    /**
     * @brief Throw CancelledError if the token is cancelled
     * @param operation Name of the interrupted operation, used in the message
     */
    void throwIfCancelled(const std::string& operation) const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool cancelled = false;
    };

    std::shared_ptr<State> m_state;
};

} // namespace Quorum
