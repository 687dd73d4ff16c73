// =================================================================
// src/Quorum/CancellationToken.cpp
// =================================================================

#include "Quorum/CancellationToken.hpp"
#include "Quorum/Errors.hpp"

namespace Quorum {

CancellationToken::CancellationToken() : m_state(std::make_shared<State>()) {}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        m_state->cancelled = true;
    }
    m_state->cv.notify_all();
}

bool CancellationToken::isCancelled() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->cancelled;
}

bool CancellationToken::waitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(m_state->mutex);
    if (duration.count() <= 0) {
        return m_state->cancelled;
    }
    return m_state->cv.wait_for(lock, duration, [this] { return m_state->cancelled; });
}

void CancellationToken::throwIfCancelled(const std::string& operation) const {
    if (isCancelled()) {
        throw CancelledError("Operation cancelled: " + operation);
    }
}

} // namespace Quorum
