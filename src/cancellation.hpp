#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace PakForge {

namespace detail {
struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::shared_ptr<CancellationState> parent;
};
} // namespace detail

// Read side of a cooperative cancellation flag. A default constructed token
// is never cancelled. A token created from a linked source also reports
// cancellation when any of its ancestors is cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancelled() const {
        for (auto* s = m_state.get(); s; s = s->parent.get()) {
            if (s->cancelled.load()) return true;
        }
        return false;
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : m_state(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> m_state;
};

class CancellationSource {
public:
    CancellationSource() : m_state(std::make_shared<detail::CancellationState>()) {}

    // New source that is also cancelled whenever `parent` is
    static CancellationSource linkedTo(const CancellationToken& parent) {
        CancellationSource source;
        source.m_state->parent = parent.m_state;
        return source;
    }

    void cancel() { m_state->cancelled.store(true); }
    bool isCancelled() const { return token().isCancelled(); }
    CancellationToken token() const { return CancellationToken(m_state); }

private:
    std::shared_ptr<detail::CancellationState> m_state;
};

// Fixed point in time after which a bounded wait gives up
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    explicit Deadline(std::chrono::milliseconds timeout) : m_at(Clock::now() + timeout) {}

    bool expired() const { return Clock::now() >= m_at; }

    std::chrono::milliseconds remaining() const {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(m_at - Clock::now());
        return std::max(left, std::chrono::milliseconds(0));
    }

private:
    Clock::time_point m_at;
};

// Sleep for `duration` in short slices. Returns false as soon as the token
// is cancelled.
inline bool sleepFor(std::chrono::milliseconds duration, const CancellationToken& token) {
    const auto slice = std::chrono::milliseconds(25);
    auto end = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < end) {
        if (token.isCancelled()) return false;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            end - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(slice, std::max(left, std::chrono::milliseconds(1))));
    }
    return !token.isCancelled();
}

} // namespace PakForge
