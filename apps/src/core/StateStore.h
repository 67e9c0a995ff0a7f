#pragma once

#include <functional>
#include <mutex>
#include <utility>

namespace NixBlitz {

/**
 * @brief The single authoritative state value of an engine.
 *
 * The lock covers in-memory mutation only. Callers must not do I/O or wait on a
 * subprocess inside any of the callbacks; the only thing allowed under the lock besides
 * the mutation itself is the non-blocking publish of the matching StateChanged event, which
 * keeps the order of stored states and published snapshots identical.
 */
template <typename StateT>
class StateStore {
public:
    using CommitFn = std::function<void(const StateT&)>;

    explicit StateStore(StateT initial) : state_(std::move(initial)) {}

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    // Snapshot copy.
    StateT read() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    // Runs fn against the current value while holding the lock.
    template <typename Fn>
    auto read(Fn&& fn) const -> decltype(fn(std::declval<const StateT&>()))
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(static_cast<const StateT&>(state_));
    }

    void replace(StateT newState, const CommitFn& onCommit = {})
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = std::move(newState);
        if (onCommit) {
            onCommit(state_);
        }
    }

    /**
     * @brief Conditional in-place mutation.
     *
     * fn receives the current value and returns true if it changed it; onCommit only runs
     * for changes. Returns what fn returned.
     */
    template <typename Fn>
    bool update(Fn&& fn, const CommitFn& onCommit = {})
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool changed = fn(state_);
        if (changed && onCommit) {
            onCommit(state_);
        }
        return changed;
    }

private:
    mutable std::mutex mutex_;
    StateT state_;
};

} // namespace NixBlitz
