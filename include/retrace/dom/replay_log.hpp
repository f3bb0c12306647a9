#pragma once
#include "browser.hpp"
#include "structure/transition.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <vector>

namespace retrace::dom {

    // Debug event types
    enum class ReplayDebugEvent { TRANSITION_RECORDED, TRANSITION_SKIPPED, TRANSITION_REPLAYED, REPLAY_FAILED };

    // Debug information structure
    struct ReplayDebugInfo {
        ReplayDebugEvent event;
        size_t index;
        std::string transition; // Transition::toString()
        std::chrono::steady_clock::time_point timestamp;
    };

    struct ReplayOutcome {
        bool restored = true;
        size_t replayed = 0;
        std::optional<size_t> failedAt;
        std::vector<TransitionPtr> produced; // Transitions returned by the browser, in order
    };

    // Ordered transitions that lead from a fresh page load to a given page state
    class ReplayLog {
      public:
        using const_iterator = std::vector<Transition>::const_iterator;

        ReplayLog() = default;
        // Copies take the transitions only; the debug callback stays with its owner
        ReplayLog(const ReplayLog &other) : transitions_(other.transitions_) {}
        ReplayLog &operator=(const ReplayLog &other) {
            transitions_ = other.transitions_;
            return *this;
        }
        ReplayLog(ReplayLog &&) = default;
        ReplayLog &operator=(ReplayLog &&) = default;

        // Stores a copy; the transition must have been started
        void push(const Transition &transition);
        void clear() { transitions_.clear(); }

        size_t size() const { return transitions_.size(); }
        bool empty() const { return transitions_.empty(); }
        const Transition &at(size_t index) const { return transitions_.at(index); }
        Transition &back();
        const_iterator begin() const { return transitions_.begin(); }
        const_iterator end() const { return transitions_.end(); }
        const std::vector<Transition> &transitions() const { return transitions_; }

        // Sum of the transitions' depths
        int depth() const;
        // True if at least one transition can be replayed
        bool replayable() const;

        // Replays every replayable transition in order, skipping the rest.
        // Stops at the first transition whose replay produces nothing.
        ReplayOutcome replay(Browser &browser) const;

        std::vector<TransitionRecord> toStructured() const;

        size_t hash() const;
        bool operator==(const ReplayLog &other) const { return transitions_ == other.transitions_; }
        bool operator!=(const ReplayLog &other) const { return !(*this == other); }

        // Debugging support
        using DebugCallback = std::function<void(const ReplayDebugInfo &)>;
        void setDebugCallback(DebugCallback callback) { debugCallback_ = std::move(callback); }
        void clearDebugCallback() { debugCallback_ = nullptr; }

      private:
        void notifyDebug(ReplayDebugEvent event, size_t index, const Transition &transition) const;

        std::vector<Transition> transitions_;
        DebugCallback debugCallback_;
    };

} // namespace retrace::dom

template <> struct std::hash<retrace::dom::ReplayLog> {
    size_t operator()(const retrace::dom::ReplayLog &log) const noexcept { return log.hash(); }
};
