#pragma once
#include "error.hpp"
#include "event.hpp"
#include "options.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <tuple>
#include <unordered_set>

namespace retrace::dom {

    class Browser;

    // Target element and the event fired on it
    struct ElementEvent {
        std::string element;
        Event event;
    };

    enum class TransitionState { UNSTARTED, RUNNING, COMPLETED };

    // Structured export of a transition, for logging or inclusion in a replay log
    struct TransitionRecord {
        std::string element;
        Event event;
        Options options;
        std::optional<std::chrono::nanoseconds> elapsed;

        bool operator==(const TransitionRecord &other) const = default;
    };

    class Transition;
    using TransitionPtr = std::shared_ptr<Transition>;

    // One DOM event applied to one element: unstarted -> running -> completed.
    // Identity is {element, event, options}; elapsed time never takes part in
    // equality or hashing.
    class Transition {
      public:
        using Clock = std::chrono::steady_clock;
        using Duration = std::chrono::nanoseconds;
        using Work = std::function<void()>;
        using Mapping = std::map<std::string, Event>;

        Transition() = default;

        // Constructs and starts in one step, see start()
        explicit Transition(ElementEvent transition, Options options = {}, Work work = nullptr);
        explicit Transition(const Mapping &transition, Options options = {}, Work work = nullptr);

        // Records the element, event and options and starts the timer.
        // When work is given it is executed and the transition completes
        // before returning; if work throws the transition stays running.
        //
        // Throws TransitionException: AlreadyCompleted, AlreadyRunning,
        // InvalidElement (empty identifier, or a mapping without exactly one entry).
        Transition &start(ElementEvent transition, Options options = {}, Work work = nullptr);
        Transition &start(const Mapping &transition, Options options = {}, Work work = nullptr);

        // Stops the timer and marks the transition as completed.
        // Throws TransitionException: AlreadyCompleted, NotRunning.
        Transition &complete();

        // Replays the event through the browser.
        // Returns nullptr for non-replayable events without touching the browser.
        TransitionPtr replay(Browser &browser) const;

        int depth() const;
        bool replayable() const;

        bool running() const { return runningSince_.has_value(); }
        bool completed() const { return elapsed_.has_value(); }
        TransitionState state() const;

        const std::string &element() const { return element_; }
        const Event &event() const { return event_; }
        const Options &options() const { return options_; }
        // Options stay editable; changing them changes identity()
        Options &options() { return options_; }
        const std::optional<Duration> &elapsed() const { return elapsed_; }

        // Only allowed before start()
        void setEvent(Event event);

        TransitionRecord toStructured() const;
        std::string toString() const;
        Transition duplicate() const { return *this; }

        auto identity() const { return std::tie(element_, event_, options_); }
        size_t hash() const;

        bool operator==(const Transition &other) const { return identity() == other.identity(); }
        bool operator!=(const Transition &other) const { return !(*this == other); }

        // Events without a DOM depth
        static const std::unordered_set<Event> &zeroDepthEvents();
        // Events reached as a side effect of navigation, which cannot be fired again
        static const std::unordered_set<Event> &nonReplayableEvents();

      private:
        void ensureNotStarted() const;

        std::string element_;
        Event event_;
        Options options_;
        std::optional<Duration> elapsed_;
        std::optional<Clock::time_point> runningSince_;
    };

    inline std::ostream &operator<<(std::ostream &os, const Transition &transition) {
        return os << transition.toString();
    }

} // namespace retrace::dom

template <> struct std::hash<retrace::dom::Transition> {
    size_t operator()(const retrace::dom::Transition &transition) const noexcept { return transition.hash(); }
};
