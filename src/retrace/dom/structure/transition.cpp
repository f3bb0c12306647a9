#include "retrace/dom/structure/transition.hpp"
#include "retrace/dom/browser.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace retrace::dom {

    namespace {
        bool isValidElement(const std::string &element) {
            return std::any_of(element.begin(), element.end(),
                               [](char c) { return std::isspace(static_cast<unsigned char>(c)) == 0; });
        }
    } // namespace

    Transition::Transition(ElementEvent transition, Options options, Work work) {
        start(std::move(transition), std::move(options), std::move(work));
    }

    Transition::Transition(const Mapping &transition, Options options, Work work) {
        start(transition, std::move(options), std::move(work));
    }

    Transition &Transition::start(ElementEvent transition, Options options, Work work) {
        ensureNotStarted();

        if (!isValidElement(transition.element)) {
            throw TransitionException(TransitionError::InvalidElement,
                                      "Element identifier cannot be empty: '" + transition.element + "'");
        }
        if (transition.event.empty()) {
            throw std::invalid_argument("Transition event cannot be empty");
        }

        element_ = std::move(transition.element);
        event_ = std::move(transition.event);
        options_ = std::move(options);
        runningSince_ = Clock::now();

        if (!work) {
            return *this;
        }

        work();
        return complete();
    }

    Transition &Transition::start(const Mapping &transition, Options options, Work work) {
        ensureNotStarted();

        if (transition.size() != 1) {
            throw TransitionException(TransitionError::InvalidElement,
                                      "Expected exactly one element => event pair, got " +
                                          std::to_string(transition.size()));
        }

        const auto &[element, event] = *transition.begin();
        return start(ElementEvent{element, event}, std::move(options), std::move(work));
    }

    Transition &Transition::complete() {
        if (completed()) {
            throw TransitionException(TransitionError::AlreadyCompleted, "Transition has completed.");
        }
        if (!running()) {
            throw TransitionException(TransitionError::NotRunning, "Transition is not running.");
        }

        elapsed_ = std::chrono::duration_cast<Duration>(Clock::now() - *runningSince_);
        runningSince_.reset();
        return *this;
    }

    TransitionPtr Transition::replay(Browser &browser) const {
        if (!replayable()) {
            return nullptr;
        }
        if (element_.empty()) {
            throw TransitionException(TransitionError::InvalidElement, "Cannot replay a transition that never started");
        }

        auto element = browser.locateElement(element_);
        if (!element) {
            return nullptr;
        }
        return browser.fireEvent(element, event_, options_);
    }

    int Transition::depth() const { return zeroDepthEvents().count(event_) ? 0 : 1; }

    bool Transition::replayable() const { return nonReplayableEvents().count(event_) == 0; }

    TransitionState Transition::state() const {
        if (completed())
            return TransitionState::COMPLETED;
        if (running())
            return TransitionState::RUNNING;
        return TransitionState::UNSTARTED;
    }

    void Transition::setEvent(Event event) {
        ensureNotStarted();
        event_ = std::move(event);
    }

    TransitionRecord Transition::toStructured() const { return TransitionRecord{element_, event_, options_, elapsed_}; }

    std::string Transition::toString() const { return "'" + event_.name() + "' on: " + element_; }

    size_t Transition::hash() const {
        size_t seed = std::hash<std::string>{}(element_);
        Options::hashCombine(seed, std::hash<Event>{}(event_));
        Options::hashCombine(seed, options_.hash());
        return seed;
    }

    const std::unordered_set<Event> &Transition::zeroDepthEvents() {
        static const std::unordered_set<Event> events{Event::request()};
        return events;
    }

    const std::unordered_set<Event> &Transition::nonReplayableEvents() {
        static const std::unordered_set<Event> events{Event::request(), Event::load()};
        return events;
    }

    void Transition::ensureNotStarted() const {
        if (completed()) {
            throw TransitionException(TransitionError::AlreadyCompleted, "Transition has completed.");
        }
        if (running()) {
            throw TransitionException(TransitionError::AlreadyRunning, "Transition is already running.");
        }
    }

} // namespace retrace::dom
