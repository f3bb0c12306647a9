#pragma once
#include "structure/options.hpp"
#include "structure/transition.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace retrace::dom {

    class TransitionBuilder {
      public:
        TransitionBuilder() = default;

        // Element the event targets
        TransitionBuilder &element(const std::string &identifier) {
            element_ = identifier;
            return *this;
        }

        TransitionBuilder &event(Event event) {
            event_ = std::move(event);
            return *this;
        }

        // Add a single replay option
        template <typename T> TransitionBuilder &option(const std::string &key, T value) {
            options_.set(key, std::move(value));
            return *this;
        }

        // Replace all options
        TransitionBuilder &options(Options options) {
            options_ = std::move(options);
            return *this;
        }

        // Running transition; the caller completes it
        TransitionPtr start() const {
            auto transition = std::make_shared<Transition>();
            transition->start(pending("start"), options_);
            return transition;
        }

        // Completed transition, timed around work
        TransitionPtr run(Transition::Work work) const {
            if (!work) {
                throw std::invalid_argument("run() requires work to execute");
            }
            auto transition = std::make_shared<Transition>();
            transition->start(pending("run"), options_, std::move(work));
            return transition;
        }

      private:
        ElementEvent pending(const char *context) const {
            if (!element_) {
                throw std::runtime_error(std::string("No element set. Call element() before ") + context + "()");
            }
            if (event_.empty()) {
                throw std::runtime_error(std::string("No event set. Call event() before ") + context + "()");
            }
            return ElementEvent{*element_, event_};
        }

        std::optional<std::string> element_;
        Event event_;
        Options options_;
    };

} // namespace retrace::dom
