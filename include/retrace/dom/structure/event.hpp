#pragma once
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace retrace::dom {

    // Canonical DOM event name ("click", "load", ...)
    class Event {
      public:
        // Empty event, only used by transitions that have not started yet
        Event() = default;

        // Normalizes the name; throws std::invalid_argument if nothing is left
        Event(std::string_view name);
        Event(const std::string &name) : Event(std::string_view(name)) {}
        Event(const char *name) : Event(std::string_view(name ? name : "")) {}

        const std::string &name() const { return name_; }
        bool empty() const { return name_.empty(); }

        bool operator==(const Event &other) const { return name_ == other.name_; }
        bool operator!=(const Event &other) const { return name_ != other.name_; }
        bool operator<(const Event &other) const { return name_ < other.name_; }

        // Well-known events
        static Event click() { return Event("click"); }
        static Event load() { return Event("load"); }
        static Event request() { return Event("request"); }
        static Event submit() { return Event("submit"); }
        static Event change() { return Event("change"); }
        static Event input() { return Event("input"); }
        static Event focus() { return Event("focus"); }
        static Event blur() { return Event("blur"); }
        static Event mouseover() { return Event("mouseover"); }

        static std::string normalize(std::string_view name);

      private:
        std::string name_;
    };

    inline std::ostream &operator<<(std::ostream &os, const Event &event) { return os << event.name(); }

} // namespace retrace::dom

template <> struct std::hash<retrace::dom::Event> {
    size_t operator()(const retrace::dom::Event &event) const noexcept {
        return std::hash<std::string>{}(event.name());
    }
};
