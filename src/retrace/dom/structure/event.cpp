#include "retrace/dom/structure/event.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace retrace::dom {

    Event::Event(std::string_view name) : name_(normalize(name)) {
        if (name_.empty()) {
            throw std::invalid_argument("Event name cannot be empty");
        }
    }

    std::string Event::normalize(std::string_view name) {
        auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

        while (!name.empty() && isSpace(name.front()))
            name.remove_prefix(1);
        while (!name.empty() && isSpace(name.back()))
            name.remove_suffix(1);

        // Symbol notation, e.g. ":click"
        if (!name.empty() && name.front() == ':')
            name.remove_prefix(1);

        std::string result(name);
        std::transform(result.begin(), result.end(), result.begin(),
                       [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
        return result;
    }

} // namespace retrace::dom
