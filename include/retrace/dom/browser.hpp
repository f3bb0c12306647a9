#pragma once
#include "structure/event.hpp"
#include "structure/options.hpp"
#include <memory>
#include <string>

namespace retrace::dom {

    class Transition;
    using TransitionPtr = std::shared_ptr<Transition>;

    // Live reference to an element of the page currently loaded in a browser
    class ElementHandle {
      public:
        virtual ~ElementHandle() = default;

        // Identifier the handle was located by
        virtual const std::string &identifier() const = 0;
    };

    using ElementHandlePtr = std::shared_ptr<ElementHandle>;

    // Browser capability required to replay transitions. Implementations own
    // element lookup, event dispatch and any timeout/cancellation policy.
    class Browser {
      public:
        virtual ~Browser() = default;

        // Resolves a stored identifier against the current page.
        // Returns nullptr (or throws) when the element no longer exists.
        virtual ElementHandlePtr locateElement(const std::string &identifier) = 0;

        // Dispatches the event; returns the resulting transition or nullptr if
        // the dispatch produced none.
        virtual TransitionPtr fireEvent(const ElementHandlePtr &element, const Event &event,
                                        const Options &options) = 0;
    };

    using BrowserPtr = std::shared_ptr<Browser>;

} // namespace retrace::dom
