#pragma once
#include "retrace/dom/browser.hpp"
#include "retrace/dom/structure/transition.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

// Scriptable in-memory browser for replay tests
class MockElement : public retrace::dom::ElementHandle {
  public:
    explicit MockElement(std::string identifier) : identifier_(std::move(identifier)) {}
    const std::string &identifier() const override { return identifier_; }

  private:
    std::string identifier_;
};

class MockBrowser : public retrace::dom::Browser {
  public:
    struct Fired {
        std::string element;
        retrace::dom::Event event;
        retrace::dom::Options options;
    };

    retrace::dom::ElementHandlePtr locateElement(const std::string &identifier) override {
        located.push_back(identifier);
        if (detached.count(identifier)) {
            throw std::runtime_error("Element detached: " + identifier);
        }
        if (missing.count(identifier)) {
            return nullptr;
        }
        return std::make_shared<MockElement>(identifier);
    }

    retrace::dom::TransitionPtr fireEvent(const retrace::dom::ElementHandlePtr &element,
                                          const retrace::dom::Event &event,
                                          const retrace::dom::Options &options) override {
        fired.push_back(Fired{element->identifier(), event, options});
        if (inert.count(element->identifier())) {
            return nullptr;
        }
        return std::make_shared<retrace::dom::Transition>(
            retrace::dom::ElementEvent{element->identifier(), event}, options, [] {});
    }

    std::vector<std::string> located;
    std::vector<Fired> fired;

    std::unordered_set<std::string> missing;  // locateElement() returns nullptr
    std::unordered_set<std::string> detached; // locateElement() throws
    std::unordered_set<std::string> inert;    // fireEvent() produces no transition
};
