#include <retrace/retrace.hpp>
#include <iostream>
#include <memory>
#include <thread>

using namespace retrace;

// Browser stand-in that "clicks" by printing
class PrintingBrowser : public dom::Browser {
  public:
    class Element : public dom::ElementHandle {
      public:
        explicit Element(std::string identifier) : identifier_(std::move(identifier)) {}
        const std::string &identifier() const override { return identifier_; }

      private:
        std::string identifier_;
    };

    dom::ElementHandlePtr locateElement(const std::string &identifier) override {
        std::cout << "  [LOCATE] " << identifier << std::endl;
        return std::make_shared<Element>(identifier);
    }

    dom::TransitionPtr fireEvent(const dom::ElementHandlePtr &element, const dom::Event &event,
                                 const dom::Options &options) override {
        std::cout << "  [FIRE] " << event << " on " << element->identifier() << " (" << options.size()
                  << " options)" << std::endl;
        return std::make_shared<dom::Transition>(dom::ElementEvent{element->identifier(), event}, options,
                                                 [] { std::this_thread::sleep_for(std::chrono::milliseconds(5)); });
    }
};

void recordExample(dom::ReplayLog &log) {
    std::cout << "\n=== Recording a crawl step ===" << std::endl;

    log.setDebugCallback([](const dom::ReplayDebugInfo &info) {
        switch (info.event) {
        case dom::ReplayDebugEvent::TRANSITION_RECORDED:
            std::cout << "  [RECORDED] #" << info.index << " " << info.transition << std::endl;
            break;
        case dom::ReplayDebugEvent::TRANSITION_SKIPPED:
            std::cout << "  [SKIPPED] #" << info.index << " " << info.transition << std::endl;
            break;
        case dom::ReplayDebugEvent::TRANSITION_REPLAYED:
            std::cout << "  [REPLAYED] #" << info.index << " " << info.transition << std::endl;
            break;
        case dom::ReplayDebugEvent::REPLAY_FAILED:
            std::cout << "  [FAILED] #" << info.index << " " << info.transition << std::endl;
            break;
        }
    });

    // Page load happens outside of any element interaction
    dom::Transition request(dom::ElementEvent{"http://test.com/", dom::Event::request()});
    request.complete();
    log.push(request);

    log.push(*dom::TransitionBuilder().element("http://test.com/").event(dom::Event::load()).run([] {}));

    auto click = dom::TransitionBuilder().element("#open-form").event("click").start();
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    click->complete();
    log.push(*click);

    log.push(*dom::TransitionBuilder()
                  .element("#search")
                  .event("input")
                  .option("value", "retrace")
                  .run([] { std::this_thread::sleep_for(std::chrono::milliseconds(2)); }));

    std::cout << "Depth: " << log.depth() << std::endl;
}

void replayExample(const dom::ReplayLog &log) {
    std::cout << "\n=== Replaying against a fresh browser ===" << std::endl;

    PrintingBrowser browser;
    auto outcome = log.replay(browser);

    std::cout << "Restored: " << (outcome.restored ? "yes" : "no") << ", replayed " << outcome.replayed
              << " transition(s)" << std::endl;
}

void misuseExample() {
    std::cout << "\n=== Lifecycle misuse ===" << std::endl;

    dom::Transition transition;
    try {
        transition.complete();
    } catch (const dom::TransitionException &e) {
        std::cout << "  " << e.what() << std::endl;
    }
}

int main() {
    dom::ReplayLog log;

    recordExample(log);
    replayExample(log);
    misuseExample();

    std::cout << "\n=== Export ===" << std::endl;
    std::cout << serialization::TransitionSerializer::serialize(log);
    return 0;
}
