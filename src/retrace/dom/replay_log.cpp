#include "retrace/dom/replay_log.hpp"
#include <algorithm>
#include <stdexcept>

namespace retrace::dom {

    void ReplayLog::push(const Transition &transition) {
        if (transition.state() == TransitionState::UNSTARTED) {
            throw TransitionException(TransitionError::NotRunning, "Cannot record a transition that never started");
        }
        transitions_.push_back(transition.duplicate());
        notifyDebug(ReplayDebugEvent::TRANSITION_RECORDED, transitions_.size() - 1, transitions_.back());
    }

    Transition &ReplayLog::back() {
        if (transitions_.empty()) {
            throw std::out_of_range("ReplayLog is empty");
        }
        return transitions_.back();
    }

    int ReplayLog::depth() const {
        int total = 0;
        for (const auto &transition : transitions_) {
            total += transition.depth();
        }
        return total;
    }

    bool ReplayLog::replayable() const {
        return std::any_of(transitions_.begin(), transitions_.end(),
                           [](const Transition &transition) { return transition.replayable(); });
    }

    ReplayOutcome ReplayLog::replay(Browser &browser) const {
        ReplayOutcome outcome;

        for (size_t i = 0; i < transitions_.size(); ++i) {
            const auto &transition = transitions_[i];

            if (!transition.replayable()) {
                notifyDebug(ReplayDebugEvent::TRANSITION_SKIPPED, i, transition);
                continue;
            }

            auto produced = transition.replay(browser);
            if (!produced) {
                outcome.restored = false;
                outcome.failedAt = i;
                notifyDebug(ReplayDebugEvent::REPLAY_FAILED, i, transition);
                break;
            }

            ++outcome.replayed;
            outcome.produced.push_back(std::move(produced));
            notifyDebug(ReplayDebugEvent::TRANSITION_REPLAYED, i, transition);
        }

        return outcome;
    }

    std::vector<TransitionRecord> ReplayLog::toStructured() const {
        std::vector<TransitionRecord> records;
        records.reserve(transitions_.size());
        for (const auto &transition : transitions_) {
            records.push_back(transition.toStructured());
        }
        return records;
    }

    size_t ReplayLog::hash() const {
        size_t seed = transitions_.size();
        for (const auto &transition : transitions_) {
            Options::hashCombine(seed, transition.hash());
        }
        return seed;
    }

    void ReplayLog::notifyDebug(ReplayDebugEvent event, size_t index, const Transition &transition) const {
        if (!debugCallback_)
            return;
        debugCallback_(ReplayDebugInfo{event, index, transition.toString(), std::chrono::steady_clock::now()});
    }

} // namespace retrace::dom
