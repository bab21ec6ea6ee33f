#include "ModeCycleTracker.hpp"
#include <spdlog/spdlog.h>

ModeCycleTracker::ModeCycleTracker(ModeSet& modes)
    : completed(modes)
{
    // drop anything foreign an older record might carry
    for (auto it = completed.begin(); it != completed.end();) {
        if (!isKnownMode(*it)) it = completed.erase(it);
        else ++it;
    }
}

CycleEvent ModeCycleTracker::recordCorrect(PracticeMode mode) {
    bool inserted = completed.insert(mode).second;

    if (isComplete()) {
        completed.clear();
        spdlog::debug("Cycle closed by mode {}", modeToString(mode));
        return CycleEvent::CLOSED;
    }

    return inserted ? CycleEvent::PROGRESSED : CycleEvent::REPEATED;
}

CycleEvent ModeCycleTracker::recordIncorrect() {
    if (!completed.empty()) {
        spdlog::debug("Cycle forfeited with {} mode(s) completed", completed.size());
    }
    completed.clear();
    return CycleEvent::FORFEITED;
}

bool ModeCycleTracker::isComplete() const {
    return completed.size() >= allPracticeModes().size();
}

size_t ModeCycleTracker::remaining() const {
    size_t total = allPracticeModes().size();
    return completed.size() >= total ? 0 : total - completed.size();
}
