#pragma once
#include "PracticeMode.hpp"

enum class CycleEvent {
    PROGRESSED,   // new mode added, cycle still open
    REPEATED,     // mode was already completed in this cycle
    CLOSED,       // all modes completed; the set is cleared for the next cycle
    FORFEITED     // incorrect answer wiped the cycle
};

/*
  Tracks which practice modes a word has cleared in its current review cycle.

    Open({}) --correct m--> Open({m}) ... --last mode--> Closed -> Open({})
    Open(any) --incorrect--> Open({})

  There is no terminal state. A word only "spaces out" after it was recalled
  in every presentation style within one cycle.
*/
class ModeCycleTracker {
public:
    explicit ModeCycleTracker(ModeSet& modes);

    CycleEvent recordCorrect(PracticeMode mode);
    CycleEvent recordIncorrect();

    bool isComplete() const;
    size_t remaining() const;

private:
    ModeSet& completed;
};
