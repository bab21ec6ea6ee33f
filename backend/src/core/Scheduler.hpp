#pragma once
#include <ctime>
#include <memory>
#include <string>
#include "WordProgress.hpp"
#include "LearningSettings.hpp"

// One practice answer as the engine sees it
struct AnswerOutcome {
    bool correct = false;
    PracticeMode mode = PracticeMode::FLASHCARD;
    std::time_t answered_at = 0;   // the engine's "now"
    int time_spent_seconds = 0;
};

/*
  Spaced repetition strategy. advance() is pure: it returns the next record
  and never touches storage. Out-of-range input (old or divergent client
  records) is clamped rather than rejected; only a missing vocabulary id or
  an unknown mode throws ValidationError.
*/
class SchedulingAlgorithm {
public:
    virtual ~SchedulingAlgorithm() = default;

    virtual WordProgress advance(const WordProgress& progress, const AnswerOutcome& outcome) const = 0;

    virtual std::string name() const = 0;
};

/*
  Shared frame for the three algorithms:
    - counters, mastery level, session flags
    - three-mode cycle gate (ModeCycleTracker)
    - Leitner promotion on cycle close, demotion by one box on a miss
    - miss interval = max(1, floor(interval / 2))
  Subclasses decide the interval of a closed cycle and what happens to the
  easiness factor.
*/
class CycleGatedScheduler : public SchedulingAlgorithm {
public:
    WordProgress advance(const WordProgress& progress, const AnswerOutcome& outcome) const override;

protected:
    explicit CycleGatedScheduler(const LearningSettings& settings);

    // Box has already been promoted; returns the new interval in days
    virtual int closeCycle(WordProgress& progress, const AnswerOutcome& outcome) const = 0;
    virtual void onLapse(WordProgress& progress) const;

    const LearningSettings& settings() const { return config; }

private:
    LearningSettings config;

    int maxBoxes() const;
    void validate(const WordProgress& progress, const AnswerOutcome& outcome) const;
    void sanitize(WordProgress& progress) const;
};

// Dynamic easiness factor; intervals grow by EF once all modes are cleared
class Sm2Scheduler : public CycleGatedScheduler {
public:
    explicit Sm2Scheduler(const LearningSettings& settings);

    std::string name() const override { return "sm2"; }

    // EF' = EF + (0.1 - (5 - q) * (0.08 + (5 - q) * 0.02)), clamped to [1.3, 2.5]
    static double updateEasiness(double ef, int quality);

    // Boolean answers carry no grade; derive one from how many full cycles
    // were answered in a row, minus one step for a slow answer.
    int qualityFor(int consecutiveCorrect, int timeSpentSeconds) const;

    static constexpr int LAPSE_QUALITY = 2;

protected:
    int closeCycle(WordProgress& progress, const AnswerOutcome& outcome) const override;
    void onLapse(WordProgress& progress) const override;
};

// Fixed interval per Leitner box; easiness is carried but unused
class ModifiedSm2Scheduler : public CycleGatedScheduler {
public:
    explicit ModifiedSm2Scheduler(const LearningSettings& settings);

    std::string name() const override { return "modifiedsm2"; }

protected:
    int closeCycle(WordProgress& progress, const AnswerOutcome& outcome) const override;
};

// 1 -> 2 -> 4 -> 8 ... days, capped
class SimpleScheduler : public CycleGatedScheduler {
public:
    explicit SimpleScheduler(const LearningSettings& settings);

    std::string name() const override { return "simple"; }

    static constexpr int MAX_INTERVAL_DAYS = 120;

protected:
    int closeCycle(WordProgress& progress, const AnswerOutcome& outcome) const override;
};

// Chosen once per language from settings.algorithm
std::unique_ptr<SchedulingAlgorithm> makeAlgorithm(const LearningSettings& settings);
