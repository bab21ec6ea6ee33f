#include "Scheduler.hpp"
#include "Errors.hpp"
#include "ModeCycleTracker.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <spdlog/spdlog.h>

namespace {
    // anything beyond ~50 years is treated as corrupt input
    constexpr int INTERVAL_CAP_DAYS = 365 * 50;
    constexpr int COUNTER_CAP = 1000000;

    bool blank(const std::string& s) {
        return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    }
}

CycleGatedScheduler::CycleGatedScheduler(const LearningSettings& settings)
    : config(settings)
{
}

WordProgress CycleGatedScheduler::advance(const WordProgress& progress, const AnswerOutcome& outcome) const {
    validate(progress, outcome);

    WordProgress next = progress;
    sanitize(next);

    next.total_reviews += 1;
    next.last_practiced = outcome.answered_at;

    ModeCycleTracker cycle(next.completed_modes_in_cycle);

    if (outcome.correct) {
        next.correct_count += 1;
        next.consecutive_correct_count += 1;

        CycleEvent ev = cycle.recordCorrect(outcome.mode);
        if (ev == CycleEvent::CLOSED) {
            int previousBox = next.leitner_box;
            next.leitner_box = std::min(next.leitner_box + 1, maxBoxes());

            int days = closeCycle(next, outcome);
            days = std::clamp(days, 1, INTERVAL_CAP_DAYS);
            next.scheduleNext(days, outcome.answered_at);

            spdlog::info("Word '{}' cleared all modes: box {} -> {}, interval={}d, ef={:.2f}",
                next.vocabulary_id, previousBox, next.leitner_box, next.interval_days, next.easiness_factor);
        }
        else {
            // next_review stays put; the remaining modes can still be practiced now
            spdlog::debug("Word '{}' completed {} ({} mode(s) left in cycle)",
                next.vocabulary_id, modeToString(outcome.mode), cycle.remaining());
        }
    }
    else {
        next.incorrect_count += 1;
        next.consecutive_correct_count = 0;
        cycle.recordIncorrect();

        next.leitner_box = std::max(next.leitner_box - 1, 1);
        onLapse(next);
        next.scheduleNext(std::max(1, next.interval_days / 2), outcome.answered_at);

        next.failed_in_session = true;
        next.retry_count += 1;

        spdlog::warn("Word '{}' missed in {}: box={}, interval={}d, retry={}",
            next.vocabulary_id, modeToString(outcome.mode), next.leitner_box,
            next.interval_days, next.retry_count);
    }

    next.recomputeMasteryLevel();
    return next;
}

void CycleGatedScheduler::onLapse(WordProgress&) const {
}

int CycleGatedScheduler::maxBoxes() const {
    return std::max(1, config.leitner_box_count);
}

void CycleGatedScheduler::validate(const WordProgress& progress, const AnswerOutcome& outcome) const {
    if (progress.vocabulary_id.empty() || blank(progress.vocabulary_id)) {
        throw ValidationError("progress record has no vocabulary id");
    }
    if (!isKnownMode(outcome.mode)) {
        throw ValidationError("unrecognized practice mode for '" + progress.vocabulary_id + "'");
    }
}

/*
  Records may come from an older client revision or a divergent device.
  Clamp everything into its documented bounds instead of rejecting.
*/
void CycleGatedScheduler::sanitize(WordProgress& p) const {
    const WordProgress before = p;

    p.leitner_box = std::clamp(p.leitner_box, 1, maxBoxes());

    if (!(p.easiness_factor > 0.0)) p.easiness_factor = EASE_DEFAULT; // 0 or NaN from old schema
    p.easiness_factor = std::clamp(p.easiness_factor, EASE_MIN, EASE_MAX);

    p.interval_days = std::clamp(p.interval_days, 0, INTERVAL_CAP_DAYS);
    p.last_interval_days = std::clamp(p.last_interval_days, 0, INTERVAL_CAP_DAYS);
    p.consecutive_correct_count = std::clamp(p.consecutive_correct_count, 0, COUNTER_CAP);
    p.correct_count = std::clamp(p.correct_count, 0, COUNTER_CAP);
    p.incorrect_count = std::clamp(p.incorrect_count, 0, COUNTER_CAP);
    p.total_reviews = std::clamp(p.total_reviews, 0, COUNTER_CAP);
    p.retry_count = std::clamp(p.retry_count, 0, COUNTER_CAP);

    // a full set can only come from a client that never closed the cycle
    auto known = std::count_if(p.completed_modes_in_cycle.begin(), p.completed_modes_in_cycle.end(),
        [](PracticeMode m) { return isKnownMode(m); });
    if (static_cast<size_t>(known) >= allPracticeModes().size()) {
        spdlog::debug("Record '{}' carried a completed cycle; starting a new one", p.vocabulary_id);
        p.completed_modes_in_cycle.clear();
    }

    if (p.leitner_box != before.leitner_box || p.easiness_factor != before.easiness_factor
        || p.interval_days != before.interval_days) {
        spdlog::debug("Clamped record '{}': box {} -> {}, ef {:.2f} -> {:.2f}, interval {} -> {}",
            p.vocabulary_id, before.leitner_box, p.leitner_box,
            before.easiness_factor, p.easiness_factor, before.interval_days, p.interval_days);
    }
}

/* -------------------------
   SM-2
   ------------------------- */

Sm2Scheduler::Sm2Scheduler(const LearningSettings& settings)
    : CycleGatedScheduler(settings)
{
}

double Sm2Scheduler::updateEasiness(double ef, int quality) {
    int q = std::clamp(quality, 0, 5);
    double delta = 0.1 - (5 - q) * (0.08 + (5 - q) * 0.02);
    return std::clamp(ef + delta, EASE_MIN, EASE_MAX);
}

/*
  cycles in a row | quality
  ----------------+--------
        1         |   3
        2         |   4
       3+         |   5
  A slow answer (time spent above slow_answer_seconds) costs one step,
  never dropping below 3 since the answer was still correct.
*/
int Sm2Scheduler::qualityFor(int consecutiveCorrect, int timeSpentSeconds) const {
    int modeCount = static_cast<int>(allPracticeModes().size());
    int cycles = std::max(1, consecutiveCorrect / modeCount);
    int q = std::min(5, 2 + cycles);

    int slow = settings().slow_answer_seconds;
    if (slow > 0 && timeSpentSeconds > slow) {
        q = std::max(3, q - 1);
    }
    return q;
}

int Sm2Scheduler::closeCycle(WordProgress& p, const AnswerOutcome& outcome) const {
    int q = qualityFor(p.consecutive_correct_count, outcome.time_spent_seconds);
    p.easiness_factor = updateEasiness(p.easiness_factor, q);

    if (p.interval_days == 0) {
        return 1; // first successful cycle
    }
    return std::max(1, static_cast<int>(std::lround(p.interval_days * p.easiness_factor)));
}

void Sm2Scheduler::onLapse(WordProgress& p) const {
    p.easiness_factor = updateEasiness(p.easiness_factor, LAPSE_QUALITY);
}

/* -------------------------
   Modified SM-2 (fixed box intervals)
   ------------------------- */

ModifiedSm2Scheduler::ModifiedSm2Scheduler(const LearningSettings& settings)
    : CycleGatedScheduler(settings)
{
}

int ModifiedSm2Scheduler::closeCycle(WordProgress& p, const AnswerOutcome&) const {
    return settings().boxInterval(p.leitner_box);
}

/* -------------------------
   Simple doubling
   ------------------------- */

SimpleScheduler::SimpleScheduler(const LearningSettings& settings)
    : CycleGatedScheduler(settings)
{
}

int SimpleScheduler::closeCycle(WordProgress& p, const AnswerOutcome&) const {
    if (p.interval_days == 0) return 1;
    return std::min(p.interval_days * 2, MAX_INTERVAL_DAYS);
}

std::unique_ptr<SchedulingAlgorithm> makeAlgorithm(const LearningSettings& settings) {
    spdlog::info("Scheduling algorithm: {}", algorithmToString(settings.algorithm));

    switch (settings.algorithm) {
    case SrAlgorithm::SM2:
        return std::make_unique<Sm2Scheduler>(settings);
    case SrAlgorithm::MODIFIED_SM2:
        return std::make_unique<ModifiedSm2Scheduler>(settings);
    case SrAlgorithm::SIMPLE:
        return std::make_unique<SimpleScheduler>(settings);
    }
    return std::make_unique<Sm2Scheduler>(settings);
}
