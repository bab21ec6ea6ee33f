#include "WordProgress.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

void WordProgress::recomputeMasteryLevel() {
    int total = correct_count + incorrect_count;
    if (total <= 0) {
        mastery_level = 0;
        return;
    }
    double ratio = static_cast<double>(correct_count) / static_cast<double>(total);
    mastery_level = std::clamp(static_cast<int>(std::lround(ratio * 5.0)), 0, 5);
}

void WordProgress::resetSessionFlags() {
    failed_in_session = false;
    retry_count = 0;
}

void WordProgress::scheduleNext(int days, std::time_t from) {
    last_interval_days = interval_days;
    interval_days = std::max(0, days);
    next_review = from + static_cast<std::time_t>(interval_days) * SECONDS_PER_DAY;

    spdlog::debug("Word '{}' scheduled: interval={} days (was {}), next_review={}",
        vocabulary_id, interval_days, last_interval_days, next_review);
}

WordProgress createInitialWordProgress(const std::string& vocabularyId,
                                       const std::string& word,
                                       std::time_t now) {
    WordProgress p;
    p.vocabulary_id = vocabularyId;
    p.word = word;
    p.last_practiced = now;
    p.next_review = now; // available immediately
    spdlog::debug("Created initial progress for '{}' ({})", vocabularyId, word);
    return p;
}

/*
  Coarse badge for dashboards. Box 3 with a running streak already counts
  as close to mastered; boxes past 4 always do.
*/
WordStatus wordStatus(const WordProgress& progress) {
    if (progress.total_reviews <= 0) {
        return WordStatus::NEW;
    }

    int box = std::clamp(progress.leitner_box, 1, 7);
    int consecutive = std::clamp(progress.consecutive_correct_count, 0, 100);

    if (box >= 5 || (box == 3 && consecutive >= 2)) return WordStatus::MASTERED;
    if (box >= 4 || (box == 3 && consecutive >= 1)) return WordStatus::ALMOST_DONE;
    return WordStatus::STILL_LEARNING;
}

std::string statusToString(WordStatus status) {
    switch (status) {
    case WordStatus::NEW: return "NEW";
    case WordStatus::STILL_LEARNING: return "STILL_LEARNING";
    case WordStatus::ALMOST_DONE: return "ALMOST_DONE";
    case WordStatus::MASTERED: return "MASTERED";
    }
    return "NEW";
}
