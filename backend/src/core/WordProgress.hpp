#pragma once
#include <string>
#include <ctime>
#include "PracticeMode.hpp"

constexpr std::time_t SECONDS_PER_DAY = 24 * 60 * 60;

constexpr double EASE_MIN = 1.3;
constexpr double EASE_MAX = 2.5;
constexpr double EASE_DEFAULT = 2.5;

// Per (language, vocabulary id) scheduling record.
// Owned by the ProgressStore, mutated only by a SchedulingAlgorithm.
class WordProgress {
public:
    WordProgress() = default;

    // Identity
    std::string vocabulary_id;
    std::string word;             // display cache, not authoritative

    // Lifetime counters
    int correct_count = 0;
    int incorrect_count = 0;
    int mastery_level = 0;        // 0-5, legacy
    std::time_t last_practiced = 0;

    // Spaced repetition
    std::time_t next_review = 0;  // due iff now >= next_review
    int interval_days = 0;
    int last_interval_days = 0;
    double easiness_factor = EASE_DEFAULT;
    int consecutive_correct_count = 0;

    // Leitner
    int leitner_box = 1;
    int total_reviews = 0;

    // Session scoped; never persisted
    bool failed_in_session = false;
    int retry_count = 0;

    // Multi-mode completion
    ModeSet completed_modes_in_cycle;

    bool isDue(std::time_t now) const { return now >= next_review; }
    bool isNew() const { return total_reviews == 0; }

    // Seconds past the due date (negative while not yet due)
    std::time_t overdueBy(std::time_t now) const { return now - next_review; }

    // round(correct / (correct + incorrect) * 5)
    void recomputeMasteryLevel();

    void resetSessionFlags();

    // Sets interval_days and next_review = from + days
    void scheduleNext(int days, std::time_t from);
};

// Default record for a word practiced for the first time: box 1,
// interval 0, easiness 2.5 and due immediately.
WordProgress createInitialWordProgress(const std::string& vocabularyId,
                                       const std::string& word,
                                       std::time_t now);

enum class WordStatus {
    NEW,
    STILL_LEARNING,
    ALMOST_DONE,
    MASTERED
};

WordStatus wordStatus(const WordProgress& progress);
std::string statusToString(WordStatus status);
