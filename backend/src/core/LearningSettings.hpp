#pragma once
#include <string>
#include <vector>

enum class SrAlgorithm {
    SM2,
    MODIFIED_SM2,
    SIMPLE
};

std::string algorithmToString(SrAlgorithm algorithm);
// Unknown names fall back to SM2 with a warning
SrAlgorithm algorithmFromString(const std::string& name);

// Fixed per-box review intervals (days) for the supported box counts
const std::vector<int>& boxIntervalPreset(int boxCount);

class LearningSettings {
public:
    SrAlgorithm algorithm = SrAlgorithm::SM2;
    int leitner_box_count = 5;                 // 3, 5 or 7

    // Session queue policy
    bool show_failed_words_in_session = true;
    int new_words_per_session = 20;
    int daily_review_limit = 100;              // 0 = unlimited
    int session_retry_cap = 3;                 // misses per word per session
    int requeue_spacing = 3;                   // positions forward per retry
    int reviews_per_new_word = 3;              // interleave ratio

    // SM-2 quality mapping
    int slow_answer_seconds = 20;              // 0 disables the timing penalty

    // Preset interval of `box` for the configured box count
    int boxInterval(int box) const;

    // key:value lines
    std::string serialize() const;
    void deserialize(const std::string& data);

private:
    void applyValue(const std::string& key, const std::string& value);
};
