#pragma once
#include <ctime>
#include <string>
#include <vector>
#include "WordProgress.hpp"
#include "LearningSettings.hpp"

struct BoxInfo {
    int box_number = 1;
    std::string name;
    int interval_days = 1;
};

struct BoxDistribution {
    int box_number = 1;
    int word_count = 0;
    int percentage = 0;
};

struct LearningStats {
    int total_words = 0;
    int words_due_today = 0;
    int mastered_words = 0;
    int learning_words = 0;
    int new_words = 0;
    double average_box = 0.0;   // one decimal
    int mastery_percentage = 0;
};

std::vector<BoxInfo> boxInfo(const LearningSettings& settings);

std::vector<BoxDistribution> boxDistribution(const std::vector<WordProgress>& words,
                                             const LearningSettings& settings);

// Due on or before the local calendar day of `now`
std::vector<const WordProgress*> wordsDueToday(const std::vector<WordProgress>& words, std::time_t now);

int masteryPercentage(const std::vector<WordProgress>& words, const LearningSettings& settings);

LearningStats learningStats(const std::vector<WordProgress>& words,
                            const LearningSettings& settings,
                            std::time_t now);
