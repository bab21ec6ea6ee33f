#include "LearningStats.hpp"
#include "CalendarDate.hpp"
#include <cmath>

std::vector<BoxInfo> boxInfo(const LearningSettings& settings) {
    static const std::vector<std::string> names3 = { "Learning", "Review", "Mastered" };
    static const std::vector<std::string> names5 = { "New", "Learning", "Review", "Familiar", "Mastered" };
    static const std::vector<std::string> names7 = {
        "New", "Learning", "Practicing", "Review", "Familiar", "Confident", "Mastered"
    };

    const auto& preset = boxIntervalPreset(settings.leitner_box_count);
    const auto& names = preset.size() == 3 ? names3 : (preset.size() == 7 ? names7 : names5);

    std::vector<BoxInfo> out;
    for (size_t i = 0; i < preset.size(); ++i) {
        BoxInfo b;
        b.box_number = static_cast<int>(i) + 1;
        b.name = names[i];
        b.interval_days = preset[i];
        out.push_back(b);
    }
    return out;
}

std::vector<BoxDistribution> boxDistribution(const std::vector<WordProgress>& words,
                                             const LearningSettings& settings) {
    std::vector<BoxDistribution> out;
    double total = static_cast<double>(words.size());

    for (int box = 1; box <= settings.leitner_box_count; ++box) {
        BoxDistribution d;
        d.box_number = box;
        for (const auto& w : words) {
            if (w.leitner_box == box) d.word_count++;
        }
        d.percentage = total > 0 ? static_cast<int>(std::lround(d.word_count / total * 100.0)) : 0;
        out.push_back(d);
    }
    return out;
}

std::vector<const WordProgress*> wordsDueToday(const std::vector<WordProgress>& words, std::time_t now) {
    long today = CalendarDate::fromLocalTime(now).toDays();

    std::vector<const WordProgress*> due;
    for (const auto& w : words) {
        if (CalendarDate::fromLocalTime(w.next_review).toDays() <= today) {
            due.push_back(&w);
        }
    }
    return due;
}

int masteryPercentage(const std::vector<WordProgress>& words, const LearningSettings& settings) {
    if (words.empty() || settings.leitner_box_count <= 0) return 0;

    long sum = 0;
    for (const auto& w : words) sum += w.leitner_box;

    double maxPossible = static_cast<double>(words.size()) * settings.leitner_box_count;
    return static_cast<int>(std::lround(sum / maxPossible * 100.0));
}

LearningStats learningStats(const std::vector<WordProgress>& words,
                            const LearningSettings& settings,
                            std::time_t now) {
    LearningStats s;
    s.total_words = static_cast<int>(words.size());
    s.words_due_today = static_cast<int>(wordsDueToday(words, now).size());

    long boxSum = 0;
    for (const auto& w : words) {
        boxSum += w.leitner_box;
        if (w.leitner_box >= settings.leitner_box_count) s.mastered_words++;
        else if (w.leitner_box <= 1) s.new_words++;
    }
    s.learning_words = s.total_words - s.mastered_words - s.new_words;

    if (s.total_words > 0) {
        double avg = static_cast<double>(boxSum) / s.total_words;
        s.average_box = std::round(avg * 10.0) / 10.0;
    }
    s.mastery_percentage = masteryPercentage(words, settings);
    return s;
}
