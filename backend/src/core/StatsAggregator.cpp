#include "StatsAggregator.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

int StatsAggregator::nextStreak(int currentStreak,
                                const std::optional<CalendarDate>& lastPracticeDate,
                                const CalendarDate& today) {
    if (!lastPracticeDate) return 1;

    long gap = today.toDays() - lastPracticeDate->toDays();
    if (gap == 0) return std::max(1, currentStreak);
    if (gap == 1) return std::max(0, currentStreak) + 1;
    return 1;
}

UserPracticeProgress StatsAggregator::applySession(const UserPracticeProgress& aggregate,
                                                   const PracticeSession& session,
                                                   const CalendarDate& today) {
    UserPracticeProgress out = aggregate;

    out.total_sessions = std::max(0, out.total_sessions) + 1;

    int firstTime = 0;
    for (const auto& r : session.results) {
        if (r.vocabulary_id.empty()) continue;
        if (out.practiced_ids.insert(r.vocabulary_id).second) {
            ++firstTime;
        }
    }
    out.total_words_practiced = std::max(0, out.total_words_practiced) + firstTime;

    if (out.last_practice_date && today < *out.last_practice_date) {
        spdlog::warn("Session day {} is before last practice day {}; streak restarts",
            today.toString(), out.last_practice_date->toString());
    }

    out.current_streak = nextStreak(out.current_streak, out.last_practice_date, today);
    out.longest_streak = std::max(out.longest_streak, out.current_streak);
    out.last_practice_date = today;

    spdlog::info("Session applied for '{}': sessions={}, words={} (+{}), streak={} (best {})",
        out.language, out.total_sessions, out.total_words_practiced, firstTime,
        out.current_streak, out.longest_streak);
    return out;
}
