#pragma once
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "CalendarDate.hpp"
#include "PracticeSession.hpp"
#include "WordProgress.hpp"

// Per-language aggregate
class UserPracticeProgress {
public:
    std::string language;
    std::vector<WordProgress> words_progress;

    int total_sessions = 0;
    int total_words_practiced = 0;
    int current_streak = 0;
    int longest_streak = 0;
    std::optional<CalendarDate> last_practice_date;

    // Ids already counted in total_words_practiced
    std::set<std::string> practiced_ids;
};

class StatsAggregator {
public:
    /*
      Folds one completed session into the aggregate:
        - total_sessions += 1
        - total_words_practiced grows by ids seen for the first time
          (a requeued word counts once)
        - streak: +1 the day after the last session, unchanged on the same
          day, reset to 1 after a gap
      `today` is the local calendar day the session was recorded on.
    */
    static UserPracticeProgress applySession(const UserPracticeProgress& aggregate,
                                             const PracticeSession& session,
                                             const CalendarDate& today);

    static int nextStreak(int currentStreak,
                          const std::optional<CalendarDate>& lastPracticeDate,
                          const CalendarDate& today);
};
