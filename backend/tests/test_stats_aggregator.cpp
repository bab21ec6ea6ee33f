#include "../src/core/StatsAggregator.hpp"
#include "../src/core/LearningStats.hpp"
#include "../src/utils/logging.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

constexpr std::time_t NOW = 1700000000;

PracticeSession sessionWith(const std::vector<std::string>& ids) {
  CreatePracticeSessionRequest request;
  request.collection_id = "c1";
  request.language = "de";
  for (const auto& id : ids) {
    PracticeResult r;
    r.vocabulary_id = id;
    r.word = id;
    r.correct = id != "a";
    request.results.push_back(r);
  }
  return makeSession(request, NOW, NOW + 60);
}

void test_streaks(TestSuite& suite) {
  UserPracticeProgress agg;
  agg.language = "de";
  CalendarDate day1{2024, 3, 10};

  agg = StatsAggregator::applySession(agg, sessionWith({"a"}), day1);
  suite.require(agg.current_streak == 1, "first session starts a streak");

  agg = StatsAggregator::applySession(agg, sessionWith({"b"}), day1.addDays(1));
  suite.require(agg.current_streak == 2, "next day extends the streak by one");

  agg = StatsAggregator::applySession(agg, sessionWith({"c"}), day1.addDays(2));
  suite.require(agg.current_streak == 3, "consecutive days keep counting");

  agg = StatsAggregator::applySession(agg, sessionWith({"d"}), day1.addDays(2));
  suite.require(agg.current_streak == 3, "same day leaves the streak unchanged");

  agg = StatsAggregator::applySession(agg, sessionWith({"e"}), day1.addDays(5));
  suite.require(agg.current_streak == 1, "gap resets the streak");
  suite.require(agg.longest_streak == 3, "longest streak remembered");
  suite.require(agg.total_sessions == 5, "every session counted");
  suite.require(agg.last_practice_date && *agg.last_practice_date == day1.addDays(5),
                "last practice date updated");

  agg = StatsAggregator::applySession(agg, sessionWith({"f"}), day1);
  suite.require(agg.current_streak == 1, "session dated before the last one restarts the streak");
}

void test_streak_across_month(TestSuite& suite) {
  std::optional<CalendarDate> last = CalendarDate{2024, 2, 29};
  suite.require(StatsAggregator::nextStreak(4, last, CalendarDate{2024, 3, 1}) == 5,
                "leap day to March 1st is consecutive");
  suite.require(StatsAggregator::nextStreak(0, std::nullopt, CalendarDate{2024, 3, 1}) == 1,
                "no previous session starts at one");
  suite.require(StatsAggregator::nextStreak(0, last, *last) == 1,
                "same day never reports zero");
}

void test_distinct_words(TestSuite& suite) {
  UserPracticeProgress agg;
  agg.language = "de";
  CalendarDate day{2024, 5, 1};

  PracticeSession s = sessionWith({"a", "b", "a", "a"});
  suite.require(s.total_questions == 4, "requeued answers are all questions");
  suite.require(s.correct_answers == 1, "correct answers recounted");

  agg = StatsAggregator::applySession(agg, s, day);
  suite.require(agg.total_words_practiced == 2, "requeued word counted once");

  agg = StatsAggregator::applySession(agg, sessionWith({"a", "c"}), day);
  suite.require(agg.total_words_practiced == 3, "only first-time words added");
}

void test_calendar_date(TestSuite& suite) {
  suite.require(CalendarDate::fromDays(0) == (CalendarDate{1970, 1, 1}), "epoch day");
  suite.require((CalendarDate{2023, 12, 31}).addDays(1) == (CalendarDate{2024, 1, 1}), "year rollover");
  suite.require((CalendarDate{2024, 1, 5}).toString() == "2024-01-05", "zero padded");

  auto parsed = CalendarDate::parse("2024-02-29");
  suite.require(parsed && *parsed == (CalendarDate{2024, 2, 29}), "parse leap day");
  suite.require(!CalendarDate::parse("2023-02-29"), "reject non-leap Feb 29");
  suite.require(!CalendarDate::parse("2024-13-01"), "reject month 13");
  suite.require(!CalendarDate::parse("2024-01-01x"), "reject trailing text");
}

std::vector<WordProgress> boxes(const std::vector<int>& b) {
  std::vector<WordProgress> out;
  for (size_t i = 0; i < b.size(); ++i) {
    WordProgress p = createInitialWordProgress("w" + std::to_string(i), "w", NOW);
    p.leitner_box = b[i];
    p.total_reviews = b[i] > 1 ? 3 : 0;
    out.push_back(p);
  }
  return out;
}

void test_learning_stats(TestSuite& suite) {
  LearningSettings settings;
  auto words = boxes({1, 1, 3, 5, 5});
  words[0].next_review = NOW + 2 * SECONDS_PER_DAY;
  words[1].next_review = NOW - SECONDS_PER_DAY;

  LearningStats s = learningStats(words, settings, NOW);
  suite.require(s.total_words == 5, "total words");
  suite.require(s.mastered_words == 2, "top box counts as mastered");
  suite.require(s.new_words == 2, "box one counts as new");
  suite.require(s.learning_words == 1, "everything else is learning");
  suite.require(std::fabs(s.average_box - 3.0) < 1e-9, "average box");
  suite.require(s.mastery_percentage == 60, "mastery percentage");
  suite.require(s.words_due_today == 4, "future word not due today");

  auto dist = boxDistribution(words, settings);
  suite.require(dist.size() == 5, "one bucket per box");
  suite.require(dist[0].word_count == 2 && dist[0].percentage == 40, "box one bucket");
  suite.require(dist[1].word_count == 0 && dist[1].percentage == 0, "empty bucket");
  suite.require(dist[4].word_count == 2, "top box bucket");

  auto info = boxInfo(settings);
  suite.require(info.size() == 5 && info[2].interval_days == 7, "box info follows the preset");
  suite.require(info.back().name == "Mastered", "last box is mastered");

  LearningStats empty = learningStats({}, settings, NOW);
  suite.require(empty.total_words == 0 && empty.mastery_percentage == 0, "empty collection");
}

void test_word_status(TestSuite& suite) {
  WordProgress p = createInitialWordProgress("s", "s", NOW);
  suite.require(wordStatus(p) == WordStatus::NEW, "never reviewed is new");

  p.total_reviews = 4;
  p.leitner_box = 2;
  suite.require(wordStatus(p) == WordStatus::STILL_LEARNING, "low box still learning");

  p.leitner_box = 3;
  p.consecutive_correct_count = 1;
  suite.require(wordStatus(p) == WordStatus::ALMOST_DONE, "box three with a streak is almost done");

  p.leitner_box = 5;
  suite.require(wordStatus(p) == WordStatus::MASTERED, "box five is mastered");
  suite.require(statusToString(WordStatus::MASTERED) == "MASTERED", "status name");
}

}  // namespace

int main() {
  Log::quiet();
  TestSuite suite;

  test_streaks(suite);
  test_streak_across_month(suite);
  test_distinct_words(suite);
  test_calendar_date(suite);
  test_learning_stats(suite);
  test_word_status(suite);

  if (suite.ok) {
    std::cout << "test_stats_aggregator passed\n";
  }
  return suite.ok ? 0 : 1;
}
