#include "../src/core/SessionQueue.hpp"
#include "../src/utils/logging.hpp"

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

WordProgress review(const std::string& id, long dueInDays) {
  WordProgress p = createInitialWordProgress(id, id, NOW);
  p.total_reviews = 3;
  p.interval_days = 2;
  p.next_review = NOW + dueInDays * SECONDS_PER_DAY;
  return p;
}

WordProgress fresh(const std::string& id) {
  return createInitialWordProgress(id, id, NOW);
}

std::vector<WordProgress> sampleProgress() {
  return {
      review("c", -2),
      fresh("n2"),
      review("a", -2),
      review("d", 1),
      review("b", -5),
      fresh("n1"),
  };
}

void test_order_and_interleave(TestSuite& suite) {
  auto order = SessionQueue::buildQueue(sampleProgress(), NOW, 0);

  std::vector<std::string> expected = {"b", "a", "c", "n1", "n2"};
  suite.require(order == expected, "longest overdue first, ties by id, new words interleaved");

  QueueOptions one;
  one.reviews_per_new_word = 1;
  order = SessionQueue::buildQueue(sampleProgress(), NOW, 0, one);
  expected = {"b", "n1", "a", "n2", "c"};
  suite.require(order == expected, "one new word after every review");
}

void test_idempotent(TestSuite& suite) {
  auto all = sampleProgress();
  auto first = SessionQueue::buildQueue(all, NOW, 0);
  auto second = SessionQueue::buildQueue(all, NOW, 0);
  suite.require(first == second, "same input builds the same queue");
}

void test_limits(TestSuite& suite) {
  auto order = SessionQueue::buildQueue(sampleProgress(), NOW, 2);
  suite.require(order.size() == 2 && order[0] == "b" && order[1] == "a", "limit truncates the queue");

  QueueOptions capped;
  capped.new_word_cap = 1;
  order = SessionQueue::buildQueue(sampleProgress(), NOW, 0, capped);
  std::vector<std::string> expected = {"b", "a", "c", "n1"};
  suite.require(order == expected, "new word cap respected");

  capped.new_word_cap = 0;
  order = SessionQueue::buildQueue(sampleProgress(), NOW, 0, capped);
  suite.require(order.size() == 3, "no new words with a zero cap");
}

void test_eligibility(TestSuite& suite) {
  auto all = sampleProgress();

  auto order = SessionQueue::buildQueue(all, NOW, 0);
  bool hasD = false;
  for (const auto& id : order) hasD = hasD || id == "d";
  suite.require(!hasD, "word not yet due is skipped");

  all[3].failed_in_session = true;
  all[3].retry_count = 1;
  order = SessionQueue::buildQueue(all, NOW, 0);
  std::vector<std::string> expected = {"b", "a", "c", "n1", "d", "n2"};
  suite.require(order == expected, "failed word is eligible for retry after due reviews");

  all[3].retry_count = 3;
  order = SessionQueue::buildQueue(all, NOW, 0);
  suite.require(order.size() == 5, "failed word past the retry cap waits for its due date");

  WordProgress noId = review("", -9);
  all.push_back(noId);
  all.push_back(review("a", -30));
  order = SessionQueue::buildQueue(all, NOW, 0);
  suite.require(order.size() == 5 && order[0] == "b", "records without id and duplicate ids ignored");
}

void test_mode_filter(TestSuite& suite) {
  auto all = sampleProgress();
  all[2].completed_modes_in_cycle = {PracticeMode::FLASHCARD};

  QueueOptions options;
  options.mode = PracticeMode::FLASHCARD;
  auto order = SessionQueue::buildQueue(all, NOW, 0, options);
  std::vector<std::string> expected = {"b", "c", "n1", "n2"};
  suite.require(order == expected, "word that already cleared the mode is skipped");

  options.mode = PracticeMode::FILLWORD;
  order = SessionQueue::buildQueue(all, NOW, 0, options);
  suite.require(order.size() == 5, "other modes keep the word");
}

void test_requeue_position(TestSuite& suite) {
  LearningSettings settings;
  SessionQueue queue({"w1", "w2", "w3", "w4", "w5", "w6"}, settings);

  suite.require(queue.peek() == std::string("w1"), "first word presented");
  suite.require(queue.onAnswer("w1", false) == AnswerDisposition::REQUEUED, "miss requeues");

  std::vector<std::string> expected = {"w2", "w3", "w4", "w1", "w5", "w6"};
  suite.require(queue.remaining() == expected, "missed word moves three places forward");

  queue.onAnswer("w2", true);
  queue.onAnswer("w3", true);
  queue.onAnswer("w4", true);
  suite.require(queue.onAnswer("w1", false) == AnswerDisposition::REQUEUED, "second miss requeues");
  expected = {"w5", "w6", "w1"};
  suite.require(queue.remaining() == expected, "requeue position capped at queue length");

  const SessionEntry* e = queue.context().find("w1");
  suite.require(e != nullptr && e->retries == 2 && e->failed, "session context tracks retries");
}

void test_retry_cap(TestSuite& suite) {
  LearningSettings settings;
  SessionQueue queue({"x", "y"}, settings);

  int presentationsOfX = 0;
  AnswerDisposition last = AnswerDisposition::DONE;
  int guard = 0;
  while (!queue.isComplete() && guard++ < 20) {
    auto id = queue.peek();
    if (*id == "x") {
      ++presentationsOfX;
      last = queue.onAnswer("x", false);
    } else {
      queue.onAnswer(*id, true);
    }
  }

  suite.require(presentationsOfX == 3, "word past the retry cap is not presented a fourth time");
  suite.require(last == AnswerDisposition::DEFERRED, "third miss defers the word");
  suite.require(queue.isComplete(), "queue exhausts");
  suite.require(queue.context().find("x")->retries == 3, "every miss counted");
}

void test_unqueued_answers(TestSuite& suite) {
  LearningSettings settings;
  SessionQueue queue({"a"}, settings);

  suite.require(queue.onAnswer("stranger", false) == AnswerDisposition::DEFERRED,
                "miss on a word outside the queue is deferred");
  std::vector<std::string> expected = {"a"};
  suite.require(queue.remaining() == expected, "word outside the queue never joins it");
  suite.require(queue.context().find("stranger")->failed, "miss still recorded for the session");

  queue.onAnswer("a", true);
  suite.require(queue.onAnswer("a", false) == AnswerDisposition::DEFERRED,
                "late miss on a finished word does not reopen the queue");
  suite.require(queue.isComplete(), "queue stays complete");
}

void test_no_requeue_setting(TestSuite& suite) {
  LearningSettings settings;
  settings.show_failed_words_in_session = false;
  SessionQueue queue({"x", "y"}, settings);

  suite.require(queue.onAnswer("x", false) == AnswerDisposition::DEFERRED,
                "failed words not shown again when disabled");
  suite.require(queue.size() == 1, "only the other word remains");
}

void test_termination(TestSuite& suite) {
  LearningSettings settings;
  SessionQueue queue({"a", "b"}, settings);

  suite.require(queue.onAnswer("a", true) == AnswerDisposition::DONE, "correct answer is done");
  suite.require(!queue.isComplete(), "queue open while words remain");
  queue.onAnswer("b", true);
  suite.require(queue.isComplete(), "queue complete once every word answered correctly");
  suite.require(!queue.peek().has_value(), "nothing left to present");
}

}  // namespace

int main() {
  Log::quiet();
  TestSuite suite;

  test_order_and_interleave(suite);
  test_idempotent(suite);
  test_limits(suite);
  test_eligibility(suite);
  test_mode_filter(suite);
  test_requeue_position(suite);
  test_retry_cap(suite);
  test_unqueued_answers(suite);
  test_no_requeue_setting(suite);
  test_termination(suite);

  if (suite.ok) {
    std::cout << "test_session_queue passed\n";
  }
  return suite.ok ? 0 : 1;
}
