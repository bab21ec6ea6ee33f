#include "../src/core/PracticeService.hpp"
#include "../src/core/Errors.hpp"
#include "../src/storage/ProgressStore.hpp"
#include "../src/utils/logging.hpp"

#include <iostream>
#include <stdexcept>
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

// Medium that goes away after a number of writes
class FailingStore : public MemoryProgressStore {
public:
  explicit FailingStore(int writesLeft) : writes_left(writesLeft) {}

  void updateProgress(const UpdateProgressRequest& request) override {
    if (writes_left-- <= 0) throw StoreUnavailable("disk gone");
    MemoryProgressStore::updateProgress(request);
  }

private:
  int writes_left;
};

PracticeResult result(const std::string& id, bool correct, PracticeMode mode) {
  PracticeResult r;
  r.vocabulary_id = id;
  r.word = id;
  r.correct = correct;
  r.mode = mode;
  r.time_spent_seconds = 4;
  return r;
}

StartSessionRequest request(PracticeMode mode, std::vector<VocabularyRef> vocabulary = {}) {
  StartSessionRequest r;
  r.collection_id = "basics";
  r.language = "de";
  r.mode = mode;
  r.vocabulary = std::move(vocabulary);
  return r;
}

void test_full_session(TestSuite& suite) {
  MemoryProgressStore store;
  LearningSettings settings;
  PracticeService service(store, settings);

  size_t queued = service.startSession(
      request(PracticeMode::FLASHCARD, {{"v1", "eins"}, {"v2", "zwei"}}), NOW);
  suite.require(queued == 2, "both new words queued");
  suite.require(store.listWordProgress("de").empty(), "records created only when answered");

  auto id = service.nextWord();
  suite.require(id && *id == "v1", "first word by id");
  AnswerReport r = service.recordAnswer(result("v1", true, PracticeMode::FLASHCARD), NOW + 5);
  suite.require(r.accepted && r.disposition == AnswerDisposition::DONE, "correct answer done");

  auto stored = store.getWordProgress("de", "v1");
  suite.require(stored && stored->total_reviews == 1, "answer persisted immediately");
  suite.require(stored && stored->completed_modes_in_cycle.count(PracticeMode::FLASHCARD) == 1,
                "cycle progress persisted");

  id = service.nextWord();
  r = service.recordAnswer(result(*id, false, PracticeMode::FLASHCARD), NOW + 10);
  suite.require(r.disposition == AnswerDisposition::REQUEUED, "miss requeued");
  suite.require(r.progress.failed_in_session && r.progress.retry_count == 1, "session flags on the result");
  stored = store.getWordProgress("de", "v2");
  suite.require(stored && !stored->failed_in_session && stored->retry_count == 0,
                "session flags never persisted");

  id = service.nextWord();
  suite.require(id && *id == "v2", "missed word comes back");
  r = service.recordAnswer(result("v2", true, PracticeMode::FLASHCARD), NOW + 15);
  suite.require(r.accepted, "retry accepted");
  suite.require(service.progressFor("v2")->retry_count == 1, "retry count kept for the session");

  r = service.recordAnswer(result("", true, PracticeMode::FLASHCARD), NOW + 16);
  suite.require(!r.accepted && !r.error.empty(), "answer without id rejected");
  suite.require(service.isComplete(), "queue exhausted");

  SessionReport report = service.finishSession(NOW + 120);
  suite.require(report.accepted == 3 && report.rejected == 1, "partial success counted");
  suite.require(report.session.total_questions == 3 && report.session.correct_answers == 2,
                "session totals from accepted answers");
  suite.require(report.session.duration_seconds == 120, "duration from session start");
  suite.require(report.aggregate.total_sessions == 1, "aggregate session count");
  suite.require(report.aggregate.total_words_practiced == 2, "requeued word counted once");
  suite.require(report.aggregate.current_streak == 1, "first day streak");
  suite.require(report.aggregate.words_progress.size() == 2, "aggregate carries word records");
  suite.require(!service.inSession(), "session closed");

  suite.require(store.listSessions("de", 0).size() == 1, "session stored");
  auto agg = store.getPracticeProgress("de");
  suite.require(agg && agg->total_sessions == 1, "aggregate stored");

  // v1 cleared flashcard only, so it is still open for the other modes
  queued = service.startSession(request(PracticeMode::FLASHCARD), NOW + 200);
  suite.require(queued == 0, "words that cleared this mode are not queued again");
  service.abandonSession();

  queued = service.startSession(request(PracticeMode::FILLWORD), NOW + 200);
  suite.require(queued == 1 && service.remaining()[0] == "v1", "open cycle word offered in another mode");
  service.abandonSession();
}

void test_validation_and_misuse(TestSuite& suite) {
  MemoryProgressStore store;
  LearningSettings settings;
  PracticeService service(store, settings);

  bool threw = false;
  try {
    StartSessionRequest r = request(PracticeMode::FLASHCARD);
    r.language.clear();
    service.startSession(r, NOW);
  } catch (const ValidationError&) {
    threw = true;
  }
  suite.require(threw, "session without language rejected");

  threw = false;
  try {
    service.recordAnswer(result("v1", true, PracticeMode::FLASHCARD), NOW);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  suite.require(threw, "answer outside a session is a usage error");

  service.startSession(request(PracticeMode::FLASHCARD, {{"v1", "eins"}}), NOW);
  AnswerReport stranger = service.recordAnswer(result("stranger", false, PracticeMode::FLASHCARD), NOW);
  suite.require(stranger.accepted && stranger.disposition == AnswerDisposition::DEFERRED,
                "miss on an unqueued word is scheduled but deferred");
  suite.require(service.remaining().size() == 1 && service.remaining()[0] == "v1",
                "unqueued word stays out of the session queue");

  AnswerReport r = service.recordAnswer(result("v1", true, static_cast<PracticeMode>(7)), NOW);
  suite.require(!r.accepted, "unknown mode rejected");
  suite.require(!store.getWordProgress("de", "v1"), "rejected answer not stored");
  suite.require(!service.isComplete(), "rejected answer leaves the word queued");
  service.abandonSession();
}

void test_store_failure_propagates(TestSuite& suite) {
  FailingStore store(1);
  LearningSettings settings;
  PracticeService service(store, settings);

  service.startSession(request(PracticeMode::FLASHCARD, {{"v1", "eins"}, {"v2", "zwei"}}), NOW);
  service.recordAnswer(result("v1", true, PracticeMode::FLASHCARD), NOW);

  bool threw = false;
  try {
    service.recordAnswer(result("v2", true, PracticeMode::FLASHCARD), NOW);
  } catch (const StoreUnavailable&) {
    threw = true;
  }
  suite.require(threw, "store failure reaches the caller");
  suite.require(service.remaining().size() == 1, "failed write leaves the word queued");
  suite.require(service.progressFor("v2")->total_reviews == 0, "failed write leaves the record as it was");
}

void test_submit_session(TestSuite& suite) {
  MemoryProgressStore store;
  LearningSettings settings;
  settings.algorithm = SrAlgorithm::MODIFIED_SM2;
  PracticeService service(store, settings);

  CreatePracticeSessionRequest req;
  req.collection_id = "basics";
  req.language = "de";
  req.mode = PracticeMode::FLASHCARD;
  req.duration_seconds = 90;
  req.results = {
      result("v3", true, PracticeMode::FLASHCARD),
      result("", true, PracticeMode::FLASHCARD),
      result("v3", true, PracticeMode::FILLWORD),
      result("v3", true, PracticeMode::MULTIPLECHOICE),
  };

  SessionReport report = service.submitSession(req, NOW, NOW + 90);
  suite.require(report.accepted == 3 && report.rejected == 1, "batch partial success counted");

  auto stored = store.getWordProgress("de", "v3");
  suite.require(stored && stored->leitner_box == 2 && stored->interval_days == 3,
                "batch answers chain through one record");
  suite.require(report.aggregate.total_words_practiced == 1, "batch word counted once");
  suite.require(report.session.duration_seconds == 90, "batch duration kept");
}

}  // namespace

int main() {
  Log::quiet();
  TestSuite suite;

  test_full_session(suite);
  test_validation_and_misuse(suite);
  test_store_failure_propagates(suite);
  test_submit_session(suite);

  if (suite.ok) {
    std::cout << "test_practice_service passed\n";
  }
  return suite.ok ? 0 : 1;
}
