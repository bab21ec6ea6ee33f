#pragma once
#include <ctime>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "LearningSettings.hpp"
#include "PracticeSession.hpp"
#include "Scheduler.hpp"
#include "SessionQueue.hpp"
#include "StatsAggregator.hpp"
#include "../storage/ProgressStore.hpp"

// A word offered by the collection side; progress is created lazily
struct VocabularyRef {
    std::string vocabulary_id;
    std::string word;
};

struct StartSessionRequest {
    std::string collection_id;
    std::string language;
    PracticeMode mode = PracticeMode::FLASHCARD;
    std::optional<std::string> topic;
    std::optional<std::string> level;
    // Candidate words; empty means every word with stored progress
    std::vector<VocabularyRef> vocabulary;
    // Skip words that already cleared `mode` in their current cycle
    bool filter_by_mode = true;
};

struct AnswerReport {
    bool accepted = false;
    AnswerDisposition disposition = AnswerDisposition::DONE;
    WordProgress progress;
    std::string error;
};

struct SessionReport {
    int accepted = 0;
    int rejected = 0;     // answers dropped by validation
    PracticeSession session;
    UserPracticeProgress aggregate;
};

/*
  Runs one practice session against a ProgressStore:
    startSession -> nextWord / recordAnswer ... -> finishSession
  Each accepted answer is persisted immediately, so an interrupted session
  keeps what was already scheduled. StoreUnavailable is propagated to the
  caller untouched.
*/
class PracticeService {
public:
    PracticeService(ProgressStore& store, const LearningSettings& settings);

    // Returns the number of queued words
    size_t startSession(const StartSessionRequest& request, std::time_t now);

    bool inSession() const { return queue.has_value(); }
    bool isComplete() const { return !queue || queue->isComplete(); }

    std::optional<std::string> nextWord();
    const WordProgress* progressFor(const std::string& vocabularyId) const;
    std::vector<std::string> remaining() const;

    AnswerReport recordAnswer(const PracticeResult& result, std::time_t now);

    SessionReport finishSession(std::time_t now);

    // Drops the open session without recording it; stored progress stays
    void abandonSession();

    // Batch path: the UI already collected all results
    SessionReport submitSession(const CreatePracticeSessionRequest& request,
                                std::time_t startedAt, std::time_t now);

    const SchedulingAlgorithm& scheduler() const { return *algorithm; }

private:
    ProgressStore& store;
    LearningSettings settings;
    std::unique_ptr<SchedulingAlgorithm> algorithm;

    std::optional<SessionQueue> queue;
    std::map<std::string, WordProgress> working;
    StartSessionRequest current;
    std::vector<PracticeResult> accepted_results;
    int rejected = 0;
    std::time_t started_at = 0;

    // Advances and persists one answer; throws ValidationError
    WordProgress scheduleOne(const std::string& language, const WordProgress& progress,
                             const PracticeResult& result, std::time_t now);

    SessionReport applyStats(const CreatePracticeSessionRequest& request, int rejectedCount,
                             std::time_t startedAt, std::time_t now);
};
