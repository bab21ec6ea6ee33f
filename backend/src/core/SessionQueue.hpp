#pragma once
#include <ctime>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "WordProgress.hpp"
#include "LearningSettings.hpp"

// Per-word state that only lives for one session
struct SessionEntry {
    bool failed = false;
    int retries = 0;
    bool answered_correctly = false;
};

// Keyed by vocabulary id; cleared at session start, never persisted
class SessionContext {
public:
    void clear() { entries.clear(); }

    SessionEntry& entry(const std::string& vocabularyId) { return entries[vocabularyId]; }
    const SessionEntry* find(const std::string& vocabularyId) const;

    size_t size() const { return entries.size(); }

private:
    std::unordered_map<std::string, SessionEntry> entries;
};

struct QueueOptions {
    size_t new_word_cap = 20;
    size_t reviews_per_new_word = 3;
    int retry_cap = 3;
    // Skip words whose current cycle already contains this mode
    std::optional<PracticeMode> mode;

    static QueueOptions fromSettings(const LearningSettings& settings);
};

enum class AnswerDisposition {
    DONE,       // answered correctly, leaves the queue
    REQUEUED,   // missed, presented again later in this session
    DEFERRED    // missed past the retry cap, waits for its natural due date
};

class SessionQueue {
public:
    SessionQueue(std::vector<std::string> order, const LearningSettings& settings);

    /*
      Due reviews (longest overdue first, ties by ascending id) interleaved
      with up to new_word_cap never-practiced words, truncated to `limit`
      (0 = unlimited). Deterministic for the same input.
    */
    static std::vector<std::string> buildQueue(const std::vector<WordProgress>& all,
                                               std::time_t now,
                                               size_t limit,
                                               const QueueOptions& options = QueueOptions());

    bool isComplete() const { return pending.empty(); }
    std::optional<std::string> peek() const;
    size_t size() const { return pending.size(); }
    std::vector<std::string> remaining() const;

    // Only words still pending can be requeued; a miss on any other id is DEFERRED
    AnswerDisposition onAnswer(const std::string& vocabularyId, bool correct);

    const SessionContext& context() const { return session; }

private:
    std::deque<std::string> pending;
    SessionContext session;
    int retry_cap;
    int requeue_spacing;
    bool requeue_failed;
};
