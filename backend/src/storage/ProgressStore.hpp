#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "../core/WordProgress.hpp"
#include "../core/PracticeSession.hpp"
#include "../core/StatsAggregator.hpp"

// Durable record store keyed by (language, vocabulary id). The engine only
// talks to this interface; implementations throw StoreUnavailable when the
// medium fails.
class ProgressStore {
public:
    virtual ~ProgressStore() = default;

    virtual std::optional<WordProgress> getWordProgress(const std::string& language,
                                                        const std::string& vocabularyId) const = 0;
    virtual std::vector<WordProgress> listWordProgress(const std::string& language) const = 0;
    virtual void updateProgress(const UpdateProgressRequest& request) = 0;

    // Aggregate with words_progress filled in; nullopt before the first session
    virtual std::optional<UserPracticeProgress> getPracticeProgress(const std::string& language) const = 0;
    virtual void savePracticeProgress(const UserPracticeProgress& progress) = 0;

    virtual void addSession(const PracticeSession& session) = 0;
    // Most recent first; limit 0 = all
    virtual std::vector<PracticeSession> listSessions(const std::string& language, size_t limit) const = 0;

    virtual std::vector<std::string> languages() const = 0;
};

struct StoreData {
    std::map<std::string, std::map<std::string, WordProgress>> words;  // language -> id -> record
    std::map<std::string, UserPracticeProgress> aggregates;           // words_progress left empty
    std::vector<PracticeSession> sessions;
};

class MemoryProgressStore : public ProgressStore {
public:
    std::optional<WordProgress> getWordProgress(const std::string& language,
                                                const std::string& vocabularyId) const override;
    std::vector<WordProgress> listWordProgress(const std::string& language) const override;
    void updateProgress(const UpdateProgressRequest& request) override;

    std::optional<UserPracticeProgress> getPracticeProgress(const std::string& language) const override;
    void savePracticeProgress(const UserPracticeProgress& progress) override;

    void addSession(const PracticeSession& session) override;
    std::vector<PracticeSession> listSessions(const std::string& language, size_t limit) const override;

    std::vector<std::string> languages() const override;

    const StoreData& snapshot() const { return data; }
    void restore(StoreData d) { data = std::move(d); }

protected:
    StoreData data;
};
