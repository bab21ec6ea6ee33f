#include "ProgressStore.hpp"
#include "../core/Errors.hpp"
#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>

namespace {
    // Records are written one text field per line
    void requireSingleLine(const std::string& value, const char* field) {
        if (value.find_first_of("\r\n") != std::string::npos) {
            throw ValidationError(std::string(field) + " must not contain line breaks");
        }
    }

    void requireSingleLine(const std::optional<std::string>& value, const char* field) {
        if (value) requireSingleLine(*value, field);
    }
}

std::optional<WordProgress> MemoryProgressStore::getWordProgress(const std::string& language,
                                                                 const std::string& vocabularyId) const {
    auto lang = data.words.find(language);
    if (lang == data.words.end()) return std::nullopt;

    auto it = lang->second.find(vocabularyId);
    if (it == lang->second.end()) return std::nullopt;
    return it->second;
}

std::vector<WordProgress> MemoryProgressStore::listWordProgress(const std::string& language) const {
    std::vector<WordProgress> out;
    auto lang = data.words.find(language);
    if (lang == data.words.end()) return out;

    out.reserve(lang->second.size());
    for (const auto& p : lang->second) out.push_back(p.second);
    return out;
}

void MemoryProgressStore::updateProgress(const UpdateProgressRequest& request) {
    if (request.language.empty() || request.progress.vocabulary_id.empty()) {
        throw ValidationError("progress update needs a language and a vocabulary id");
    }
    requireSingleLine(request.language, "language");
    requireSingleLine(request.progress.vocabulary_id, "vocabulary id");
    requireSingleLine(request.progress.word, "word");

    WordProgress stored = request.progress;
    stored.resetSessionFlags(); // session state is never persisted
    data.words[request.language][stored.vocabulary_id] = stored;

    spdlog::debug("Stored progress '{}' [{}]: box={}, interval={}d",
        stored.vocabulary_id, request.language, stored.leitner_box, stored.interval_days);
}

std::optional<UserPracticeProgress> MemoryProgressStore::getPracticeProgress(const std::string& language) const {
    auto it = data.aggregates.find(language);
    if (it == data.aggregates.end()) return std::nullopt;

    UserPracticeProgress out = it->second;
    out.words_progress = listWordProgress(language);
    return out;
}

void MemoryProgressStore::savePracticeProgress(const UserPracticeProgress& progress) {
    if (progress.language.empty()) {
        throw ValidationError("practice progress has no language");
    }
    requireSingleLine(progress.language, "language");
    for (const auto& id : progress.practiced_ids) requireSingleLine(id, "practiced id");
    UserPracticeProgress stored = progress;
    stored.words_progress.clear(); // kept per word
    data.aggregates[progress.language] = std::move(stored);
}

void MemoryProgressStore::addSession(const PracticeSession& session) {
    requireSingleLine(session.collection_id, "collection id");
    requireSingleLine(session.language, "language");
    requireSingleLine(session.topic, "topic");
    requireSingleLine(session.level, "level");
    for (const auto& r : session.results) {
        requireSingleLine(r.vocabulary_id, "vocabulary id");
        requireSingleLine(r.word, "word");
    }

    data.sessions.push_back(session);
    spdlog::debug("Stored session for '{}' with {} result(s)", session.language, session.results.size());
}

std::vector<PracticeSession> MemoryProgressStore::listSessions(const std::string& language, size_t limit) const {
    std::vector<PracticeSession> out;
    for (const auto& s : data.sessions) {
        if (s.language == language) out.push_back(s);
    }

    std::stable_sort(out.begin(), out.end(), [](const PracticeSession& a, const PracticeSession& b) {
        return a.started_at > b.started_at;
    });

    if (limit > 0 && out.size() > limit) out.resize(limit);
    return out;
}

std::vector<std::string> MemoryProgressStore::languages() const {
    std::set<std::string> langs;
    for (const auto& p : data.words) langs.insert(p.first);
    for (const auto& p : data.aggregates) langs.insert(p.first);
    return std::vector<std::string>(langs.begin(), langs.end());
}
