#include "PracticeService.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>

PracticeService::PracticeService(ProgressStore& s, const LearningSettings& cfg)
    : store(s),
    settings(cfg),
    algorithm(makeAlgorithm(cfg))
{
}

size_t PracticeService::startSession(const StartSessionRequest& request, std::time_t now) {
    if (request.language.empty()) {
        throw ValidationError("practice session needs a language");
    }
    if (queue) {
        spdlog::warn("Starting a new session while another is open; unfinished words stay due");
    }

    current = request;
    working.clear();
    accepted_results.clear();
    rejected = 0;
    started_at = now;

    std::vector<WordProgress> stored = store.listWordProgress(request.language);

    if (request.vocabulary.empty()) {
        for (auto& p : stored) working[p.vocabulary_id] = p;
    }
    else {
        std::map<std::string, WordProgress> byId;
        for (auto& p : stored) byId[p.vocabulary_id] = p;

        for (const auto& v : request.vocabulary) {
            if (v.vocabulary_id.empty()) {
                spdlog::warn("Skipping vocabulary '{}' without id", v.word);
                continue;
            }
            auto it = byId.find(v.vocabulary_id);
            working[v.vocabulary_id] = it != byId.end()
                ? it->second
                : createInitialWordProgress(v.vocabulary_id, v.word, now);
        }
    }

    std::vector<WordProgress> candidates;
    candidates.reserve(working.size());
    for (auto& p : working) {
        p.second.resetSessionFlags();
        candidates.push_back(p.second);
    }

    QueueOptions options = QueueOptions::fromSettings(settings);
    if (request.filter_by_mode) options.mode = request.mode;

    auto order = SessionQueue::buildQueue(candidates, now,
        static_cast<size_t>(std::max(0, settings.daily_review_limit)), options);
    queue.emplace(std::move(order), settings);

    spdlog::info("Practice session [{}] {} started: {} candidate(s), {} queued",
        request.language, modeToString(request.mode), candidates.size(), queue->size());
    return queue->size();
}

std::optional<std::string> PracticeService::nextWord() {
    if (!queue) return std::nullopt;
    return queue->peek();
}

const WordProgress* PracticeService::progressFor(const std::string& vocabularyId) const {
    auto it = working.find(vocabularyId);
    return it == working.end() ? nullptr : &it->second;
}

std::vector<std::string> PracticeService::remaining() const {
    if (!queue) return {};
    return queue->remaining();
}

WordProgress PracticeService::scheduleOne(const std::string& language, const WordProgress& progress,
                                          const PracticeResult& result, std::time_t now) {
    AnswerOutcome outcome;
    outcome.correct = result.correct;
    outcome.mode = result.mode;
    outcome.answered_at = now;
    outcome.time_spent_seconds = std::max(0, result.time_spent_seconds);

    WordProgress next = algorithm->advance(progress, outcome);

    UpdateProgressRequest update;
    update.language = language;
    update.correct = result.correct;
    update.progress = next;
    store.updateProgress(update);

    return next;
}

AnswerReport PracticeService::recordAnswer(const PracticeResult& result, std::time_t now) {
    if (!queue) {
        throw std::runtime_error("recordAnswer() called without an active session");
    }

    AnswerReport report;
    try {
        if (result.vocabulary_id.empty()) {
            throw ValidationError("answer without vocabulary id");
        }

        auto it = working.find(result.vocabulary_id);
        WordProgress base = it != working.end()
            ? it->second
            : createInitialWordProgress(result.vocabulary_id, result.word, now);

        WordProgress next = scheduleOne(current.language, base, result, now);

        report.disposition = queue->onAnswer(result.vocabulary_id, result.correct);
        const SessionEntry* entry = queue->context().find(result.vocabulary_id);
        if (entry) {
            next.failed_in_session = entry->failed;
            next.retry_count = entry->retries;
        }

        working[result.vocabulary_id] = next;
        accepted_results.push_back(result);

        report.accepted = true;
        report.progress = next;
    }
    catch (const ValidationError& e) {
        ++rejected;
        report.accepted = false;
        report.error = e.what();
        spdlog::warn("Rejected answer for '{}': {}", result.vocabulary_id, e.what());
    }
    return report;
}

SessionReport PracticeService::applyStats(const CreatePracticeSessionRequest& request, int rejectedCount,
                                          std::time_t startedAt, std::time_t now) {
    PracticeSession session = makeSession(request, startedAt, now);

    UserPracticeProgress aggregate;
    aggregate.language = request.language;
    if (auto existing = store.getPracticeProgress(request.language)) {
        aggregate = *existing;
    }

    UserPracticeProgress applied = StatsAggregator::applySession(aggregate, session,
        CalendarDate::fromLocalTime(now));

    store.savePracticeProgress(applied);
    store.addSession(session);

    applied.words_progress = store.listWordProgress(request.language);

    SessionReport report;
    report.accepted = static_cast<int>(session.results.size());
    report.rejected = rejectedCount;
    report.session = session;
    report.aggregate = applied;

    if (rejectedCount > 0) {
        spdlog::warn("Session [{}] finished with {} of {} answer(s) rejected",
            request.language, rejectedCount, rejectedCount + report.accepted);
    }
    return report;
}

SessionReport PracticeService::finishSession(std::time_t now) {
    if (!queue) {
        throw std::runtime_error("finishSession() called without an active session");
    }
    if (!queue->isComplete()) {
        spdlog::info("Session ended early with {} word(s) left", queue->size());
    }

    CreatePracticeSessionRequest request;
    request.collection_id = current.collection_id;
    request.mode = current.mode;
    request.language = current.language;
    request.topic = current.topic;
    request.level = current.level;
    request.results = accepted_results;
    request.duration_seconds = static_cast<int>(std::max<std::time_t>(0, now - started_at));

    SessionReport report = applyStats(request, rejected, started_at, now);
    abandonSession();
    return report;
}

void PracticeService::abandonSession() {
    queue.reset();
    working.clear();
    accepted_results.clear();
    rejected = 0;
}

SessionReport PracticeService::submitSession(const CreatePracticeSessionRequest& request,
                                             std::time_t startedAt, std::time_t now) {
    if (request.language.empty()) {
        throw ValidationError("practice session needs a language");
    }

    std::map<std::string, WordProgress> touched;
    CreatePracticeSessionRequest accepted = request;
    accepted.results.clear();
    int dropped = 0;

    for (const auto& r : request.results) {
        try {
            if (r.vocabulary_id.empty()) {
                throw ValidationError("answer without vocabulary id");
            }

            auto it = touched.find(r.vocabulary_id);
            WordProgress base;
            if (it != touched.end()) {
                base = it->second;
            }
            else if (auto stored = store.getWordProgress(request.language, r.vocabulary_id)) {
                base = *stored;
                base.resetSessionFlags();
            }
            else {
                base = createInitialWordProgress(r.vocabulary_id, r.word, now);
            }

            touched[r.vocabulary_id] = scheduleOne(request.language, base, r, now);
            accepted.results.push_back(r);
        }
        catch (const ValidationError& e) {
            ++dropped;
            spdlog::warn("Rejected answer for '{}': {}", r.vocabulary_id, e.what());
        }
    }

    return applyStats(accepted, dropped, startedAt, now);
}
