#include "SessionQueue.hpp"
#include <algorithm>
#include <cstddef>
#include <unordered_set>
#include <spdlog/spdlog.h>

const SessionEntry* SessionContext::find(const std::string& vocabularyId) const {
    auto it = entries.find(vocabularyId);
    if (it == entries.end()) return nullptr;
    return &it->second;
}

QueueOptions QueueOptions::fromSettings(const LearningSettings& settings) {
    QueueOptions o;
    o.new_word_cap = static_cast<size_t>(std::max(0, settings.new_words_per_session));
    o.reviews_per_new_word = static_cast<size_t>(std::max(1, settings.reviews_per_new_word));
    o.retry_cap = std::max(1, settings.session_retry_cap);
    return o;
}

SessionQueue::SessionQueue(std::vector<std::string> order, const LearningSettings& settings)
    : pending(order.begin(), order.end()),
    retry_cap(std::max(1, settings.session_retry_cap)),
    requeue_spacing(std::max(1, settings.requeue_spacing)),
    requeue_failed(settings.show_failed_words_in_session)
{
    spdlog::info("Session queue started with {} word(s)", pending.size());
}

std::vector<std::string> SessionQueue::buildQueue(const std::vector<WordProgress>& all,
                                                  std::time_t now,
                                                  size_t limit,
                                                  const QueueOptions& options) {
    std::vector<const WordProgress*> reviews;
    std::vector<const WordProgress*> fresh;
    std::unordered_set<std::string> seen;

    for (const auto& p : all) {
        if (p.vocabulary_id.empty()) {
            spdlog::warn("Skipping progress record without vocabulary id ('{}')", p.word);
            continue;
        }
        if (!seen.insert(p.vocabulary_id).second) continue;

        if (options.mode && p.completed_modes_in_cycle.count(*options.mode)) continue;

        bool retryable = p.failed_in_session && p.retry_count < options.retry_cap;

        if (p.isNew() && !p.failed_in_session) {
            fresh.push_back(&p);
        }
        else if (p.isDue(now) || retryable) {
            reviews.push_back(&p);
        }
    }

    auto byOverdue = [now](const WordProgress* a, const WordProgress* b) {
        std::time_t oa = a->overdueBy(now);
        std::time_t ob = b->overdueBy(now);
        if (oa != ob) return oa > ob;
        return a->vocabulary_id < b->vocabulary_id;
    };
    std::sort(reviews.begin(), reviews.end(), byOverdue);
    std::sort(fresh.begin(), fresh.end(), byOverdue);

    if (fresh.size() > options.new_word_cap) fresh.resize(options.new_word_cap);

    // one new word after every `reviews_per_new_word` reviews
    std::vector<std::string> order;
    order.reserve(reviews.size() + fresh.size());

    size_t step = std::max<size_t>(1, options.reviews_per_new_word);
    size_t r = 0, n = 0;
    while (r < reviews.size() || n < fresh.size()) {
        for (size_t k = 0; k < step && r < reviews.size(); ++k) {
            order.push_back(reviews[r++]->vocabulary_id);
        }
        if (n < fresh.size()) {
            order.push_back(fresh[n++]->vocabulary_id);
        }
    }

    if (limit > 0 && order.size() > limit) order.resize(limit);

    spdlog::debug("buildQueue: {} review(s), {} new, {} queued", reviews.size(), fresh.size(), order.size());
    return order;
}

std::optional<std::string> SessionQueue::peek() const {
    if (pending.empty()) return std::nullopt;
    return pending.front();
}

std::vector<std::string> SessionQueue::remaining() const {
    return std::vector<std::string>(pending.begin(), pending.end());
}

/*
  A miss puts the word back min(retries * spacing, remaining) positions
  forward so other words come first. Once it has been missed retry_cap
  times it is dropped from this session (with the default cap of 3 a word
  is never presented a fourth time).
*/
AnswerDisposition SessionQueue::onAnswer(const std::string& vocabularyId, bool correct) {
    auto it = std::find(pending.begin(), pending.end(), vocabularyId);
    bool queued = it != pending.end();
    if (queued) {
        pending.erase(it);
    }
    else {
        spdlog::debug("Answer for '{}' which is not queued", vocabularyId);
    }

    SessionEntry& e = session.entry(vocabularyId);

    if (correct) {
        e.answered_correctly = true;
        return AnswerDisposition::DONE;
    }

    e.failed = true;
    e.retries++;

    if (!queued) {
        return AnswerDisposition::DEFERRED;
    }

    if (!requeue_failed || e.retries >= retry_cap) {
        spdlog::info("Word '{}' deferred after {} miss(es) this session", vocabularyId, e.retries);
        return AnswerDisposition::DEFERRED;
    }

    size_t pos = std::min(static_cast<size_t>(e.retries) * static_cast<size_t>(requeue_spacing), pending.size());
    pending.insert(pending.begin() + static_cast<std::ptrdiff_t>(pos), vocabularyId);

    spdlog::debug("Word '{}' requeued at position {} (retry {})", vocabularyId, pos, e.retries);
    return AnswerDisposition::REQUEUED;
}
