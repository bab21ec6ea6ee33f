#include "PracticeSession.hpp"
#include <algorithm>

void PracticeSession::recount() {
    total_questions = static_cast<int>(results.size());
    correct_answers = static_cast<int>(std::count_if(results.begin(), results.end(),
        [](const PracticeResult& r) { return r.correct; }));
}

PracticeSession makeSession(const CreatePracticeSessionRequest& request,
                            std::time_t startedAt, std::time_t completedAt) {
    PracticeSession s;
    s.collection_id = request.collection_id;
    s.mode = request.mode;
    s.language = request.language;
    s.topic = request.topic;
    s.level = request.level;
    s.results = request.results;
    s.started_at = startedAt;
    s.completed_at = completedAt;
    s.duration_seconds = std::max(0, request.duration_seconds);
    s.recount();
    return s;
}
