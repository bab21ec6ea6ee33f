#pragma once
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include "PracticeMode.hpp"
#include "WordProgress.hpp"

struct PracticeResult {
    std::string vocabulary_id;
    std::string word;
    bool correct = false;
    PracticeMode mode = PracticeMode::FLASHCARD;
    int time_spent_seconds = 0;
};

// Immutable once completed. Results are not deduplicated: a requeued word
// appears once per answer given.
struct PracticeSession {
    std::string collection_id;
    PracticeMode mode = PracticeMode::FLASHCARD;
    std::string language;
    std::optional<std::string> topic;
    std::optional<std::string> level;
    std::vector<PracticeResult> results;
    int total_questions = 0;
    int correct_answers = 0;
    std::time_t started_at = 0;
    std::time_t completed_at = 0;
    int duration_seconds = 0;

    // total_questions / correct_answers from results
    void recount();
};

// Submitted by the UI once per completed session
struct CreatePracticeSessionRequest {
    std::string collection_id;
    PracticeMode mode = PracticeMode::FLASHCARD;
    std::string language;
    std::optional<std::string> topic;
    std::optional<std::string> level;
    std::vector<PracticeResult> results;
    int duration_seconds = 0;
};

// One per word touched; exactly the engine output shape
struct UpdateProgressRequest {
    std::string language;
    bool correct = false;
    WordProgress progress;
};

PracticeSession makeSession(const CreatePracticeSessionRequest& request,
                            std::time_t startedAt, std::time_t completedAt);
