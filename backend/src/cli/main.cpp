#include <iostream>
#include <vector>
#include <string>
#include <sodium.h>
#include <algorithm>
#include <chrono>
#include <ctime>
#include <limits>

#include "../utils/logging.hpp"
#include "../core/Errors.hpp"
#include "../core/LearningStats.hpp"
#include "../core/PracticeService.hpp"
#include "../storage/Storage.hpp"

const std::string STORE_FILE = "vocabra.dat";
const std::string SETTINGS_FILE = "settings.txt";

int readChoice() {
    int choice;
    if (!(std::cin >> choice)) {
        std::cin.clear();
        std::string dummy; std::getline(std::cin, dummy);
        return -1;
    }
    std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
    return choice;
}

std::string readLine(const std::string& prompt) {
    std::cout << prompt;
    std::string line;
    std::getline(std::cin, line);
    return line;
}

std::string formatTime(std::time_t t) {
    if (t <= 0) return "-";
    return CalendarDate::fromLocalTime(t).toString();
}

void listWords(const std::vector<WordProgress>& words) {
    std::cout << "\n===== WORDS =====\n";

    if (words.empty()) {
        std::cout << "No words stored.\n";
        return;
    }

    for (size_t i = 0; i < words.size(); i++) {
        const WordProgress& w = words[i];
        std::cout << i + 1 << ". " << w.word << " [" << w.vocabulary_id << "] "
            << statusToString(wordStatus(w)) << "\n";
        std::cout << "   Box: " << w.leitner_box << "\n";
        std::cout << "   Interval: " << w.interval_days << " days\n";
        std::cout << "   Ease: " << w.easiness_factor << "\n";
        std::cout << "   Correct/Incorrect: " << w.correct_count << "/" << w.incorrect_count << "\n";
        std::cout << "   Modes this cycle: "
            << (w.completed_modes_in_cycle.empty() ? "(none)" : modesAsLine(w.completed_modes_in_cycle)) << "\n";
        std::cout << "   Next review: " << formatTime(w.next_review) << "\n";
        std::cout << "-----------------------------\n";
    }
}

void showStats(ProgressStore& store, const LearningSettings& settings, const std::string& language) {
    auto words = store.listWordProgress(language);
    LearningStats s = learningStats(words, settings, std::time(nullptr));

    std::cout << "\n===== STATS [" << language << "] =====\n"
        << "Total words: " << s.total_words << "\n"
        << "Due today: " << s.words_due_today << "\n"
        << "New: " << s.new_words << "  Learning: " << s.learning_words
        << "  Mastered: " << s.mastered_words << "\n"
        << "Average box: " << s.average_box << "\n"
        << "Mastery: " << s.mastery_percentage << "%\n";

    std::cout << "\nBoxes:\n";
    auto info = boxInfo(settings);
    auto dist = boxDistribution(words, settings);
    for (size_t i = 0; i < dist.size() && i < info.size(); ++i) {
        std::cout << "  " << info[i].box_number << ". " << info[i].name
            << " (" << info[i].interval_days << "d): "
            << dist[i].word_count << " word(s), " << dist[i].percentage << "%\n";
    }

    if (auto agg = store.getPracticeProgress(language)) {
        std::cout << "\nSessions: " << agg->total_sessions
            << "\nWords practiced: " << agg->total_words_practiced
            << "\nStreak: " << agg->current_streak << " (longest " << agg->longest_streak << ")"
            << "\nLast practice: " << (agg->last_practice_date ? agg->last_practice_date->toString() : "-")
            << "\n";
    }

    auto recent = store.listSessions(language, 5);
    if (!recent.empty()) {
        std::cout << "\nRecent sessions:\n";
        for (const auto& s2 : recent) {
            std::cout << "  " << formatTime(s2.completed_at) << " " << modeToString(s2.mode)
                << " " << s2.correct_answers << "/" << s2.total_questions << "\n";
        }
    }
}

void practice(PracticeService& service, const std::string& language) {
    PracticeMode mode = PracticeMode::FLASHCARD;
    try {
        mode = parseMode(readLine("Mode (flashcard/fillword/multiplechoice): "));
    }
    catch (const ValidationError& e) {
        std::cout << e.what() << "\n";
        return;
    }

    StartSessionRequest request;
    request.collection_id = "cli";
    request.language = language;
    request.mode = mode;

    size_t queued = service.startSession(request, std::time(nullptr));
    if (queued == 0) {
        std::cout << "Nothing due for " << modeToString(mode) << ".\n";
        service.abandonSession();
        return;
    }

    while (!service.isComplete()) {
        auto id = service.nextWord();
        if (!id) break;

        const WordProgress* p = service.progressFor(*id);
        std::string word = p ? p->word : *id;

        std::cout << "\n[" << modeToString(mode) << "] " << word
            << "  (" << service.remaining().size() << " left)\n";

        auto shown = std::chrono::steady_clock::now();
        std::string answer = readLine("Did you get it right? (y/n, q to stop): ");
        if (answer == "q") break;

        PracticeResult result;
        result.vocabulary_id = *id;
        result.word = word;
        result.correct = (answer == "y" || answer == "Y");
        result.mode = mode;
        result.time_spent_seconds = static_cast<int>(std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - shown).count());

        AnswerReport r = service.recordAnswer(result, std::time(nullptr));
        if (!r.accepted) {
            std::cout << "Answer not recorded: " << r.error << "\n";
            continue;
        }

        if (r.disposition == AnswerDisposition::REQUEUED) std::cout << "You will see it again shortly.\n";
        else if (r.disposition == AnswerDisposition::DEFERRED) std::cout << "Moved to a later session.\n";
        else if (r.progress.completed_modes_in_cycle.empty()) {
            std::cout << "All modes cleared. Next review in " << r.progress.interval_days << " day(s).\n";
        }
        else std::cout << "Correct.\n";
    }

    SessionReport report = service.finishSession(std::time(nullptr));
    std::cout << "\nSession done: " << report.session.correct_answers << "/"
        << report.session.total_questions << " correct, streak "
        << report.aggregate.current_streak << " day(s).\n";
    if (report.rejected > 0) {
        std::cout << report.rejected << " answer(s) could not be recorded.\n";
    }
}

int main() {
    if (sodium_init() < 0) {
        std::cerr << "Failed to initialize libsodium\n";
        return 1;
    }

    Log::init();

    LearningSettings settings;
    Storage::loadSettings(settings, SETTINGS_FILE);

    EncryptedFileStore store(STORE_FILE);

    while (!store.isOpen()) {
        std::string passphrase = readLine("Passphrase for " + STORE_FILE + " (empty to exit): ");
        if (passphrase.empty()) return 0;
        try {
            store.open(passphrase);
        }
        catch (const StoreUnavailable& e) {
            std::cout << "Could not open store: " << e.what() << "\n";
        }
    }

    std::string language = readLine("Language: ");
    if (language.empty()) language = "default";

    PracticeService service(store, settings);

    // MAIN LOOP
    while (true) {
        std::cout << "\n===== MAIN MENU =====\n"
            "Language: " << language << "  Algorithm: " << service.scheduler().name() << "\n"
            "1. Add Word\n"
            "2. Practice\n"
            "3. List Words\n"
            "4. Stats\n"
            "5. Switch Language\n"
            "6. Save & Exit\n> ";

        int choice = readChoice();

        try {
            if (choice == 1) {
                std::string id = readLine("Vocabulary id: ");
                std::string word = readLine("Word: ");
                if (id.empty() || word.empty()) { std::cout << "Id and word required.\n"; continue; }
                if (store.getWordProgress(language, id)) { std::cout << "Already exists.\n"; continue; }

                UpdateProgressRequest req;
                req.language = language;
                req.progress = createInitialWordProgress(id, word, std::time(nullptr));
                store.updateProgress(req);
                std::cout << "Word added.\n";
            }
            else if (choice == 2) {
                practice(service, language);
            }
            else if (choice == 3) {
                listWords(store.listWordProgress(language));
            }
            else if (choice == 4) {
                showStats(store, settings, language);
            }
            else if (choice == 5) {
                std::string next = readLine("Language: ");
                if (!next.empty()) language = next;
            }
            else if (choice == 6) {
                store.flush();
                store.close();
                if (!Storage::saveSettings(settings, SETTINGS_FILE))
                    std::cout << "Error saving settings.\n";
                std::cout << "Goodbye!\n";
                break;
            }
        }
        catch (const StoreUnavailable& e) {
            spdlog::error("Store failure: {}", e.what());
            std::cout << "Storage error: " << e.what() << "\n";
        }
        catch (const ValidationError& e) {
            std::cout << "Invalid input: " << e.what() << "\n";
        }
    }

    return 0;
}
