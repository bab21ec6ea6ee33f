#include "PracticeMode.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <spdlog/spdlog.h>

const std::vector<PracticeMode>& allPracticeModes() {
    static const std::vector<PracticeMode> modes = {
        PracticeMode::FLASHCARD,
        PracticeMode::FILLWORD,
        PracticeMode::MULTIPLECHOICE
    };
    return modes;
}

bool isKnownMode(PracticeMode mode) {
    const auto& modes = allPracticeModes();
    return std::find(modes.begin(), modes.end(), mode) != modes.end();
}

PracticeMode parseMode(const std::string& text) {
    std::string t = text;
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();

    if (t == "flashcard") return PracticeMode::FLASHCARD;
    if (t == "fillword") return PracticeMode::FILLWORD;
    if (t == "multiplechoice") return PracticeMode::MULTIPLECHOICE;

    throw ValidationError("unrecognized practice mode '" + text + "'");
}

std::string modeToString(PracticeMode mode) {
    switch (mode) {
    case PracticeMode::FLASHCARD: return "flashcard";
    case PracticeMode::FILLWORD: return "fillword";
    case PracticeMode::MULTIPLECHOICE: return "multiplechoice";
    }
    return "unknown";
}

std::string modesAsLine(const ModeSet& modes) {
    std::ostringstream oss;
    bool first = true;
    for (auto m : modes) {
        if (!first) oss << ",";
        oss << modeToString(m);
        first = false;
    }
    return oss.str();
}

ModeSet modesFromLine(const std::string& line) {
    ModeSet out;
    std::istringstream iss(line);
    std::string token;
    while (std::getline(iss, token, ',')) {
        if (token.empty()) continue;
        try {
            out.insert(parseMode(token));
        }
        catch (const ValidationError& e) {
            // records written by a newer client may carry modes we don't know
            spdlog::warn("Dropping mode from stored cycle: {}", e.what());
        }
    }
    return out;
}
