#pragma once
#include <set>
#include <string>
#include <vector>

enum class PracticeMode {
    FLASHCARD,
    FILLWORD,
    MULTIPLECHOICE
};

// Modes completed correctly in the current review cycle
using ModeSet = std::set<PracticeMode>;

// All modes a word must clear before its schedule advances
const std::vector<PracticeMode>& allPracticeModes();

bool isKnownMode(PracticeMode mode);

// "flashcard" | "fillword" | "multiplechoice"; throws ValidationError otherwise
PracticeMode parseMode(const std::string& text);
std::string modeToString(PracticeMode mode);

// CSV single line for storage, e.g. "flashcard,fillword"
std::string modesAsLine(const ModeSet& modes);
ModeSet modesFromLine(const std::string& line);
