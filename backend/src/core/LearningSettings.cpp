#include "LearningSettings.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

std::string algorithmToString(SrAlgorithm algorithm) {
    switch (algorithm) {
    case SrAlgorithm::SM2: return "sm2";
    case SrAlgorithm::MODIFIED_SM2: return "modifiedsm2";
    case SrAlgorithm::SIMPLE: return "simple";
    }
    return "sm2";
}

SrAlgorithm algorithmFromString(const std::string& name) {
    if (name == "sm2") return SrAlgorithm::SM2;
    if (name == "modifiedsm2") return SrAlgorithm::MODIFIED_SM2;
    if (name == "simple") return SrAlgorithm::SIMPLE;

    spdlog::warn("Unknown algorithm '{}', defaulting to sm2", name);
    return SrAlgorithm::SM2;
}

const std::vector<int>& boxIntervalPreset(int boxCount) {
    static const std::vector<int> three = { 1, 7, 30 };
    static const std::vector<int> five = { 1, 3, 7, 14, 30 };
    static const std::vector<int> seven = { 1, 2, 4, 7, 14, 30, 60 };

    if (boxCount <= 3) return three;
    if (boxCount >= 7) return seven;
    return five;
}

int LearningSettings::boxInterval(int box) const {
    const auto& preset = boxIntervalPreset(leitner_box_count);
    int index = std::clamp(box, 1, static_cast<int>(preset.size())) - 1;
    return preset[static_cast<size_t>(index)];
}

std::string LearningSettings::serialize() const {
    std::ostringstream oss;
    oss << "sr_algorithm:" << algorithmToString(algorithm) << "\n"
        << "leitner_box_count:" << leitner_box_count << "\n"
        << "show_failed_words_in_session:" << (show_failed_words_in_session ? "true" : "false") << "\n"
        << "new_words_per_session:" << new_words_per_session << "\n"
        << "daily_review_limit:" << daily_review_limit << "\n"
        << "session_retry_cap:" << session_retry_cap << "\n"
        << "requeue_spacing:" << requeue_spacing << "\n"
        << "reviews_per_new_word:" << reviews_per_new_word << "\n"
        << "slow_answer_seconds:" << slow_answer_seconds << "\n";
    return oss.str();
}

void LearningSettings::deserialize(const std::string& data) {
    std::istringstream iss(data);
    std::string line;

    while (std::getline(iss, line)) {
        if (line.empty() || line[0] == '#') continue;

        auto pos = line.find(':');
        if (pos == std::string::npos) continue;

        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);
        while (!value.empty() && std::isspace((unsigned char)value.front())) value.erase(value.begin());
        while (!value.empty() && std::isspace((unsigned char)value.back())) value.pop_back();
        if (key.empty()) continue;

        try {
            applyValue(key, value);
        }
        catch (const std::invalid_argument&) {
            spdlog::warn("Ignoring setting '{}': '{}' is not a number", key, value);
        }
        catch (const std::out_of_range&) {
            spdlog::warn("Ignoring setting '{}': '{}' is out of range", key, value);
        }
    }

    spdlog::info("Learning settings: algorithm={}, boxes={}, retry_cap={}",
        algorithmToString(algorithm), leitner_box_count, session_retry_cap);
}

void LearningSettings::applyValue(const std::string& key, const std::string& value) {
    if (key == "sr_algorithm") {
        algorithm = algorithmFromString(value);
    }
    else if (key == "leitner_box_count") {
        int n = std::stoi(value);
        if (n == 3 || n == 5 || n == 7) leitner_box_count = n;
        else spdlog::warn("leitner_box_count must be 3, 5 or 7 (got {}); keeping {}", n, leitner_box_count);
    }
    else if (key == "show_failed_words_in_session") {
        show_failed_words_in_session = (value == "true" || value == "1");
    }
    else if (key == "new_words_per_session") {
        new_words_per_session = std::max(0, std::stoi(value));
    }
    else if (key == "daily_review_limit") {
        daily_review_limit = std::max(0, std::stoi(value));
    }
    else if (key == "session_retry_cap") {
        session_retry_cap = std::max(1, std::stoi(value));
    }
    else if (key == "requeue_spacing") {
        requeue_spacing = std::max(1, std::stoi(value));
    }
    else if (key == "reviews_per_new_word") {
        reviews_per_new_word = std::max(1, std::stoi(value));
    }
    else if (key == "slow_answer_seconds") {
        slow_answer_seconds = std::max(0, std::stoi(value));
    }
    else {
        spdlog::warn("Unknown setting '{}'", key);
    }
}
