/**
 * SentenceSegmenter.cpp - Incremental sentence boundary detection
 */

#include "parley/tts/SentenceSegmenter.hpp"

#include <array>
#include <cctype>

namespace parley::tts {

namespace {

constexpr std::array<const char*, 8> ABBREVIATIONS = {
    "Dr", "Mr", "Mrs", "Ms", "vs", "etc", "e.g", "i.e"
};

bool isTerminator(char c) {
    return c == '.' || c == '!' || c == '?';
}

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

bool SentenceSegmenter::endsWithAbbreviation(const std::string& text) {
    for (const char* abbreviation : ABBREVIATIONS) {
        std::string stem(abbreviation);
        if (text.size() < stem.size()) continue;
        if (text.compare(text.size() - stem.size(), stem.size(), stem) != 0) continue;

        // "Devs" must not match "vs"
        size_t start = text.size() - stem.size();
        if (start == 0 || !std::isalnum(static_cast<unsigned char>(text[start - 1]))) {
            return true;
        }
    }
    return false;
}

std::string SentenceSegmenter::trim(const std::string& text) {
    size_t begin = 0;
    while (begin < text.size() && isSpace(text[begin])) ++begin;
    size_t end = text.size();
    while (end > begin && isSpace(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

std::vector<std::string> SentenceSegmenter::feed(const std::string& text) {
    std::vector<std::string> sentences;
    buffer_ += text;

    size_t i = 0;
    while (i < buffer_.size()) {
        if (!isTerminator(buffer_[i])) {
            ++i;
            continue;
        }

        if (endsWithAbbreviation(buffer_.substr(0, i))) {
            ++i;
            continue;
        }

        bool atEnd = (i + 1 == buffer_.size());
        if (!atEnd && !isSpace(buffer_[i + 1])) {
            ++i;
            continue;
        }

        std::string sentence = trim(buffer_.substr(0, i + 1));
        size_t rest = i + 1;
        while (rest < buffer_.size() && isSpace(buffer_[rest])) ++rest;
        buffer_.erase(0, rest);
        i = 0;

        if (!sentence.empty()) {
            sentences.push_back(std::move(sentence));
        }
    }

    return sentences;
}

std::optional<std::string> SentenceSegmenter::flush() {
    std::string remaining = trim(buffer_);
    buffer_.clear();
    if (remaining.empty()) return std::nullopt;
    return remaining;
}

void SentenceSegmenter::reset() {
    buffer_.clear();
}

} // namespace parley::tts
