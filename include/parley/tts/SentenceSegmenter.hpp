/**
 * SentenceSegmenter.hpp - Cuts a streamed LLM reply into speakable sentences
 *
 * A sentence closes on '.', '!' or '?' followed by whitespace or the end of
 * the buffer, unless the text before it ends with a known abbreviation
 * ("Dr", "Mr", "e.g", ...). A terminator followed by anything else ("4.5")
 * is not a boundary.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace parley::tts {

class SentenceSegmenter {
public:
    /** Append streamed text. Returns the sentences it closed, in order. */
    std::vector<std::string> feed(const std::string& text);

    /** Return the remaining fragment (trimmed) if non-empty, and clear it. */
    std::optional<std::string> flush();

    void reset();

    const std::string& pending() const { return buffer_; }

    /** True if `text` ends with a known abbreviation stem as a whole word. */
    static bool endsWithAbbreviation(const std::string& text);

    static std::string trim(const std::string& text);

private:
    std::string buffer_;
};

} // namespace parley::tts
