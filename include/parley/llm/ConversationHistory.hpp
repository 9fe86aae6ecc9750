/**
 * ConversationHistory.hpp - Ordered chat transcript sent with every request
 *
 * Starts with exactly one system message and only grows until cleared.
 * Not thread-safe: the orchestrator touches it from its own thread only.
 */

#pragma once

#include "parley/llm/LanguageModel.hpp"

#include <string>
#include <vector>

namespace parley::llm {

class ConversationHistory {
public:
    /** Drop everything and start over with a single system message. */
    void reset(const std::string& system_prompt);

    void appendUser(const std::string& content);
    void appendAssistant(const std::string& content);

    const std::vector<Message>& messages() const { return messages_; }
    size_t size() const { return messages_.size(); }
    bool empty() const { return messages_.empty(); }

    /** Count of messages with the given role. */
    size_t count(Message::Role role) const;

    void clear();

private:
    std::vector<Message> messages_;
};

} // namespace parley::llm
