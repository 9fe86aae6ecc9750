/**
 * ConversationHistory.cpp - Chat transcript bookkeeping
 */

#include "parley/llm/ConversationHistory.hpp"

#include <algorithm>

namespace parley::llm {

const char* roleName(Message::Role role) {
    switch (role) {
        case Message::Role::System: return "system";
        case Message::Role::User: return "user";
        case Message::Role::Assistant: return "assistant";
    }
    return "unknown";
}

void ConversationHistory::reset(const std::string& system_prompt) {
    messages_.clear();
    messages_.push_back({Message::Role::System, system_prompt});
}

void ConversationHistory::appendUser(const std::string& content) {
    messages_.push_back({Message::Role::User, content});
}

void ConversationHistory::appendAssistant(const std::string& content) {
    messages_.push_back({Message::Role::Assistant, content});
}

size_t ConversationHistory::count(Message::Role role) const {
    return static_cast<size_t>(std::count_if(messages_.begin(), messages_.end(),
        [role](const Message& m) { return m.role == role; }));
}

void ConversationHistory::clear() {
    messages_.clear();
}

} // namespace parley::llm
