/**
 * LanguageModel.hpp - Streaming chat completion contract
 */

#pragma once

#include "parley/core/Cancellation.hpp"

#include <functional>
#include <string>
#include <vector>

namespace parley::llm {

struct Message {
    enum class Role { System, User, Assistant };
    Role role;
    std::string content;
};

const char* roleName(Message::Role role);

struct Token {
    std::string content;
    bool is_done = false;  // last token of the stream
};

struct LLMConfig {
    std::string model;
    int max_tokens = 512;
    float temperature = 0.7f;
    float top_p = 0.9f;
    std::vector<std::string> stop;
};

/** Called per token. Return false to stop the stream. */
using TokenCallback = std::function<bool(const Token&)>;

class LanguageModel {
public:
    virtual ~LanguageModel() = default;

    /**
     * Stream a reply to `messages`. Blocks until the stream ends, the
     * callback returns false or `cancel` fires.
     * Throws std::runtime_error on failure.
     */
    virtual void streamCompletion(
        const std::vector<Message>& messages,
        const LLMConfig& config,
        TokenCallback onToken,
        core::CancellationToken cancel
    ) = 0;
};

} // namespace parley::llm
