/**
 * ResponseStreaming.cpp - LLM token stream into the sentence queue
 */

#include "OrchestratorImpl.hpp"

#include <exception>
#include <iostream>

namespace parley {

void Orchestrator::Impl::beginGeneration() {
    setState(SessionState::AiThinking);

    cancelTurn();
    const uint64_t turn = turnId;
    turnCancel = std::make_shared<core::CancellationSource>();
    core::CancellationToken token = turnCancel->token();

    fullResponse.clear();
    aiResponse.clear();
    firstToken = true;
    firstSentence = true;

    tasks.reapFinished();

    std::vector<llm::Message> messages = history.messages();
    std::cout << "[Orchestrator] Generating response (" << messages.size() << " messages)" << std::endl;

    // Threads hold their own service references: stopSession releases ours
    tasks.spawn("llm-stream", [this, model = services.llm, turn, messages = std::move(messages), token]() mutable {
        runLanguageModel(std::move(model), turn, std::move(messages), token);
    });

    // Started with the stream so sentences play as soon as they are complete
    tasks.spawn("speech-queue", [this, turnServices = services, turn, token]() {
        runSpeechQueue(turnServices, turn, token);
    });
}

void Orchestrator::Impl::runLanguageModel(std::shared_ptr<llm::LanguageModel> model, uint64_t turn,
                                          std::vector<llm::Message> messages, core::CancellationToken cancel) {
    try {
        model->streamCompletion(messages, config.llm,
            [this, turn, cancel](const llm::Token& token) {
                if (cancel.isCancelled()) return false;
                executor.post([this, turn, token]() { handleToken(turn, token); });
                return !token.is_done;
            },
            cancel);

        if (!cancel.isCancelled()) {
            executor.post([this, turn]() { finishGeneration(turn); });
        }
    } catch (const std::exception& e) {
        std::cerr << "[Orchestrator] LLM stream failed: " << e.what() << std::endl;
        if (!cancel.isCancelled()) {
            std::string message = std::string("AI response failed: ") + e.what();
            executor.post([this, turn, message]() { failGeneration(turn, message); });
        }
    }
}

void Orchestrator::Impl::handleToken(uint64_t turn, const llm::Token& token) {
    if (turn != turnId || stopping) return;

    if (firstToken && !token.content.empty()) {
        firstToken = false;
        recordEvent(telemetry::Event::LlmFirstTokenReceived);
        if (turnStart) {
            recordLatency(telemetry::LatencyKind::LlmFirstToken, secondsSince(*turnStart));
        }
        setState(SessionState::AiSpeaking);
    }

    if (token.content.empty()) return;

    fullResponse += token.content;
    aiResponse = fullResponse;

    for (const auto& sentence : segmenter.feed(token.content)) {
        enqueueSentence(sentence);
    }
}

void Orchestrator::Impl::finishGeneration(uint64_t turn) {
    if (turn != turnId || stopping) return;

    if (auto rest = segmenter.flush()) {
        enqueueSentence(*rest);
    }

    if (tts::SentenceSegmenter::trim(fullResponse).empty()) {
        handleProcessingError("No response from AI");
        return;
    }

    std::cout << "[Orchestrator] AI: \"" << preview(fullResponse) << "\"" << std::endl;
    history.appendAssistant(fullResponse);
    if (callbacks.onAssistantResponse) {
        callbacks.onAssistantResponse(fullResponse);
    }
    generationComplete = true;
}

void Orchestrator::Impl::failGeneration(uint64_t turn, const std::string& message) {
    if (turn != turnId || stopping) return;
    handleProcessingError(message);
}

} // namespace parley
