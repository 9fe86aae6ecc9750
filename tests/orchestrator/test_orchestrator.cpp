/**
 * test_orchestrator.cpp - Session lifecycle and error recovery
 */

#include "parley/Orchestrator.hpp"
#include "parley/telemetry/TelemetryRecorder.hpp"

#include "../support/MockServices.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using namespace parley;
using namespace parley::testing;
using namespace std::chrono_literals;

void test_missing_services() {
    MockStack mocks;
    Orchestrator orchestrator(fastConfig());

    SessionServices services = mocks.services();
    services.stt.reset();
    services.tts.reset();

    assert(!orchestrator.startSession(services));
    assert(orchestrator.lastError().find("stt, tts") != std::string::npos);
    assert(orchestrator.state() == SessionState::Idle);
    assert(mocks.audio->configures == 0);

    std::cout << "[PASS] test_missing_services" << std::endl;
}

void test_start_and_stop() {
    auto recorder = std::make_shared<telemetry::TelemetryRecorder>(false);
    MockStack mocks;
    CallbackProbe probe;
    Orchestrator orchestrator(fastConfig(), recorder);
    orchestrator.setCallbacks(probe.callbacks());

    assert(orchestrator.startSession(mocks.services()));
    assert(orchestrator.state() == SessionState::UserSpeaking);
    assert(orchestrator.isActive());
    assert(mocks.stt->starts == 1);
    assert(mocks.audio->running);
    assert(mocks.audio->hasCallback());

    auto history = orchestrator.history();
    assert(history.size() == 1);
    assert(history[0].role == llm::Message::Role::System);
    assert(history[0].content == orchestrator.config().system_prompt);

    // A second start is refused while the first is active
    assert(!orchestrator.startSession(mocks.services()));
    assert(orchestrator.lastError() == "Session is already active");
    assert(mocks.stt->starts == 1);

    orchestrator.stopSession();
    assert(orchestrator.state() == SessionState::Idle);
    assert(!orchestrator.isActive());
    assert(mocks.stt->stops == 1);
    assert(mocks.audio->stops == 1);
    assert(!mocks.audio->hasCallback());
    assert(orchestrator.history().empty());

    orchestrator.stopSession();  // no-op when idle
    assert(mocks.stt->stops == 1);

    assert(recorder->eventCount(telemetry::Event::SessionStarted) == 1);
    assert(recorder->eventCount(telemetry::Event::SessionEnded) == 1);
    auto states = probe.states();
    assert(states.front() == SessionState::UserSpeaking);
    assert(states.back() == SessionState::Idle);

    std::cout << "[PASS] test_start_and_stop" << std::endl;
}

void test_system_prompt_override() {
    MockStack mocks;
    Orchestrator orchestrator(fastConfig());

    SessionOptions options;
    options.system_prompt = "You are a terse geography tutor.";
    assert(orchestrator.startSession(mocks.services(), options));
    assert(orchestrator.history()[0].content == "You are a terse geography tutor.");

    std::cout << "[PASS] test_system_prompt_override" << std::endl;
}

void test_audio_failures() {
    MockStack mocks;
    Orchestrator orchestrator(fastConfig());

    mocks.audio->fail_configure = true;
    assert(!orchestrator.startSession(mocks.services()));
    assert(orchestrator.lastError().find("Audio configuration failed") != std::string::npos);
    assert(mocks.stt->starts == 0);

    mocks.audio->fail_configure = false;
    mocks.audio->fail_start = true;
    assert(!orchestrator.startSession(mocks.services()));
    assert(orchestrator.lastError().find("device busy") != std::string::npos);
    assert(orchestrator.state() == SessionState::Idle);
    assert(mocks.stt->stops == 1);  // recognizer released again
    assert(!mocks.audio->hasCallback());

    // Recoverable: the same orchestrator starts once the device works
    mocks.audio->fail_start = false;
    assert(orchestrator.startSession(mocks.services()));
    assert(orchestrator.state() == SessionState::UserSpeaking);

    std::cout << "[PASS] test_audio_failures" << std::endl;
}

void test_recognizer_failure() {
    MockStack mocks;
    Orchestrator orchestrator(fastConfig());
    mocks.stt->fail_start = true;

    assert(!orchestrator.startSession(mocks.services()));
    assert(orchestrator.lastError().find("recognizer unavailable") != std::string::npos);
    assert(orchestrator.state() == SessionState::Idle);
    assert(!mocks.audio->running);

    std::cout << "[PASS] test_recognizer_failure" << std::endl;
}

void test_ai_speaks_first() {
    auto recorder = std::make_shared<telemetry::TelemetryRecorder>(false);
    MockStack mocks;
    CallbackProbe probe;
    Orchestrator orchestrator(fastConfig(), recorder);
    orchestrator.setCallbacks(probe.callbacks());
    mocks.llm->addReply("Welcome to class. Today we study volcanoes.");

    SessionOptions options;
    options.ai_speaks_first = true;
    assert(orchestrator.startSession(mocks.services(), options));

    assert(waitFor([&]() { return recorder->eventCount(telemetry::Event::AiFinishedSpeaking) == 1; }));
    assert(waitFor([&]() { return orchestrator.state() == SessionState::UserSpeaking; }));

    auto requests = mocks.llm->requests();
    assert(requests.size() == 1);
    assert(requests[0].size() == 2);
    assert(requests[0][1].role == llm::Message::Role::User);
    assert(requests[0][1].content == orchestrator.config().opening_prompt);

    auto history = orchestrator.history();
    assert(history.size() == 3);
    assert(history[2].role == llm::Message::Role::Assistant);
    assert(history[2].content == "Welcome to class. Today we study volcanoes.");

    auto states = probe.states();
    assert(states.front() == SessionState::AiThinking);
    assert(probe.saw(SessionState::AiSpeaking));
    assert(probe.utterances().empty());  // the opening prompt is not a user utterance
    assert(probe.responses().size() == 1);

    std::cout << "[PASS] test_ai_speaks_first" << std::endl;
}

void test_llm_failure_recovers() {
    MockStack mocks;
    CallbackProbe probe;
    Orchestrator orchestrator(fastConfig());
    orchestrator.setCallbacks(probe.callbacks());
    mocks.llm->addReply("!throw:backend down");
    mocks.llm->addReply("Second try works.");

    assert(orchestrator.startSession(mocks.services()));
    assert(orchestrator.injectUserUtterance("Hello?"));

    assert(waitFor([&]() { return !probe.errors().empty(); }));
    assert(probe.errors()[0].find("AI response failed") != std::string::npos);
    assert(probe.errors()[0].find("backend down") != std::string::npos);
    assert(orchestrator.lastError() == probe.errors()[0]);
    assert(probe.saw(SessionState::Error));

    // Back to listening after the error display delay
    assert(waitFor([&]() { return orchestrator.state() == SessionState::UserSpeaking; }));
    auto history = orchestrator.history();
    assert(history.size() == 2);  // system + user, no assistant
    assert(orchestrator.aiResponse().empty());

    assert(orchestrator.injectUserUtterance("Hello again?"));
    assert(waitFor([&]() { return probe.responses().size() == 1; }));
    assert(probe.responses()[0] == "Second try works.");

    std::cout << "[PASS] test_llm_failure_recovers" << std::endl;
}

void test_failed_utterance_not_finalized_again() {
    MockStack mocks;
    CallbackProbe probe;
    Orchestrator orchestrator(fastConfig());
    orchestrator.setCallbacks(probe.callbacks());
    mocks.llm->addReply("!throw:backend down");

    assert(orchestrator.startSession(mocks.services()));
    mocks.stt->emit("Hello there", true, true);
    assert(waitFor([&]() { return probe.saw(SessionState::Error); }));
    assert(waitFor([&]() { return orchestrator.state() == SessionState::UserSpeaking; }));
    assert(orchestrator.userTranscript().empty());

    // Noise the recognizer does not transcribe, then silence past the timeout
    mocks.audio->emitFrame(true, 0.9f);
    mocks.audio->emitFrame(false, 0.0f);
    std::this_thread::sleep_for(400ms);

    assert(orchestrator.state() == SessionState::UserSpeaking);
    assert(probe.utterances().size() == 1);
    assert(mocks.llm->requests().size() == 1);
    assert(orchestrator.history().size() == 2);

    std::cout << "[PASS] test_failed_utterance_not_finalized_again" << std::endl;
}

void test_empty_response_is_error() {
    MockStack mocks;
    CallbackProbe probe;
    Orchestrator orchestrator(fastConfig());
    orchestrator.setCallbacks(probe.callbacks());
    mocks.llm->addReply("   ");

    assert(orchestrator.startSession(mocks.services()));
    assert(orchestrator.injectUserUtterance("Say nothing."));

    assert(waitFor([&]() { return !probe.errors().empty(); }));
    assert(probe.errors()[0] == "No response from AI");
    assert(waitFor([&]() { return orchestrator.state() == SessionState::UserSpeaking; }));
    assert(mocks.log.sequence("play-start:").empty());

    std::cout << "[PASS] test_empty_response_is_error" << std::endl;
}

void test_stop_during_turn() {
    MockStack mocks;
    Orchestrator orchestrator(fastConfig());
    mocks.llm->token_delay_ms = 40;
    mocks.tts->ms_per_char = 20;
    mocks.llm->addReply("This answer is long enough to still be playing. "
                        "And it keeps going for quite a while. Then even more.");

    assert(orchestrator.startSession(mocks.services()));
    assert(orchestrator.injectUserUtterance("Tell me a story."));
    assert(waitFor([&]() { return !mocks.log.sequence("play-start:").empty(); }));

    auto started = std::chrono::steady_clock::now();
    orchestrator.stopSession();
    assert(std::chrono::steady_clock::now() - started < 1s);

    assert(orchestrator.state() == SessionState::Idle);
    assert(orchestrator.history().empty());
    assert(orchestrator.pendingSentences().empty());
    assert(orchestrator.prefetchCacheSize() == 0);
    assert(orchestrator.prefetchInFlight() == 0);

    // All turn threads were joined: nothing plays or synthesizes afterwards
    size_t events = mocks.log.size();
    std::this_thread::sleep_for(150ms);
    assert(mocks.log.size() == events);

    std::cout << "[PASS] test_stop_during_turn" << std::endl;
}

void test_destructor_stops_session() {
    MockStack mocks;
    {
        Orchestrator orchestrator(fastConfig());
        mocks.llm->addReply("Goodbye for now.");
        assert(orchestrator.startSession(mocks.services()));
        assert(orchestrator.injectUserUtterance("Bye"));
    }
    assert(mocks.stt->stops == 1);
    assert(mocks.audio->stops == 1);

    std::cout << "[PASS] test_destructor_stops_session" << std::endl;
}

int main() {
    std::cout << "=== Orchestrator Lifecycle Tests ===" << std::endl;

    test_missing_services();
    test_start_and_stop();
    test_system_prompt_override();
    test_audio_failures();
    test_recognizer_failure();
    test_ai_speaks_first();
    test_llm_failure_recovers();
    test_failed_utterance_not_finalized_again();
    test_empty_response_is_error();
    test_stop_during_turn();
    test_destructor_stops_session();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
