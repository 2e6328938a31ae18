#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "base/BridgeError.h"
#include "ipc/IpcChannel.h"

using namespace wvb;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

constexpr auto kLongTimeout = std::chrono::milliseconds(30000);

// Two channels whose transports feed each other synchronously.
struct Loopback {
    std::shared_ptr<IpcChannel> host;
    std::shared_ptr<IpcChannel> page;

    Loopback() {
        host = IpcChannel::Create([this](const std::string& raw) { page->HandleIncoming(raw); },
                                  kLongTimeout);
        page = IpcChannel::Create([this](const std::string& raw) { host->HandleIncoming(raw); },
                                  kLongTimeout);
    }
};

// A channel that only records what it sends.
struct Recorder {
    std::vector<std::string> sent;
    std::shared_ptr<IpcChannel> channel = IpcChannel::Create(
        [this](const std::string& raw) { sent.push_back(raw); }, kLongTimeout);

    json LastSent() const { return json::parse(sent.back()); }
};

IpcError::Kind FailureKind(std::future<IpcMessage>& result) {
    try {
        result.get();
    } catch (const IpcError& e) {
        return e.kind();
    }
    throw std::logic_error("request did not fail");
}

}  // namespace

TEST_CASE("requests are answered by the remote handler") {
    Loopback link;
    link.page->On("add", [](const IpcMessage& message) {
        return json(message.payload.at("a").get<int>() + message.payload.at("b").get<int>());
    });

    auto call = link.host->Request("add", json{{"a", 2}, {"b", 3}});
    REQUIRE(call.result.wait_for(0ms) == std::future_status::ready);
    const auto response = call.result.get();
    REQUIRE(response.is_response);
    REQUIRE(response.id == call.id);
    REQUIRE(response.payload == 5);
    REQUIRE(link.host->PendingCount() == 0);
}

TEST_CASE("a throwing handler becomes a remote error") {
    Loopback link;
    link.page->On("divide", [](const IpcMessage&) -> json {
        throw std::runtime_error("division by zero");
    });

    auto call = link.host->Request("divide");
    try {
        call.result.get();
        FAIL("request succeeded");
    } catch (const IpcError& e) {
        REQUIRE(e.kind() == IpcError::Kind::kRemote);
        REQUIRE(e.correlation_id() == call.id);
        REQUIRE(std::string(e.what()) == "division by zero");
    }
}

TEST_CASE("requests expire at their deadline") {
    Recorder recorder;
    const auto before = IpcChannel::Clock::now();
    auto call = recorder.channel->Request("slow", nullptr, 100ms);
    const auto after = IpcChannel::Clock::now();

    REQUIRE(recorder.channel->ExpireOverdue(before + 99ms) == 0);
    REQUIRE(call.result.wait_for(0ms) == std::future_status::timeout);

    REQUIRE(recorder.channel->ExpireOverdue(after + 100ms) == 1);
    REQUIRE(FailureKind(call.result) == IpcError::Kind::kTimeout);
    REQUIRE(recorder.channel->PendingCount() == 0);
}

TEST_CASE("requests use the channel default timeout") {
    std::vector<std::string> sent;
    auto channel = IpcChannel::Create([&](const std::string& raw) { sent.push_back(raw); }, 100ms);
    REQUIRE(channel->DefaultTimeout() == 100ms);

    auto call = channel->Request("slow");
    std::this_thread::sleep_for(120ms);
    REQUIRE(channel->ExpireOverdue() == 1);
    REQUIRE(FailureKind(call.result) == IpcError::Kind::kTimeout);
}

TEST_CASE("late responses are dropped") {
    Recorder recorder;
    auto call = recorder.channel->Request("slow", nullptr, 100ms);
    recorder.channel->ExpireOverdue(IpcChannel::Clock::now() + 1s);
    REQUIRE(FailureKind(call.result) == IpcError::Kind::kTimeout);

    std::vector<IpcMessage> unhandled;
    recorder.channel->OnUnhandled([&](const IpcMessage& message) { unhandled.push_back(message); });
    recorder.channel->HandleIncoming(IpcMessage::Response(call.id, "late").Serialize());
    REQUIRE(unhandled.empty());
    REQUIRE(recorder.channel->PendingCount() == 0);
}

TEST_CASE("cancel and dispose complete pending requests") {
    Recorder recorder;
    auto first = recorder.channel->Request("a");
    auto second = recorder.channel->Request("b");
    REQUIRE(recorder.channel->PendingCount() == 2);

    REQUIRE(recorder.channel->Cancel(first.id));
    REQUIRE_FALSE(recorder.channel->Cancel(first.id));
    REQUIRE(FailureKind(first.result) == IpcError::Kind::kCancelled);

    recorder.channel->Dispose();
    recorder.channel->Dispose();
    REQUIRE(recorder.channel->IsDisposed());
    REQUIRE(FailureKind(second.result) == IpcError::Kind::kCancelled);
    REQUIRE(recorder.channel->PendingCount() == 0);

    try {
        recorder.channel->Send("after");
        FAIL("sent on a disposed channel");
    } catch (const BridgeError& e) {
        REQUIRE(e.code() == ErrorCode::kInvalidState);
    }
    REQUIRE_THROWS_AS(recorder.channel->Request("after"), BridgeError);
}

TEST_CASE("a failing transport leaves nothing pending") {
    auto channel = IpcChannel::Create(
        [](const std::string&) { throw std::runtime_error("webview gone"); }, kLongTimeout);
    try {
        channel->Request("ping");
        FAIL("request sent through a broken transport");
    } catch (const IpcError& e) {
        REQUIRE(e.kind() == IpcError::Kind::kTransport);
        REQUIRE(e.correlation_id().size() == 32);
    }
    REQUIRE(channel->PendingCount() == 0);

    try {
        channel->Send("ping");
        FAIL("notification sent through a broken transport");
    } catch (const IpcError& e) {
        REQUIRE(e.kind() == IpcError::Kind::kTransport);
        REQUIRE(e.correlation_id().empty());
    }
}

TEST_CASE("messages without a handler reach the fallbacks") {
    Recorder recorder;
    std::vector<std::string> unhandled_types;
    std::vector<std::string> raw;
    recorder.channel->OnUnhandled(
        [&](const IpcMessage& message) { unhandled_types.push_back(message.type); });
    recorder.channel->OnRawMessage([&](const std::string& text) { raw.push_back(text); });

    recorder.channel->HandleIncoming(R"({"type":"resize","isResponse":false})");
    recorder.channel->HandleIncoming("plain text");

    REQUIRE(unhandled_types == std::vector<std::string>{"resize"});
    REQUIRE(raw == std::vector<std::string>{"plain text"});
    REQUIRE(recorder.sent.empty());
}

TEST_CASE("notify handlers acknowledge requests with an empty response") {
    Recorder recorder;
    int calls = 0;
    recorder.channel->OnNotify("log", [&](const IpcMessage&) { ++calls; });

    recorder.channel->HandleIncoming(R"({"type":"log","isResponse":false})");
    REQUIRE(calls == 1);
    REQUIRE(recorder.sent.empty());

    recorder.channel->HandleIncoming(R"({"type":"log","id":"n1","isResponse":false})");
    REQUIRE(calls == 2);
    REQUIRE(recorder.LastSent() == json{{"type", ""}, {"id", "n1"}, {"isResponse", true}});

    REQUIRE(recorder.channel->Off("log"));
    REQUIRE_FALSE(recorder.channel->Off("log"));
}

TEST_CASE("async handlers complete exactly once") {
    Recorder recorder;
    std::vector<IpcResponder> responders;
    recorder.channel->OnAsync("load", [&](const IpcMessage&, IpcResponder responder) {
        responders.push_back(responder);
    });

    recorder.channel->HandleIncoming(R"({"type":"load","id":"r1","isResponse":false})");
    REQUIRE(recorder.sent.empty());
    REQUIRE(responders.size() == 1);
    REQUIRE(responders[0].ExpectsReply());

    IpcResponder copy = responders[0];
    REQUIRE(copy.Resolve("done"));
    REQUIRE_FALSE(responders[0].Reject("too late"));
    REQUIRE(responders[0].IsCompleted());
    REQUIRE(recorder.sent.size() == 1);
    REQUIRE(recorder.LastSent().at("payload") == "done");
}

TEST_CASE("responses from another thread complete the request") {
    Recorder recorder;
    auto call = recorder.channel->Request("compute");
    const auto response = IpcMessage::Response(call.id, 42).Serialize();

    std::thread responder([&]() { recorder.channel->HandleIncoming(response); });
    REQUIRE(call.result.get().payload == 42);
    responder.join();
}
