#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "base/BridgeError.h"
#include "environ/BridgeWindow.h"
#include "environ/EventLoop.h"
#include "environ/EventPump.h"
#include "test_support.h"

using namespace wvb;
using namespace std::chrono_literals;

namespace {

struct Fixture {
    EventLoop loop;
    EventPump pump{loop.Get(), loop.Registry()};

    std::shared_ptr<BridgeWindow> MakeWindow(WindowOptions options = {}) {
        return std::make_shared<BridgeWindow>(std::move(options));
    }

    void Pump() {
        pump.PumpOnce(0ms, [](std::string_view) { return ControlFlow::kWait; });
    }
};

}  // namespace

TEST_CASE("live operations require an initialized window") {
    Fixture fixture;
    auto window = fixture.MakeWindow();
    REQUIRE(window->State() == WindowState::kPending);
    REQUIRE(window->Id().empty());

    try {
        window->SendWebMessage("early");
        FAIL("message sent before initialization");
    } catch (const BridgeError& e) {
        REQUIRE(e.code() == ErrorCode::kInvalidState);
    }
    REQUIRE_THROWS_AS(window->EvaluateScript("1"), BridgeError);
    REQUIRE_THROWS_AS(window->Navigate("https://example.com/"), BridgeError);
    REQUIRE_THROWS_AS(window->Focus(), BridgeError);

    window->Load("app://localhost/start.html");
    REQUIRE(window->Options().url == std::string("app://localhost/start.html"));
}

TEST_CASE("creation-only properties are frozen after initialization") {
    Fixture fixture;
    WindowOptions options;
    options.title = "frozen";
    options.resizable = false;
    auto window = fixture.MakeWindow(options);
    window->SetDevToolsEnabled(false).SetSize(300, 200).SetPosition(10, 20);
    window->Initialize(fixture.loop.Handle());

    REQUIRE(window->IsInitialized());
    REQUIRE(window->Id().rfind("window-", 0) == 0);
    REQUIRE_THROWS_AS(window->SetResizable(true), InitializedError);
    REQUIRE_THROWS_AS(window->SetTransparent(true), InitializedError);
    REQUIRE_THROWS_AS(window->SetDevToolsEnabled(true), InitializedError);
    REQUIRE_THROWS_AS(window->RegisterCustomScheme("app", {}), InitializedError);
    REQUIRE_THROWS_AS(window->Initialize(fixture.loop.Handle()), BridgeError);

    try {
        window->SetFullscreen(true);
        FAIL("fullscreen changed after initialization");
    } catch (const InitializedError& e) {
        REQUIRE(e.code() == ErrorCode::kInvalidState);
    }

    auto state = test::WindowState(window->NativeWindow());
    REQUIRE(state.width == 300);
    REQUIRE(state.height == 200);
    REQUIRE(state.x == 10);
    REQUIRE(state.y == 20);
    REQUIRE_FALSE(state.resizable);

    window->SetTitle("renamed").SetVisible(false);
    REQUIRE_FALSE(test::WindowState(window->NativeWindow()).visible);
}

TEST_CASE("window forwards messages scripts and navigation") {
    Fixture fixture;
    WindowOptions options;
    options.url = "app://localhost/index.html";
    auto window = fixture.MakeWindow(options);
    window->Initialize(fixture.loop.Handle());
    auto webview = window->NativeWebview();

    REQUIRE(test::CurrentUrl(webview) == "app://localhost/index.html");
    window->SendWebMessage("hello");
    REQUIRE(test::PopMessages(webview) == std::vector<std::string>{"hello"});
    window->EvaluateScript("document.title");
    REQUIRE(test::PopScript(webview) == "document.title");
    window->Load("https://example.com/");
    REQUIRE(test::CurrentUrl(webview) == "https://example.com/");
    REQUIRE_THROWS_AS(window->Load(""), BridgeError);
    try {
        window->Navigate("");
        FAIL("navigated to an empty url");
    } catch (const BridgeError& e) {
        REQUIRE(e.code() == ErrorCode::kNavigationFailed);
    }
}

TEST_CASE("window state follows routed events") {
    Fixture fixture;
    auto window = fixture.MakeWindow();
    window->Initialize(fixture.loop.Handle());

    std::optional<std::pair<uint32_t, uint32_t>> resized;
    bool focus_seen = false;
    window->OnResized([&](uint32_t w, uint32_t h) { resized = std::make_pair(w, h); });
    window->OnFocusChanged([&](bool focused) { focus_seen = focused; });

    window->DispatchEvent(ResizedEvent{window->Id(), 1280, 720});
    window->DispatchEvent(MovedEvent{window->Id(), -5, 40});
    window->DispatchEvent(FocusedEvent{window->Id(), true});

    REQUIRE(resized == std::make_pair(1280u, 720u));
    REQUIRE(window->Width() == 1280);
    REQUIRE(window->X() == -5);
    REQUIRE(window->Y() == 40);
    REQUIRE(window->IsFocused());
    REQUIRE(focus_seen);
}

TEST_CASE("closing handler can veto a close") {
    Fixture fixture;
    auto window = fixture.MakeWindow();
    window->Initialize(fixture.loop.Handle());
    bool allow = false;
    int asked = 0;
    window->OnClosing([&]() {
        ++asked;
        return allow;
    });

    window->DispatchEvent(CloseRequestedEvent{window->Id()});
    REQUIRE(asked == 1);
    REQUIRE_FALSE(window->ShouldExit());
    REQUIRE(window->IsInitialized());

    allow = true;
    window->DispatchEvent(CloseRequestedEvent{window->Id()});
    REQUIRE(asked == 2);
    REQUIRE(window->ShouldExit());
    REQUIRE(window->State() == WindowState::kClosing);
}

TEST_CASE("destroy releases native resources once") {
    Fixture fixture;
    auto window = fixture.MakeWindow();
    window->Initialize(fixture.loop.Handle());
    int destroyed = 0;
    window->OnDestroyed([&]() { ++destroyed; });
    const auto webview_key = static_cast<const void*>(window->NativeWebview());
    REQUIRE(fixture.loop.Registry().PinnedCount(webview_key) == 2);

    window->Destroy();
    REQUIRE(window->State() == WindowState::kDestroyed);
    REQUIRE(window->NativeWindow() == nullptr);
    REQUIRE(window->NativeWebview() == nullptr);
    REQUIRE(window->Ipc().IsDisposed());
    REQUIRE_FALSE(fixture.loop.Registry().IsPinned(webview_key));
    REQUIRE(destroyed == 1);

    window->Destroy();
    REQUIRE(destroyed == 1);
}

TEST_CASE("modal window disables its parent until closed") {
    Fixture fixture;
    auto parent = fixture.MakeWindow();
    parent->Initialize(fixture.loop.Handle());

    auto child = fixture.MakeWindow();
    child->SetParent(parent, true);
    REQUIRE_THROWS_AS(child->SetParent(child), BridgeError);
    child->Initialize(fixture.loop.Handle());
    REQUIRE_FALSE(test::WindowState(parent->NativeWindow()).enabled);

    child->DispatchEvent(CloseRequestedEvent{child->Id()});
    auto state = test::WindowState(parent->NativeWindow());
    REQUIRE(state.enabled);
    REQUIRE(state.focused);
    child->Destroy();
}

TEST_CASE("custom scheme answers fetches from the page") {
    Fixture fixture;
    auto window = fixture.MakeWindow();
    std::string seen_method;
    window->RegisterCustomScheme("APP", [&](const ProtocolRequest& request)
                                            -> std::optional<ProtocolResponse> {
        seen_method = request.method;
        if (request.url != "app://localhost/index.html") {
            return std::nullopt;
        }
        ProtocolResponse response;
        response.content_type = "text/html";
        response.body = std::make_unique<std::istringstream>("<p>served</p>");
        return std::optional<ProtocolResponse>(std::move(response));
    });
    window->Initialize(fixture.loop.Handle());

    const auto live_before = ProtocolBridge::LiveAllocationCount();
    wvb_headless_response_t response{};
    response.struct_size = sizeof(response);
    REQUIRE(wvb_headless_webview_fetch(window->NativeWebview(), "app://localhost/index.html",
                                       "GET", nullptr, 0, &response) == WVB_RESULT_OK);
    REQUIRE(response.handled);
    REQUIRE(std::string(reinterpret_cast<const char*>(response.body), response.body_len) ==
            "<p>served</p>");
    REQUIRE(std::string(response.mime_type_utf8) == "text/html");
    REQUIRE(seen_method == "GET");
    REQUIRE(ProtocolBridge::LiveAllocationCount() == live_before);
    wvb_headless_response_free(&response);

    REQUIRE(wvb_headless_webview_fetch(window->NativeWebview(), "app://localhost/missing",
                                       "GET", nullptr, 0, &response) == WVB_RESULT_OK);
    REQUIRE_FALSE(response.handled);
    REQUIRE(response.status == 404);
    REQUIRE(ProtocolBridge::LiveAllocationCount() == live_before);
}

TEST_CASE("page messages reach the window IPC channel") {
    Fixture fixture;
    auto window = fixture.MakeWindow();
    window->Initialize(fixture.loop.Handle());

    std::vector<std::string> raw_seen;
    window->OnWebMessage([&](const std::string& message) { raw_seen.push_back(message); });
    window->Ipc().On("add", [](const IpcMessage& message) {
        return nlohmann::json(message.payload.at("a").get<int>() +
                              message.payload.at("b").get<int>());
    });

    const std::string request = R"({"type":"add","id":"req-1","payload":{"a":2,"b":3},"isResponse":false})";
    REQUIRE(wvb_headless_webview_post_ipc(window->NativeWebview(), request.c_str()) ==
            WVB_RESULT_OK);
    REQUIRE(test::PopMessages(window->NativeWebview()).empty());

    fixture.Pump();
    REQUIRE(raw_seen == std::vector<std::string>{request});
    auto replies = test::PopMessages(window->NativeWebview());
    REQUIRE(replies.size() == 1);
    auto reply = nlohmann::json::parse(replies[0]);
    REQUIRE(reply.at("id") == "req-1");
    REQUIRE(reply.at("isResponse") == true);
    REQUIRE(reply.at("payload") == 5);
}
