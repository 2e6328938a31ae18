#include <memory>
#include <string>
#include <utility>

#include <catch2/catch_test_macros.hpp>

#include "base/BridgeError.h"
#include "interop/NativeHandle.h"
#include "wvb_native_api.h"

namespace {

wvb_window_config_t SmallWindow() {
    wvb_window_config_t config{};
    config.struct_size = sizeof(config);
    config.title_utf8 = "handle";
    config.width = 320;
    config.height = 200;
    config.visible = true;
    return config;
}

}  // namespace

TEST_CASE("release tears the resource down once") {
    wvb::CallbackRegistry registry;
    auto loop = wvb::CreateEventLoop(registry);
    auto window = wvb::CreateWindowHandle(loop, SmallWindow());
    REQUIRE(window.Registry() == &registry);

    auto spy = std::make_shared<int>(7);
    std::weak_ptr<int> watch = spy;
    registry.Register(window.Key(), std::move(spy));

    const auto raw = window.Get();
    window.Release();
    REQUIRE(window.IsInvalid());
    REQUIRE(watch.expired());
    REQUIRE(wvb_window_set_title(raw, "gone") == WVB_RESULT_INVALID_ARGUMENT);

    window.Release();
    REQUIRE(window.IsInvalid());
}

TEST_CASE("moving a handle transfers ownership") {
    wvb::CallbackRegistry registry;
    auto loop = wvb::CreateEventLoop(registry);
    auto window = wvb::CreateWindowHandle(loop, SmallWindow());
    const auto raw = window.Get();

    wvb::WindowHandle moved(std::move(window));
    REQUIRE(window.IsInvalid());
    REQUIRE(moved.Get() == raw);

    wvb::WindowHandle assigned;
    assigned = std::move(moved);
    REQUIRE(moved.IsInvalid());
    REQUIRE(assigned.Get() == raw);
    REQUIRE(wvb_window_set_title(raw, "still alive") == WVB_RESULT_OK);
}

TEST_CASE("finalizer only unpins once the runtime is shutting down") {
    wvb::CallbackRegistry registry;
    auto loop = wvb::CreateEventLoop(registry);
    wvb_window_t raw = nullptr;
    auto spy = std::make_shared<int>(1);
    std::weak_ptr<int> watch = spy;

    {
        auto window = wvb::CreateWindowHandle(loop, SmallWindow());
        raw = window.Get();
        registry.Register(window.Key(), std::move(spy));
        wvb::NativeRuntime::MarkUnavailable();
    }
    wvb::NativeRuntime::MarkAvailable();

    REQUIRE(watch.expired());
    // The native window was left alone.
    REQUIRE(wvb_window_set_title(raw, "leaked") == WVB_RESULT_OK);
    REQUIRE(wvb_window_destroy(raw) == WVB_RESULT_OK);
}

TEST_CASE("finalizer releases while the runtime is available") {
    wvb::CallbackRegistry registry;
    auto loop = wvb::CreateEventLoop(registry);
    wvb_window_t raw = nullptr;
    {
        auto window = wvb::CreateWindowHandle(loop, SmallWindow());
        raw = window.Get();
    }
    REQUIRE(wvb_window_set_title(raw, "gone") == WVB_RESULT_INVALID_ARGUMENT);
}

TEST_CASE("creation failures carry the native error") {
    auto loop = wvb::CreateEventLoop();
    auto config = SmallWindow();
    config.width = 0;

    try {
        wvb::CreateWindowHandle(loop, config);
        FAIL("window with zero width was created");
    } catch (const wvb::CreationError& e) {
        REQUIRE(e.code() == wvb::ErrorCode::kWindowCreationFailed);
        REQUIRE(e.resource() == "window");
        REQUIRE(e.native_result() == WVB_RESULT_INVALID_ARGUMENT);
        REQUIRE_FALSE(e.native_message().empty());
    }
}

TEST_CASE("window id is queried from the native layer") {
    auto loop = wvb::CreateEventLoop();
    auto window = wvb::CreateWindowHandle(loop, SmallWindow());
    const auto id = wvb::QueryWindowId(window);
    REQUIRE(id.rfind("window-", 0) == 0);
}
