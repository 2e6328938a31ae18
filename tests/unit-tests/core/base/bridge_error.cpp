#include <string>

#include <catch2/catch_test_macros.hpp>

#include "base/BridgeError.h"
#include "interop/NativeHandle.h"

using namespace wvb;

TEST_CASE("unsupported native operations raise NotSupportedError") {
    auto loop = CreateEventLoop();
    uint32_t id = 0;

    try {
        ThrowIfFailed(wvb_global_shortcut_register(loop.Get(), "Alt", &id),
                      "wvb_global_shortcut_register");
        FAIL("modifier-only accelerator was accepted");
    } catch (const NotSupportedError& e) {
        REQUIRE(e.code() == ErrorCode::kNotSupported);
        REQUIRE(std::string(e.what()).find("wvb_global_shortcut_register failed") == 0);
    }
    REQUIRE(id == 0);
}

TEST_CASE("other native failures keep their mapped code") {
    ThrowIfFailed(WVB_RESULT_OK, "nothing");

    auto loop = CreateEventLoop();
    try {
        ThrowIfFailed(wvb_global_shortcut_unregister(loop.Get(), 4242),
                      "wvb_global_shortcut_unregister");
        FAIL("unknown shortcut id was accepted");
    } catch (const NotSupportedError&) {
        FAIL("invalid argument reported as unsupported");
    } catch (const BridgeError& e) {
        REQUIRE(e.code() == ErrorCode::kInvalidParameter);
    }

    REQUIRE(ErrorCodeFromResult(WVB_RESULT_INVALID_STATE) == ErrorCode::kInvalidState);
    REQUIRE(ErrorCodeFromResult(WVB_RESULT_INTERNAL_ERROR) == ErrorCode::kUnknown);
}
