#include <chrono>
#include <cstdlib>
#include <utility>

#include <catch2/catch_test_macros.hpp>

#include "base/BridgeConfig.h"
#include "base/BridgeError.h"
#include "wvb_options.h"

using namespace wvb;
using namespace std::chrono_literals;

TEST_CASE("options are set by key") {
    BridgeConfig config;
    REQUIRE(config.pump_timeout == 10ms);
    REQUIRE(config.ipc_timeout == 30000ms);
    REQUIRE(config.boundary_policy == BoundaryPolicy::kLogAndContinue);

    REQUIRE(config.SetOption(WVB_OPTION_LOG_LEVEL, "debug"));
    REQUIRE(config.log_level == spdlog::level::debug);
    REQUIRE(config.SetOption(WVB_OPTION_PUMP_TIMEOUT_MS, "0"));
    REQUIRE(config.pump_timeout == 0ms);
    REQUIRE(config.SetOption(WVB_OPTION_IPC_TIMEOUT_MS, "250"));
    REQUIRE(config.ipc_timeout == 250ms);
    REQUIRE(config.SetOption(WVB_OPTION_BOUNDARY_POLICY, WVB_BOUNDARY_POLICY_EXIT));
    REQUIRE(config.boundary_policy == BoundaryPolicy::kExit);

    REQUIRE_FALSE(config.SetOption("frame_rate", "60"));
}

TEST_CASE("malformed option values are rejected") {
    BridgeConfig config;
    for (const auto& [key, value] : {
             std::pair{WVB_OPTION_LOG_LEVEL, "loud"},
             std::pair{WVB_OPTION_PUMP_TIMEOUT_MS, "-5"},
             std::pair{WVB_OPTION_PUMP_TIMEOUT_MS, "10ms"},
             std::pair{WVB_OPTION_IPC_TIMEOUT_MS, ""},
             std::pair{WVB_OPTION_BOUNDARY_POLICY, "panic"},
         }) {
        try {
            config.SetOption(key, value);
            FAIL("accepted " << key << "=" << value);
        } catch (const BridgeError& e) {
            REQUIRE(e.code() == ErrorCode::kInvalidParameter);
        }
    }
    REQUIRE(config.pump_timeout == 10ms);
    REQUIRE(config.boundary_policy == BoundaryPolicy::kLogAndContinue);
}

TEST_CASE("environment overrides skip malformed values") {
    setenv(WVB_ENV_IPC_TIMEOUT_MS, "1500", 1);
    setenv(WVB_ENV_PUMP_TIMEOUT_MS, "soon", 1);
    setenv(WVB_ENV_BOUNDARY_POLICY, WVB_BOUNDARY_POLICY_EXIT, 1);

    BridgeConfig config;
    config.LoadFromEnvironment();

    unsetenv(WVB_ENV_IPC_TIMEOUT_MS);
    unsetenv(WVB_ENV_PUMP_TIMEOUT_MS);
    unsetenv(WVB_ENV_BOUNDARY_POLICY);

    REQUIRE(config.ipc_timeout == 1500ms);
    REQUIRE(config.pump_timeout == 10ms);
    REQUIRE(config.boundary_policy == BoundaryPolicy::kExit);
}
