#include <catch2/catch_session.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

int main( int argc, char* argv[] ) {

    static auto bridge_logger = spdlog::stdout_color_mt("bridge");
    static auto ipc_logger = spdlog::stdout_color_mt("ipc");
    static auto protocol_logger = spdlog::stdout_color_mt("protocol");
    static auto native_logger = spdlog::stdout_color_mt("native");
    spdlog::set_level(spdlog::level::warn);

    int result = Catch::Session().run( argc, argv );

    return result;
}
