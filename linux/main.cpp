#include <initializer_list>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "base/BridgeError.h"
#include "environ/Application.h"
#include "wvb_headless.h"

namespace {

const char* kIndexPage = R"(<!doctype html>
<html><body><h1>wvbridge</h1>
<script>
  window.ipc.postMessage(JSON.stringify({type: "ping", id: "p1", isResponse: false}));
</script>
</body></html>)";

std::optional<wvb::ProtocolResponse> ServeApp(const wvb::ProtocolRequest &request) {
    if(request.url != "app://localhost/index.html") {
        return std::nullopt;
    }
    wvb::ProtocolResponse response;
    response.content_type = "text/html";
    response.body = std::make_unique<std::istringstream>(kIndexPage);
    return std::optional<wvb::ProtocolResponse>(std::move(response));
}

void InstallHandlers(const std::shared_ptr<wvb::BridgeWindow> &window) {
    std::weak_ptr<wvb::BridgeWindow> weak = window;
    window->Ipc().On("ping", [](const wvb::IpcMessage &) {
        return nlohmann::json("pong");
    });
    window->Ipc().OnNotify("quit", [weak](const wvb::IpcMessage &) {
        if(auto self = weak.lock()) {
            self->Close();
        }
    });
    window->OnDestroyed([id = window->Id()]() {
        spdlog::info("window {} destroyed", id);
    });
}

// Stands in for the page: fetch the start page and post the IPC traffic
// a real script would send.
void DriveHeadlessPage(const std::shared_ptr<wvb::BridgeWindow> &window) {
    wvb_headless_response_t page{};
    page.struct_size = sizeof(page);
    if(wvb_headless_webview_fetch(window->NativeWebview(),
                                  "app://localhost/index.html", "GET",
                                  nullptr, 0, &page) == WVB_RESULT_OK) {
        spdlog::info("{} served index.html: {} ({} bytes)", window->Id(),
                     page.status, page.body_len);
        wvb_headless_response_free(&page);
    } else {
        spdlog::warn("{} could not fetch index.html: {}", window->Id(),
                     wvb_get_last_error());
    }
    for(const char *message : {R"({"type":"ping","id":"p1","isResponse":false})",
                               R"({"type":"quit","isResponse":false})"}) {
        wvb::ThrowIfFailed(
            wvb_headless_webview_post_ipc(window->NativeWebview(), message),
            "wvb_headless_webview_post_ipc");
    }
}

} // namespace

int main(int argc, char **argv) {
    spdlog::set_level(spdlog::level::debug);

    static auto bridge_logger = spdlog::stdout_color_mt("bridge");
    static auto ipc_logger = spdlog::stdout_color_mt("ipc");
    static auto protocol_logger = spdlog::stdout_color_mt("protocol");

    spdlog::set_default_logger(bridge_logger);

    try {
        auto *app = wvb::Application::CreateInstance();

        wvb::WindowOptions main_options;
        main_options.title = "Main";
        main_options.url = "app://localhost/index.html";
        auto main_window = app->CreateWindow(main_options);
        main_window->RegisterCustomScheme("app", ServeApp);

        wvb::WindowOptions about_options;
        about_options.title = "About";
        about_options.width = 400;
        about_options.height = 300;
        about_options.url = "app://localhost/index.html";
        auto about_window = app->CreateWindow(about_options);
        about_window->RegisterCustomScheme("app", ServeApp);
        about_window->SetParent(main_window);

        app->InitializePendingWindows();
        for(const auto &window : app->Windows()) {
            InstallHandlers(window);
            DriveHeadlessPage(window);
        }

        app->Run();
    } catch(const wvb::BridgeError &e) {
        spdlog::critical("bridge error ({}): {}", wvb::ErrorCodeName(e.code()),
                         e.what());
        wvb::Application::ShutdownInstance();
        return 1;
    }

    wvb::Application::ShutdownInstance();
    return 0;
}
