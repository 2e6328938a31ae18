#include <istream>
#include <memory>
#include <sstream>
#include <streambuf>
#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "protocol/ProtocolBridge.h"

using namespace wvb;

namespace {

struct NativeRequest {
    std::string url;
    std::string method = "GET";
    std::vector<wvb_protocol_header_t> headers;
    std::string body;

    wvb_protocol_request_t View() const {
        wvb_protocol_request_t request{};
        request.struct_size = sizeof(request);
        request.url_utf8 = url.c_str();
        request.method_utf8 = method.c_str();
        request.headers = headers.empty() ? nullptr : headers.data();
        request.header_count = headers.size();
        request.body = reinterpret_cast<const uint8_t*>(body.data());
        request.body_len = body.size();
        request.webview_id_utf8 = "webview-1";
        return request;
    }
};

wvb_protocol_response_t EmptyResponse() {
    wvb_protocol_response_t response{};
    response.struct_size = sizeof(response);
    return response;
}

ProtocolResponse TextResponse(const std::string& text, const std::string& content_type = "") {
    ProtocolResponse response;
    response.content_type = content_type;
    response.body = std::make_unique<std::istringstream>(text);
    return response;
}

// Hands out a few bytes, then fails the way a broken file or pipe does.
class FailingBuffer : public std::streambuf {
protected:
    int_type underflow() override {
        if (served_) {
            throw std::runtime_error("device gone");
        }
        served_ = true;
        setg(data_, data_, data_ + sizeof(data_) - 1);
        return traits_type::to_int_type(data_[0]);
    }

private:
    char data_[6] = "parti";
    bool served_ = false;
};

class FailingStream : public std::istream {
public:
    FailingStream() : std::istream(&buffer_) {}

private:
    FailingBuffer buffer_;
};

}  // namespace

TEST_CASE("requests without a matching scheme are declined") {
    ProtocolBridge bridge;
    bridge.RegisterScheme("app", [](const ProtocolRequest&) {
        return std::optional<ProtocolResponse>(TextResponse("x"));
    });
    const auto live = ProtocolBridge::LiveAllocationCount();

    NativeRequest request{"other://index.html"};
    auto response = EmptyResponse();
    REQUIRE_FALSE(bridge.Handle(request.View(), response));
    REQUIRE(response.free_fn == nullptr);
    REQUIRE(ProtocolBridge::LiveAllocationCount() == live);

    NativeRequest no_scheme{"index.html"};
    REQUIRE_FALSE(bridge.Handle(no_scheme.View(), response));
}

TEST_CASE("a handler may decline a request") {
    ProtocolBridge bridge;
    bridge.RegisterScheme("app", [](const ProtocolRequest&) -> std::optional<ProtocolResponse> {
        return std::nullopt;
    });
    const auto live = ProtocolBridge::LiveAllocationCount();

    NativeRequest request{"app://missing"};
    auto response = EmptyResponse();
    REQUIRE_FALSE(bridge.Handle(request.View(), response));
    REQUIRE(ProtocolBridge::LiveAllocationCount() == live);
}

TEST_CASE("accepted responses are owned until freed") {
    ProtocolBridge bridge;
    ProtocolRequest seen;
    bridge.RegisterScheme("app", [&](const ProtocolRequest& request) {
        seen = request;
        auto response = TextResponse("<h1>hi</h1>", "text/html");
        response.status = 201;
        response.headers = {{"Cache-Control", "no-store"}};
        return std::optional<ProtocolResponse>(std::move(response));
    });
    const auto live = ProtocolBridge::LiveAllocationCount();

    NativeRequest request{"app://index.html", "POST", {{"Accept", "text/html"}}, "form=1"};
    auto response = EmptyResponse();
    REQUIRE(bridge.Handle(request.View(), response));

    REQUIRE(seen.url == "app://index.html");
    REQUIRE(seen.method == "POST");
    REQUIRE(seen.webview_id == "webview-1");
    REQUIRE(seen.headers == HeaderList{{"Accept", "text/html"}});
    REQUIRE(std::string(seen.body.begin(), seen.body.end()) == "form=1");

    REQUIRE(response.status == 201);
    REQUIRE(std::string(response.mime_type_utf8) == "text/html");
    REQUIRE(std::string(reinterpret_cast<const char*>(response.body), response.body_len) ==
            "<h1>hi</h1>");
    REQUIRE(response.header_count == 1);
    REQUIRE(std::string(response.headers[0].name_utf8) == "Cache-Control");
    REQUIRE(std::string(response.headers[0].value_utf8) == "no-store");
    REQUIRE(response.free_fn == &ProtocolBridge::FreeResponse);
    REQUIRE(ProtocolBridge::LiveAllocationCount() == live + 1);

    response.free_fn(response.free_user_data);
    REQUIRE(ProtocolBridge::LiveAllocationCount() == live);
}

TEST_CASE("missing content type falls back to octet-stream") {
    ProtocolBridge bridge;
    bridge.RegisterScheme("app", [](const ProtocolRequest&) {
        ProtocolResponse response;
        return std::optional<ProtocolResponse>(std::move(response));
    });

    NativeRequest request{"app://blob"};
    auto response = EmptyResponse();
    REQUIRE(bridge.Handle(request.View(), response));
    REQUIRE(std::string(response.mime_type_utf8) == ProtocolBridge::kDefaultContentType);
    REQUIRE(response.body_len == 0);
    REQUIRE(response.header_count == 0);
    ProtocolBridge::FreeResponse(response.free_user_data);
}

TEST_CASE("a body stream that fails mid-read declines the request") {
    ProtocolBridge bridge;
    bridge.RegisterScheme("app", [](const ProtocolRequest&) {
        ProtocolResponse response;
        response.content_type = "text/plain";
        response.body = std::make_unique<FailingStream>();
        return std::optional<ProtocolResponse>(std::move(response));
    });
    const auto live = ProtocolBridge::LiveAllocationCount();

    NativeRequest request{"app://broken.txt"};
    auto response = EmptyResponse();
    REQUIRE_FALSE(bridge.Handle(request.View(), response));
    REQUIRE(response.free_fn == nullptr);
    REQUIRE(ProtocolBridge::LiveAllocationCount() == live);
}

TEST_CASE("bodies larger than one read are copied whole") {
    const std::string big(20000, 'z');
    ProtocolBridge bridge;
    bridge.RegisterScheme("app", [&](const ProtocolRequest&) {
        return std::optional<ProtocolResponse>(TextResponse(big + "!"));
    });

    NativeRequest request{"app://big.bin"};
    auto response = EmptyResponse();
    REQUIRE(bridge.Handle(request.View(), response));
    REQUIRE(response.body_len == big.size() + 1);
    REQUIRE(std::string(reinterpret_cast<const char*>(response.body), response.body_len) ==
            big + "!");
    ProtocolBridge::FreeResponse(response.free_user_data);
}

TEST_CASE("a throwing handler declines without allocating") {
    ProtocolBridge bridge;
    bridge.RegisterScheme("app", [](const ProtocolRequest&) -> std::optional<ProtocolResponse> {
        throw std::runtime_error("disk on fire");
    });
    const auto live = ProtocolBridge::LiveAllocationCount();

    NativeRequest request{"app://index.html"};
    auto response = EmptyResponse();
    REQUIRE_FALSE(bridge.Handle(request.View(), response));
    REQUIRE(ProtocolBridge::LiveAllocationCount() == live);
}

TEST_CASE("scheme names are case-insensitive") {
    ProtocolBridge bridge;
    bridge.RegisterScheme("App", [](const ProtocolRequest&) {
        return std::optional<ProtocolResponse>(TextResponse("ok"));
    });
    bridge.RegisterScheme("asset", [](const ProtocolRequest&) {
        return std::optional<ProtocolResponse>(TextResponse("asset"));
    });

    REQUIRE(bridge.HasScheme("APP"));
    REQUIRE(bridge.Schemes() == std::vector<std::string>{"app", "asset"});

    NativeRequest request{"APP://index.html"};
    auto response = EmptyResponse();
    REQUIRE(bridge.Handle(request.View(), response));
    ProtocolBridge::FreeResponse(response.free_user_data);

    const auto definitions = bridge.Definitions();
    REQUIRE(definitions.size() == 2);
    REQUIRE(std::string(definitions[0].scheme_utf8) == "app");
    REQUIRE(definitions[0].user_data == &bridge);
    REQUIRE(definitions[0].handler != nullptr);

    REQUIRE(bridge.UnregisterScheme("ASSET"));
    REQUIRE_FALSE(bridge.UnregisterScheme("asset"));
    REQUIRE(bridge.Schemes() == std::vector<std::string>{"app"});
}

TEST_CASE("freeing a null token does nothing") {
    const auto live = ProtocolBridge::LiveAllocationCount();
    ProtocolBridge::FreeResponse(nullptr);
    REQUIRE(ProtocolBridge::LiveAllocationCount() == live);
}
