#include "ProtocolBridge.h"

#include <algorithm>
#include <atomic>
#include <array>
#include <cctype>
#include <istream>

#include "base/Log.h"

namespace wvb {

namespace {

std::atomic<std::size_t> g_live_allocations{0};

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Appends the whole stream to |out|. False when the stream reports a read
// error rather than a clean end of file.
bool ReadBody(std::istream& in, std::vector<uint8_t>& out) {
    std::array<char, 8192> buffer;
    while (in.read(buffer.data(), buffer.size()) || in.gcount() > 0) {
        const auto* first = reinterpret_cast<const uint8_t*>(buffer.data());
        out.insert(out.end(), first, first + in.gcount());
        if (!in) break;
    }
    return !in.bad() && in.eof();
}

}  // namespace

// Everything native code reads from an accepted response.
struct ProtocolBridge::ResponseAllocation {
    std::vector<uint8_t> body;
    std::string mime_type;
    HeaderList header_storage;
    std::vector<wvb_protocol_header_t> headers;
};

std::string ProtocolRequest::Scheme() const {
    const auto colon = url.find(':');
    if (colon == std::string::npos || colon == 0) {
        return {};
    }
    return ToLower(url.substr(0, colon));
}

// ---------------------------------------------------------------------------
// Scheme table
// ---------------------------------------------------------------------------

void ProtocolBridge::RegisterScheme(const std::string& scheme, SchemeHandler handler) {
    std::lock_guard<std::mutex> guard(mutex_);
    handlers_[ToLower(scheme)] = std::move(handler);
}

bool ProtocolBridge::UnregisterScheme(const std::string& scheme) {
    std::lock_guard<std::mutex> guard(mutex_);
    return handlers_.erase(ToLower(scheme)) > 0;
}

bool ProtocolBridge::HasScheme(const std::string& scheme) const {
    std::lock_guard<std::mutex> guard(mutex_);
    return handlers_.find(ToLower(scheme)) != handlers_.end();
}

std::vector<std::string> ProtocolBridge::Schemes() const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<std::string> schemes;
    schemes.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        schemes.push_back(entry.first);
    }
    return schemes;
}

std::vector<wvb_protocol_definition_t> ProtocolBridge::Definitions() const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::vector<wvb_protocol_definition_t> definitions;
    definitions.reserve(handlers_.size());
    for (const auto& entry : handlers_) {
        wvb_protocol_definition_t definition{};
        definition.scheme_utf8 = entry.first.c_str();
        definition.handler = &ProtocolBridge::OnNativeRequest;
        definition.user_data = const_cast<ProtocolBridge*>(this);
        definitions.push_back(definition);
    }
    return definitions;
}

// ---------------------------------------------------------------------------
// Request handling
// ---------------------------------------------------------------------------

bool ProtocolBridge::OnNativeRequest(const wvb_protocol_request_t* request,
                                     wvb_protocol_response_t* out_response,
                                     void* user_data) {
    if (request == nullptr || out_response == nullptr || user_data == nullptr) {
        return false;
    }
    return static_cast<ProtocolBridge*>(user_data)->Handle(*request, *out_response);
}

bool ProtocolBridge::Handle(const wvb_protocol_request_t& request,
                            wvb_protocol_response_t& out_response) {
    auto logger = log::Get(log::kProtocol);
    try {
        ProtocolRequest host_request;
        host_request.url = request.url_utf8 != nullptr ? request.url_utf8 : "";
        host_request.method = request.method_utf8 != nullptr ? request.method_utf8 : "GET";
        host_request.webview_id =
            request.webview_id_utf8 != nullptr ? request.webview_id_utf8 : "";
        for (size_t i = 0; i < request.header_count && request.headers != nullptr; ++i) {
            const auto& header = request.headers[i];
            host_request.headers.emplace_back(
                header.name_utf8 != nullptr ? header.name_utf8 : "",
                header.value_utf8 != nullptr ? header.value_utf8 : "");
        }
        if (request.body != nullptr && request.body_len > 0) {
            host_request.body.assign(request.body, request.body + request.body_len);
        }

        SchemeHandler handler;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            auto it = handlers_.find(host_request.Scheme());
            if (it == handlers_.end()) {
                logger->debug("no handler for {}", host_request.url);
                return false;
            }
            handler = it->second;
        }

        auto response = handler(host_request);
        if (!response) {
            logger->debug("{} declined by handler", host_request.url);
            return false;
        }

        auto allocation = std::make_unique<ResponseAllocation>();
        if (response->body != nullptr) {
            if (!ReadBody(*response->body, allocation->body)) {
                logger->error("reading response body for {} failed", host_request.url);
                return false;
            }
        }
        allocation->mime_type = response->content_type.empty() ? kDefaultContentType
                                                                : response->content_type;
        allocation->header_storage = std::move(response->headers);
        allocation->headers.reserve(allocation->header_storage.size());
        for (const auto& header : allocation->header_storage) {
            allocation->headers.push_back(
                wvb_protocol_header_t{header.first.c_str(), header.second.c_str()});
        }

        out_response.status = response->status;
        out_response.body = allocation->body.empty() ? nullptr : allocation->body.data();
        out_response.body_len = allocation->body.size();
        out_response.mime_type_utf8 = allocation->mime_type.c_str();
        out_response.headers = allocation->headers.empty() ? nullptr : allocation->headers.data();
        out_response.header_count = allocation->headers.size();
        out_response.free_fn = &ProtocolBridge::FreeResponse;
        out_response.free_user_data = allocation.release();
        g_live_allocations.fetch_add(1, std::memory_order_relaxed);

        logger->debug("{} -> {} ({} bytes, {})", host_request.url, out_response.status,
                      out_response.body_len, out_response.mime_type_utf8);
        return true;
    } catch (const std::exception& e) {
        logger->error("protocol handler threw: {}", e.what());
    } catch (...) {
        logger->error("protocol handler threw a non-standard exception");
    }
    return false;
}

void ProtocolBridge::FreeResponse(void* token) {
    if (token == nullptr) {
        return;
    }
    delete static_cast<ResponseAllocation*>(token);
    g_live_allocations.fetch_sub(1, std::memory_order_relaxed);
}

std::size_t ProtocolBridge::LiveAllocationCount() {
    return g_live_allocations.load(std::memory_order_relaxed);
}

}  // namespace wvb
