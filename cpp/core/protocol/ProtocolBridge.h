/**
 * @file ProtocolBridge.h
 * @brief Serves custom URL schemes (e.g. app://) from host handlers.
 *
 * The webview asks synchronously, on the loop thread, for the response to a
 * custom-scheme request. A handler either declines (std::nullopt) or
 * returns a response whose body stream is copied into one heap allocation.
 * Native code owns that allocation until it calls FreeResponse with the
 * token it was given, which it does exactly once.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "wvb_native_api.h"

namespace wvb {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct ProtocolRequest {
    std::string url;
    std::string method;
    HeaderList headers;
    std::vector<uint8_t> body;
    std::string webview_id;

    /// Lower-cased scheme of url, empty when it has none.
    std::string Scheme() const;
};

struct ProtocolResponse {
    uint16_t status = 200;
    /// Defaults to application/octet-stream when empty.
    std::string content_type;
    HeaderList headers;
    std::unique_ptr<std::istream> body;
};

using SchemeHandler = std::function<std::optional<ProtocolResponse>(const ProtocolRequest&)>;

class ProtocolBridge {
public:
    static constexpr const char* kDefaultContentType = "application/octet-stream";

    ProtocolBridge() = default;

    ProtocolBridge(const ProtocolBridge&) = delete;
    ProtocolBridge& operator=(const ProtocolBridge&) = delete;

    /// Scheme names are case-insensitive; registering again replaces.
    void RegisterScheme(const std::string& scheme, SchemeHandler handler);
    bool UnregisterScheme(const std::string& scheme);
    bool HasScheme(const std::string& scheme) const;
    std::vector<std::string> Schemes() const;

    /**
     * Answer one native request.
     *
     * @return true when out_response was filled and ownership moved to
     *         native code; false when no handler accepted the request, in
     *         which case nothing was allocated.
     */
    bool Handle(const wvb_protocol_request_t& request, wvb_protocol_response_t& out_response);

    /**
     * Definitions to put in wvb_webview_config_t, one per scheme, all
     * pointing at this bridge. Valid while the scheme set is unchanged.
     */
    std::vector<wvb_protocol_definition_t> Definitions() const;

    /// Single release entry point handed to native code.
    static void FreeResponse(void* token);

    /// Responses handed out and not yet freed, across all bridges.
    static std::size_t LiveAllocationCount();

private:
    struct ResponseAllocation;

    static bool OnNativeRequest(const wvb_protocol_request_t* request,
                                wvb_protocol_response_t* out_response, void* user_data);

    mutable std::mutex mutex_;
    std::map<std::string, SchemeHandler> handlers_;
};

}  // namespace wvb
