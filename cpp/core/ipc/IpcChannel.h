/**
 * @file IpcChannel.h
 * @brief Typed request/response messaging with the page of one window.
 *
 * Inbound messages are matched in this order:
 *   1. a response whose id is pending completes that request; a response
 *      for an unknown or already completed id is dropped;
 *   2. a registered handler for the message type runs; when the message
 *      carried an id, the handler's result (or error) is sent back with it;
 *   3. otherwise the unhandled-message subscribers are notified.
 * Text that does not parse as an envelope goes to raw-message subscribers.
 *
 * Every pending request completes exactly once: by its response, by
 * Cancel(), by Dispose() or by ExpireOverdue() once its deadline passed.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "ipc/IpcMessage.h"

namespace wvb {

class IpcChannel;

/**
 * Completes one inbound request. Copies share state; only the first
 * Resolve/Reject sends anything, and nothing is sent when the request
 * carried no id.
 */
class IpcResponder {
public:
    IpcResponder(std::weak_ptr<IpcChannel> channel, std::optional<std::string> id);

    bool Resolve(nlohmann::json payload = nullptr);
    bool Reject(const std::string& error);

    bool IsCompleted() const;
    bool ExpectsReply() const { return id_.has_value(); }

private:
    bool TryComplete();

    std::weak_ptr<IpcChannel> channel_;
    std::optional<std::string> id_;
    std::shared_ptr<std::atomic<bool>> completed_;
};

struct IpcCall {
    std::string id;
    /// Yields the response envelope or throws IpcError.
    std::future<IpcMessage> result;
};

class IpcChannel : public std::enable_shared_from_this<IpcChannel> {
public:
    using Clock = std::chrono::steady_clock;
    using Transport = std::function<void(const std::string& raw)>;
    using Handler = std::function<nlohmann::json(const IpcMessage&)>;
    using NotifyHandler = std::function<void(const IpcMessage&)>;
    using AsyncHandler = std::function<void(const IpcMessage&, IpcResponder)>;
    using MessageListener = std::function<void(const IpcMessage&)>;
    using RawListener = std::function<void(const std::string&)>;

    static std::shared_ptr<IpcChannel> Create(Transport transport,
                                              std::chrono::milliseconds default_timeout);

    ~IpcChannel();

    IpcChannel(const IpcChannel&) = delete;
    IpcChannel& operator=(const IpcChannel&) = delete;

    // -----------------------------------------------------------------------
    // Outbound
    // -----------------------------------------------------------------------

    /**
     * Fire-and-forget message without an id.
     * @throws IpcError(kTransport) when the transport fails
     */
    void Send(const std::string& type, nlohmann::json payload = nullptr);

    /**
     * Send a request and wait for the matching response.
     * The future fails with IpcError(kTimeout) once ExpireOverdue() sees the
     * deadline pass, with IpcError(kRemote) for an error response, and with
     * IpcError(kCancelled) on Cancel() or Dispose(). A transport failure
     * throws IpcError(kTransport) right away and leaves nothing pending.
     */
    IpcCall Request(const std::string& type, nlohmann::json payload = nullptr,
                    std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    bool Cancel(const std::string& id);

    /// Fail every request whose deadline is at or before now.
    std::size_t ExpireOverdue(Clock::time_point now = Clock::now());

    std::size_t PendingCount() const;

    // -----------------------------------------------------------------------
    // Inbound
    // -----------------------------------------------------------------------

    /// Handler's return value becomes the response payload.
    void On(const std::string& type, Handler handler);
    /// Handler returns nothing; requests with an id get an empty response.
    void OnNotify(const std::string& type, NotifyHandler handler);
    /// Handler completes through the responder, possibly later.
    void OnAsync(const std::string& type, AsyncHandler handler);
    bool Off(const std::string& type);

    void OnUnhandled(MessageListener listener);
    void OnRawMessage(RawListener listener);

    void HandleIncoming(std::string_view raw);

    /// Cancel every pending request and drop all handlers. Idempotent.
    void Dispose();
    bool IsDisposed() const { return disposed_.load(); }

    std::chrono::milliseconds DefaultTimeout() const { return default_timeout_; }

private:
    friend class IpcResponder;

    struct PendingRequest {
        std::string type;
        std::promise<IpcMessage> promise;
        Clock::time_point deadline;
        std::chrono::milliseconds timeout;
    };

    IpcChannel(Transport transport, std::chrono::milliseconds default_timeout);

    void Write(const IpcMessage& message);
    void CompleteResponse(IpcMessage message);

    Transport transport_;
    std::chrono::milliseconds default_timeout_;
    std::atomic<bool> disposed_{false};

    mutable std::mutex mutex_;
    std::unordered_map<std::string, PendingRequest> pending_;
    std::unordered_map<std::string, AsyncHandler> handlers_;
    std::vector<MessageListener> unhandled_listeners_;
    std::vector<RawListener> raw_listeners_;
};

}  // namespace wvb
