#include "IpcChannel.h"

#include <exception>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "base/BridgeError.h"
#include "base/Log.h"

namespace wvb {

using nlohmann::json;

// ---------------------------------------------------------------------------
// IpcResponder
// ---------------------------------------------------------------------------

IpcResponder::IpcResponder(std::weak_ptr<IpcChannel> channel, std::optional<std::string> id)
    : channel_(std::move(channel)),
      id_(std::move(id)),
      completed_(std::make_shared<std::atomic<bool>>(false)) {}

bool IpcResponder::TryComplete() {
    return !completed_->exchange(true);
}

bool IpcResponder::IsCompleted() const {
    return completed_->load();
}

bool IpcResponder::Resolve(json payload) {
    if (!TryComplete()) {
        return false;
    }
    if (!id_) {
        return true;
    }
    auto channel = channel_.lock();
    if (channel == nullptr || channel->IsDisposed()) {
        return false;
    }
    try {
        channel->Write(IpcMessage::Response(*id_, std::move(payload)));
    } catch (const std::exception& e) {
        log::Get(log::kIpc)->error("sending response {} failed: {}", *id_, e.what());
        return false;
    }
    return true;
}

bool IpcResponder::Reject(const std::string& error) {
    if (!TryComplete()) {
        return false;
    }
    if (!id_) {
        log::Get(log::kIpc)->warn("handler failed for a message without id: {}", error);
        return true;
    }
    auto channel = channel_.lock();
    if (channel == nullptr || channel->IsDisposed()) {
        return false;
    }
    try {
        channel->Write(IpcMessage::ErrorResponse(*id_, error));
    } catch (const std::exception& e) {
        log::Get(log::kIpc)->error("sending error response {} failed: {}", *id_, e.what());
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// IpcChannel lifetime
// ---------------------------------------------------------------------------

std::shared_ptr<IpcChannel> IpcChannel::Create(Transport transport,
                                               std::chrono::milliseconds default_timeout) {
    return std::shared_ptr<IpcChannel>(new IpcChannel(std::move(transport), default_timeout));
}

IpcChannel::IpcChannel(Transport transport, std::chrono::milliseconds default_timeout)
    : transport_(std::move(transport)), default_timeout_(default_timeout) {}

IpcChannel::~IpcChannel() {
    Dispose();
}

void IpcChannel::Dispose() {
    if (disposed_.exchange(true)) {
        return;
    }
    std::unordered_map<std::string, PendingRequest> pending;
    std::unordered_map<std::string, AsyncHandler> handlers;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        pending.swap(pending_);
        handlers.swap(handlers_);
        unhandled_listeners_.clear();
        raw_listeners_.clear();
    }
    for (auto& [id, request] : pending) {
        request.promise.set_exception(std::make_exception_ptr(
            IpcError(IpcError::Kind::kCancelled, id,
                     fmt::format("IPC request '{}' cancelled: channel disposed", request.type))));
    }
    if (!pending.empty()) {
        log::Get(log::kIpc)->debug("disposed channel with {} pending request(s)", pending.size());
    }
}

// ---------------------------------------------------------------------------
// Outbound
// ---------------------------------------------------------------------------

void IpcChannel::Write(const IpcMessage& message) {
    if (IsDisposed()) {
        throw BridgeError(ErrorCode::kInvalidState, "IPC channel is disposed");
    }
    if (!transport_) {
        throw BridgeError(ErrorCode::kInvalidState, "IPC channel has no transport");
    }
    try {
        transport_(message.Serialize());
    } catch (const std::exception& e) {
        throw IpcError(IpcError::Kind::kTransport, message.id.value_or(""),
                       fmt::format("sending IPC message '{}' failed: {}", message.type,
                                   e.what()));
    }
}

void IpcChannel::Send(const std::string& type, json payload) {
    Write(IpcMessage::Notification(type, std::move(payload)));
}

IpcCall IpcChannel::Request(const std::string& type, json payload,
                            std::optional<std::chrono::milliseconds> timeout) {
    if (IsDisposed()) {
        throw BridgeError(ErrorCode::kInvalidState, "IPC channel is disposed");
    }

    const auto effective_timeout = timeout.value_or(default_timeout_);
    IpcCall call;
    call.id = GenerateCorrelationId();
    {
        PendingRequest request;
        request.type = type;
        request.timeout = effective_timeout;
        request.deadline = Clock::now() + effective_timeout;
        call.result = request.promise.get_future();
        std::lock_guard<std::mutex> guard(mutex_);
        pending_.emplace(call.id, std::move(request));
    }

    try {
        Write(IpcMessage::Request(type, std::move(payload), call.id));
    } catch (...) {
        std::lock_guard<std::mutex> guard(mutex_);
        pending_.erase(call.id);
        throw;
    }
    return call;
}

bool IpcChannel::Cancel(const std::string& id) {
    PendingRequest request;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            return false;
        }
        request = std::move(it->second);
        pending_.erase(it);
    }
    request.promise.set_exception(std::make_exception_ptr(IpcError(
        IpcError::Kind::kCancelled, id, fmt::format("IPC request '{}' cancelled", request.type))));
    return true;
}

std::size_t IpcChannel::ExpireOverdue(Clock::time_point now) {
    std::vector<std::pair<std::string, PendingRequest>> expired;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (now >= it->second.deadline) {
                expired.emplace_back(it->first, std::move(it->second));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& [id, request] : expired) {
        log::Get(log::kIpc)->warn("IPC request '{}' ({}) timed out", request.type, id);
        request.promise.set_exception(std::make_exception_ptr(
            IpcError(IpcError::Kind::kTimeout, id,
                     fmt::format("IPC request '{}' timed out after {} ms", request.type,
                                 request.timeout.count()))));
    }
    return expired.size();
}

std::size_t IpcChannel::PendingCount() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return pending_.size();
}

// ---------------------------------------------------------------------------
// Inbound
// ---------------------------------------------------------------------------

void IpcChannel::On(const std::string& type, Handler handler) {
    OnAsync(type, [handler = std::move(handler)](const IpcMessage& message,
                                                 IpcResponder responder) {
        responder.Resolve(handler(message));
    });
}

void IpcChannel::OnNotify(const std::string& type, NotifyHandler handler) {
    OnAsync(type, [handler = std::move(handler)](const IpcMessage& message,
                                                 IpcResponder responder) {
        handler(message);
        responder.Resolve();
    });
}

void IpcChannel::OnAsync(const std::string& type, AsyncHandler handler) {
    std::lock_guard<std::mutex> guard(mutex_);
    handlers_[type] = std::move(handler);
}

bool IpcChannel::Off(const std::string& type) {
    std::lock_guard<std::mutex> guard(mutex_);
    return handlers_.erase(type) > 0;
}

void IpcChannel::OnUnhandled(MessageListener listener) {
    std::lock_guard<std::mutex> guard(mutex_);
    unhandled_listeners_.push_back(std::move(listener));
}

void IpcChannel::OnRawMessage(RawListener listener) {
    std::lock_guard<std::mutex> guard(mutex_);
    raw_listeners_.push_back(std::move(listener));
}

void IpcChannel::CompleteResponse(IpcMessage message) {
    const std::string id = *message.id;
    PendingRequest request;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            log::Get(log::kIpc)->debug("dropping response for unknown or completed id {}", id);
            return;
        }
        request = std::move(it->second);
        pending_.erase(it);
    }
    if (message.error) {
        request.promise.set_exception(std::make_exception_ptr(
            IpcError(IpcError::Kind::kRemote, id, *message.error)));
    } else {
        request.promise.set_value(std::move(message));
    }
}

void IpcChannel::HandleIncoming(std::string_view raw) {
    if (IsDisposed()) {
        return;
    }

    auto message = IpcMessage::Parse(raw);
    if (!message) {
        std::vector<RawListener> listeners;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            listeners = raw_listeners_;
        }
        if (listeners.empty()) {
            log::Get(log::kIpc)->debug("ignoring non-envelope message");
        }
        const std::string text(raw);
        for (const auto& listener : listeners) {
            listener(text);
        }
        return;
    }

    if (message->is_response) {
        CompleteResponse(std::move(*message));
        return;
    }

    AsyncHandler handler;
    std::vector<MessageListener> unhandled;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (auto it = handlers_.find(message->type); it != handlers_.end()) {
            handler = it->second;
        } else {
            unhandled = unhandled_listeners_;
        }
    }

    if (!handler) {
        if (unhandled.empty()) {
            log::Get(log::kIpc)->debug("no handler for IPC message '{}'", message->type);
        }
        for (const auto& listener : unhandled) {
            listener(*message);
        }
        return;
    }

    IpcResponder responder(weak_from_this(), message->id);
    try {
        handler(*message, responder);
    } catch (const std::exception& e) {
        log::Get(log::kIpc)->error("handler for '{}' threw: {}", message->type, e.what());
        responder.Reject(e.what());
    }
}

}  // namespace wvb
