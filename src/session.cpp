#include "toolwire/session.hpp"

namespace toolwire {

const char* to_string(SessionState s) {
    switch (s) {
        case SessionState::NotConnected: return "NotConnected";
        case SessionState::Initializing: return "Initializing";
        case SessionState::Ready:        return "Ready";
        case SessionState::ShuttingDown: return "ShuttingDown";
    }
    return "Unknown";
}

Session::Session() = default;

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Session::advance(SessionState next) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool legal = false;
    switch (next) {
        case SessionState::Initializing:
            legal = state_ == SessionState::NotConnected;
            break;
        case SessionState::Ready:
            legal = state_ == SessionState::Initializing;
            break;
        case SessionState::ShuttingDown:
            legal = state_ != SessionState::ShuttingDown;
            break;
        case SessionState::NotConnected:
            legal = false;
            break;
    }
    if (!legal) return false;

    if (next == SessionState::Ready) tools_.freeze();
    state_ = next;
    return true;
}

std::string Session::protocol_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return protocol_version_;
}

void Session::set_protocol_version(std::string version) {
    std::lock_guard<std::mutex> lock(mutex_);
    protocol_version_ = std::move(version);
}

void Session::set_client(std::optional<Implementation> info, ClientCapabilities caps) {
    std::lock_guard<std::mutex> lock(mutex_);
    client_info_ = std::move(info);
    client_caps_ = std::move(caps);
}

std::optional<Implementation> Session::client_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_info_;
}

ClientCapabilities Session::client_capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_caps_;
}

} // namespace toolwire
