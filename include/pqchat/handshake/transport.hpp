#pragma once

#include "pqchat/handshake/messages.hpp"
#include <future>
#include <string>

namespace pqchat::handshake {

// Outbound side of the chat transport (relay server or local peer network).
// Each future resolves to false when the message could not be handed off.
class HandshakeTransport {
public:
    virtual ~HandshakeTransport() = default;

    virtual std::future<bool> send_init_request(const std::string& peer_id, const InitRequest& message) = 0;
    virtual std::future<bool> send_init_response(const std::string& peer_id, const InitResponse& message) = 0;
    virtual std::future<bool> send_init_confirm(const std::string& peer_id, const InitConfirm& message) = 0;
    virtual std::future<bool> send_init_signature(const std::string& peer_id, const InitSignature& message) = 0;
};

}
