#pragma once

#include "pqchat/handshake/transport.hpp"
#include "pqchat/handshake/messages.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace pqchat::handshake {

class HandshakeOrchestrator;

// In-process delivery between orchestrators. Messages travel as encoded
// envelopes so the wire codec is exercised end to end.
class LoopbackNetwork {
public:
    enum class Delivery {
        INLINE,       // receiver handles the message on the sender's thread
        WORKER_POOL   // receiver's dispatch() queues it
    };

    // Return false to drop the message; the envelope may be modified in place
    using Interceptor = std::function<bool(const std::string& from, const std::string& to,
                                           MessageType type, std::vector<std::uint8_t>& envelope)>;

    struct Record {
        std::string from;
        std::string to;
        MessageType type;
    };

    explicit LoopbackNetwork(Delivery delivery = Delivery::INLINE);

    void attach(const std::string& peer_id, HandshakeOrchestrator& orchestrator);
    void detach(const std::string& peer_id);

    void set_interceptor(Interceptor interceptor);

    bool deliver(const std::string& from, const std::string& to, MessageType type,
                 std::vector<std::uint8_t> envelope);

    std::vector<Record> history() const;
    size_t delivered_count(MessageType type) const;

private:
    Delivery delivery_;
    mutable std::mutex mutex_;
    std::map<std::string, HandshakeOrchestrator*> endpoints_;
    Interceptor interceptor_;
    std::vector<Record> history_;
};

class LoopbackTransport : public HandshakeTransport {
public:
    LoopbackTransport(LoopbackNetwork& network, std::string local_id);

    std::future<bool> send_init_request(const std::string& peer_id, const InitRequest& message) override;
    std::future<bool> send_init_response(const std::string& peer_id, const InitResponse& message) override;
    std::future<bool> send_init_confirm(const std::string& peer_id, const InitConfirm& message) override;
    std::future<bool> send_init_signature(const std::string& peer_id, const InitSignature& message) override;

private:
    LoopbackNetwork& network_;
    std::string local_id_;

    std::future<bool> send(const std::string& peer_id, MessageType type, std::vector<std::uint8_t> envelope);
};

}
