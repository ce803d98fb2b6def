#include "pqchat/handshake/loopback_transport.hpp"
#include "pqchat/handshake/handshake_orchestrator.hpp"
#include "pqchat/core/logger.hpp"
#include <algorithm>

namespace pqchat::handshake {

LoopbackNetwork::LoopbackNetwork(Delivery delivery)
    : delivery_(delivery) {
}

void LoopbackNetwork::attach(const std::string& peer_id, HandshakeOrchestrator& orchestrator) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_[peer_id] = &orchestrator;
}

void LoopbackNetwork::detach(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_.erase(peer_id);
}

void LoopbackNetwork::set_interceptor(Interceptor interceptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    interceptor_ = std::move(interceptor);
}

bool LoopbackNetwork::deliver(const std::string& from, const std::string& to, MessageType type,
                              std::vector<std::uint8_t> envelope) {
    HandshakeOrchestrator* target = nullptr;
    Interceptor interceptor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = endpoints_.find(to);
        if (it == endpoints_.end()) {
            LOG_WARN("Loopback: no endpoint for {}", to);
            return false;
        }
        target = it->second;
        interceptor = interceptor_;
    }

    if (interceptor && !interceptor(from, to, type, envelope)) {
        LOG_DEBUG("Loopback: {} from {} to {} dropped", to_string(type), from, to);
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(Record{from, to, type});
    }

    if (delivery_ == Delivery::WORKER_POOL) {
        return target->dispatch(from, std::move(envelope));
    }

    auto result = target->process(from, envelope);
    if (!result) {
        LOG_DEBUG("Loopback: {} rejected by {}: {}", to_string(type), to, result.message);
    }
    return true;
}

std::vector<LoopbackNetwork::Record> LoopbackNetwork::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

size_t LoopbackNetwork::delivered_count(MessageType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(history_.begin(), history_.end(),
                                             [type](const Record& record) { return record.type == type; }));
}

LoopbackTransport::LoopbackTransport(LoopbackNetwork& network, std::string local_id)
    : network_(network), local_id_(std::move(local_id)) {
}

std::future<bool> LoopbackTransport::send(const std::string& peer_id, MessageType type,
                                          std::vector<std::uint8_t> envelope) {
    std::promise<bool> promise;
    promise.set_value(network_.deliver(local_id_, peer_id, type, std::move(envelope)));
    return promise.get_future();
}

std::future<bool> LoopbackTransport::send_init_request(const std::string& peer_id, const InitRequest& message) {
    return send(peer_id, MessageType::INIT_REQUEST, encode_message(MessageType::INIT_REQUEST, message));
}

std::future<bool> LoopbackTransport::send_init_response(const std::string& peer_id, const InitResponse& message) {
    return send(peer_id, MessageType::INIT_RESPONSE, encode_message(MessageType::INIT_RESPONSE, message));
}

std::future<bool> LoopbackTransport::send_init_confirm(const std::string& peer_id, const InitConfirm& message) {
    return send(peer_id, MessageType::INIT_CONFIRM, encode_message(MessageType::INIT_CONFIRM, message));
}

std::future<bool> LoopbackTransport::send_init_signature(const std::string& peer_id, const InitSignature& message) {
    return send(peer_id, MessageType::INIT_SIGNATURE, encode_message(MessageType::INIT_SIGNATURE, message));
}

}
