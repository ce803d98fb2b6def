#include "pqchat/crypto/chat_keys.hpp"
#include <sodium.h>

namespace pqchat::crypto {

ChatKeys ChatKeys::cleaned() const {
    ChatKeys result;
    result.symmetric_key = symmetric_key.clone();
    result.algorithm = algorithm;
    result.asymmetric_discarded = true;
    return result;
}

ChatKeys ChatKeys::clone() const {
    ChatKeys result;
    result.public_key_self = public_key_self;
    result.private_key_self = private_key_self.clone();
    result.public_key_peer = public_key_peer;
    result.symmetric_key = symmetric_key.clone();
    result.algorithm = algorithm;
    result.asymmetric_discarded = asymmetric_discarded;
    return result;
}

void ChatKeys::secure_wipe() {
    private_key_self.clear();
    symmetric_key.clear();

    if (!public_key_self.empty()) {
        sodium_memzero(public_key_self.data(), public_key_self.size());
        public_key_self.clear();
    }
    if (!public_key_peer.empty()) {
        sodium_memzero(public_key_peer.data(), public_key_peer.size());
        public_key_peer.clear();
    }
}

}
