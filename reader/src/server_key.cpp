#include "server_key.hpp"
#include "ecdh.hpp"
#include "hex.hpp"
#include "blake3.h"
#include <utility>

namespace glog {

// ── Key id derivation ─────────────────────────────────────────────────────────
// Deterministic in the public key alone, so a public-only copy of the key
// carries the same id as the file holding the scalar.

std::string derive_key_id(const std::vector<uint8_t>& pk) {
    blake3_hasher h;
    blake3_hasher_init_derive_key(&h, "glog server-key id v1");
    blake3_hasher_update(&h, pk.data(), pk.size());

    uint8_t out[16];
    blake3_hasher_finalize(&h, out, sizeof(out));
    return hex_encode(out, sizeof(out));
}

ServerKey make_server_key(const std::string& alias, KdfAlg kdf, CipherContinuity continuity) {
    ecdh::KeyPair kp = ecdh::keygen();

    ServerKey key;
    key.alias      = alias;
    key.pk         = std::move(kp.pk);
    key.sk         = std::move(kp.sk);
    key.id         = derive_key_id(key.pk);
    key.kdf        = kdf;
    key.continuity = continuity;
    return key;
}

} // namespace glog
