#include "core/checksum.hpp"
#include "core/serialization.hpp"

#include <sodium.h>

#include <array>
#include <stdexcept>

namespace quire {

namespace {
constexpr size_t DIGEST_SIZE = crypto_generichash_BYTES;  // 32
}

Result<void, Error> init_crypto() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error::fatal("Failed to initialize libsodium"));
    }
    return Result<void, Error>::ok();
}

std::string checksum_hex(const QByteArray& data) {
    if (init_crypto().is_err()) {
        throw std::runtime_error("libsodium unavailable");
    }

    std::array<unsigned char, DIGEST_SIZE> digest{};
    crypto_generichash(digest.data(), digest.size(),
                       reinterpret_cast<const unsigned char*>(data.constData()),
                       static_cast<unsigned long long>(data.size()),
                       nullptr, 0);

    std::array<char, DIGEST_SIZE * 2 + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
    return std::string(hex.data(), DIGEST_SIZE * 2);
}

std::string state_checksum(const StoreState& state) {
    return checksum_hex(json::canonical_bytes(state));
}

} // namespace quire
