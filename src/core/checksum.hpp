#pragma once

#include "core/entity.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <string>

namespace quire {

/**
 * Initialize libsodium. Safe to call repeatedly.
 */
[[nodiscard]] Result<void, Error> init_crypto();

/**
 * BLAKE2b-256 of `data` as lowercase hex.
 */
[[nodiscard]] std::string checksum_hex(const QByteArray& data);

/**
 * Checksum of the canonical serialization of a store state.
 */
[[nodiscard]] std::string state_checksum(const StoreState& state);

} // namespace quire
