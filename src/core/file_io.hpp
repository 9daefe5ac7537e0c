#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <string>

namespace quire {

/**
 * Replace `path` with `bytes` atomically, creating parent directories.
 */
[[nodiscard]] Status write_file_atomic(const std::string& path, const QByteArray& bytes);

[[nodiscard]] Res<QByteArray> read_file_bytes(const std::string& path);

} // namespace quire
