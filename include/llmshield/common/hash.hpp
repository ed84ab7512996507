#pragma once

#include <string>

namespace llmshield::common {

/// Lower-case hex SHA-256 digest; stable across processes and platforms.
[[nodiscard]] std::string sha256_hex(const std::string &text);

} // namespace llmshield::common
