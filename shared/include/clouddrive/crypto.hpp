/**
 * CloudDrive - Hashing helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace clouddrive::crypto
{

    void ensure_sodium_init();

    // Lower-case hex SHA-256 digest.
    std::string sha256_hex(std::span<const std::byte> data);

    std::string sha256_hex(std::string_view text);

} // namespace clouddrive::crypto
