#include "clouddrive/crypto.hpp"

#include <array>
#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace clouddrive::crypto
{

    namespace
    {

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        void ensure_initialized_once()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                if (sodium_init() < 0)
                {
                    throw std::runtime_error("libsodium initialization failed");
                } });
        }

    } // namespace

    void ensure_sodium_init()
    {
        ensure_initialized_once();
    }

    std::string sha256_hex(std::span<const std::byte> data)
    {
        ensure_initialized_once();
        std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
        if (crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char *>(data.data()), data.size()) != 0)
        {
            throw std::runtime_error("crypto_hash_sha256 failed");
        }
        return to_hex(digest);
    }

    std::string sha256_hex(std::string_view text)
    {
        return sha256_hex(std::as_bytes(std::span<const char>(text.data(), text.size())));
    }

} // namespace clouddrive::crypto
