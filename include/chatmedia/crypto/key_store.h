#pragma once

#include <chatmedia/core/types.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chatmedia::crypto {

using AesKey = std::array<uint8_t, AES_KEY_SIZE>;

/**
 * @brief Decryption keys for legacy .dat blobs
 *
 * Loaded once per pipeline and shared read-only afterwards.
 */
struct KeySet {
    uint8_t xorKey = 0;
    std::optional<AesKey> aesKey;
};

/// Parse the XOR key: hex with an optional 0x prefix, first byte wins ("0x37", "37", "37ab")
[[nodiscard]] std::optional<uint8_t> parseXorKey(std::string_view text);

/**
 * @brief Parse the AES key
 *
 * Exactly 32 hex digits are hex-decoded. Any other string of at least 16 characters
 * contributes its first 16 ASCII bytes, matching the chat client's native key form.
 */
[[nodiscard]] std::optional<AesKey> parseAesKey(std::string_view text);

/**
 * @brief Immutable holder for the configured keys
 */
class KeyStore {
public:
    KeyStore() = default;
    explicit KeyStore(KeySet keys) : keys_(keys), hasXor_(true) {}

    /// Build from configuration strings. An unparseable key is an InvalidArgument.
    static Result<KeyStore> fromStrings(std::string_view xorText, std::string_view aesText);

    bool hasXorKey() const noexcept { return hasXor_; }
    bool hasAesKey() const noexcept { return keys_.aesKey.has_value(); }

    /// KeyMissing when no XOR key was configured
    Result<KeySet> keys() const;

private:
    KeySet keys_{};
    bool hasXor_ = false;
};

} // namespace chatmedia::crypto
