#pragma once

#include <chatmedia/core/types.h>
#include <chatmedia/crypto/key_store.h>
#include <chatmedia/detection/image_signature.h>

#include <array>
#include <cstdint>
#include <string_view>

namespace chatmedia::crypto {

/**
 * @brief Encryption schemes found in chat client .dat blobs
 */
enum class DatScheme : uint8_t {
    Plain, ///< Already an image, copied as is
    Xor,   ///< Legacy single-byte XOR
    AesV1, ///< V4 container, fixed legacy AES key
    AesV2  ///< V4 container, per-account AES key
};

[[nodiscard]] std::string_view schemeName(DatScheme scheme) noexcept;

struct DecryptedImage {
    ByteVector bytes;
    DatScheme scheme = DatScheme::Plain;
    detection::ImageFormat format = detection::ImageFormat::Unknown;
};

/// Layout of the 15-byte V4 container header
struct V4Header {
    static constexpr std::size_t SIZE = 15;
    static constexpr std::size_t SIGNATURE_SIZE = 6;

    uint32_t aesSize = 0;
    uint32_t xorSize = 0;
};

inline constexpr std::array<uint8_t, V4Header::SIGNATURE_SIZE> V4_SIGNATURE_V1{0x07, 0x08, 0x56,
                                                                                0x31, 0x08, 0x07};
inline constexpr std::array<uint8_t, V4Header::SIGNATURE_SIZE> V4_SIGNATURE_V2{0x07, 0x08, 0x56,
                                                                                0x32, 0x08, 0x07};

/// ASCII of "cfcd208495d565ef", the key every V1 container uses
inline constexpr AesKey LEGACY_V1_AES_KEY{'c', 'f', 'c', 'd', '2', '0', '8', '4',
                                          '9', '5', 'd', '5', '6', '5', 'e', 'f'};

/**
 * @brief Pure decryptor for .dat image blobs
 *
 * Schemes are tried newest first (AesV2, AesV1, Xor) and the first output that starts
 * with a known image signature wins. Input already carrying an image signature is
 * passed through unchanged. No I/O happens here.
 */
class DatDecryptor {
public:
    explicit DatDecryptor(KeySet keys) : keys_(keys) {}

    [[nodiscard]] Result<DecryptedImage> decrypt(ByteSpan blob) const;

    /// Scheme suggested by the container header alone (Xor when no V4 signature)
    [[nodiscard]] static DatScheme detectScheme(ByteSpan blob) noexcept;

    [[nodiscard]] static ByteVector decryptXor(ByteSpan blob, uint8_t key);

    /**
     * @brief Decrypt a V4 container
     *
     * Output is the PKCS#7-unpadded AES region, then the untouched middle, then the
     * XOR tail. Structural problems or bad padding yield DecryptionFailed.
     */
    [[nodiscard]] static Result<ByteVector> decryptV4(ByteSpan blob, const AesKey& aesKey,
                                                      uint8_t xorKey);

    [[nodiscard]] static Result<V4Header> parseV4Header(ByteSpan blob);

private:
    KeySet keys_;
};

} // namespace chatmedia::crypto
