#include <chatmedia/crypto/dat_decryptor.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>

namespace chatmedia::crypto {

namespace {

struct CipherCtx {
    EVP_CIPHER_CTX* ctx = nullptr;

    CipherCtx() : ctx(EVP_CIPHER_CTX_new()) {}
    ~CipherCtx() {
        if (ctx) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }

    CipherCtx(const CipherCtx&) = delete;
    CipherCtx& operator=(const CipherCtx&) = delete;
};

bool hasSignature(ByteSpan blob, const std::array<uint8_t, V4Header::SIGNATURE_SIZE>& sig) {
    if (blob.size() < sig.size())
        return false;
    for (std::size_t i = 0; i < sig.size(); ++i) {
        if (std::to_integer<uint8_t>(blob[i]) != sig[i])
            return false;
    }
    return true;
}

uint32_t readLe32(ByteSpan data, std::size_t offset) {
    return static_cast<uint32_t>(std::to_integer<uint8_t>(data[offset])) |
           (static_cast<uint32_t>(std::to_integer<uint8_t>(data[offset + 1])) << 8) |
           (static_cast<uint32_t>(std::to_integer<uint8_t>(data[offset + 2])) << 16) |
           (static_cast<uint32_t>(std::to_integer<uint8_t>(data[offset + 3])) << 24);
}

Result<ByteVector> aesEcbDecrypt(ByteSpan cipherText, const AesKey& key) {
    CipherCtx cipher;
    if (!cipher.ctx) {
        return Error{ErrorCode::InternalError, "Failed to create EVP_CIPHER_CTX"};
    }
    if (EVP_DecryptInit_ex(cipher.ctx, EVP_aes_128_ecb(), nullptr, key.data(), nullptr) != 1) {
        return Error{ErrorCode::InternalError, "Failed to initialize AES-128-ECB"};
    }
    // Padding is checked by hand so that malformed blocks are rejected strictly
    EVP_CIPHER_CTX_set_padding(cipher.ctx, 0);

    ByteVector plain(cipherText.size() + AES_KEY_SIZE);
    int outLen = 0;
    if (EVP_DecryptUpdate(cipher.ctx, reinterpret_cast<unsigned char*>(plain.data()), &outLen,
                          reinterpret_cast<const unsigned char*>(cipherText.data()),
                          static_cast<int>(cipherText.size())) != 1) {
        return Error{ErrorCode::DecryptionFailed, "AES update failed"};
    }
    int finalLen = 0;
    if (EVP_DecryptFinal_ex(cipher.ctx, reinterpret_cast<unsigned char*>(plain.data()) + outLen,
                            &finalLen) != 1) {
        return Error{ErrorCode::DecryptionFailed, "AES finalize failed"};
    }
    plain.resize(static_cast<std::size_t>(outLen + finalLen));
    return plain;
}

Result<void> stripPkcs7(ByteVector& data) {
    if (data.empty()) {
        return Error{ErrorCode::DecryptionFailed, "Empty AES plaintext"};
    }
    const auto pad = std::to_integer<uint8_t>(data.back());
    if (pad == 0 || pad > AES_KEY_SIZE || pad > data.size()) {
        return Error{ErrorCode::DecryptionFailed, "Invalid PKCS#7 padding length"};
    }
    for (std::size_t i = data.size() - pad; i < data.size(); ++i) {
        if (std::to_integer<uint8_t>(data[i]) != pad) {
            return Error{ErrorCode::DecryptionFailed, "Inconsistent PKCS#7 padding"};
        }
    }
    data.resize(data.size() - pad);
    return {};
}

} // namespace

std::string_view schemeName(DatScheme scheme) noexcept {
    switch (scheme) {
        case DatScheme::Plain:
            return "plain";
        case DatScheme::Xor:
            return "xor";
        case DatScheme::AesV1:
            return "aes-v1";
        case DatScheme::AesV2:
            return "aes-v2";
    }
    return "unknown";
}

DatScheme DatDecryptor::detectScheme(ByteSpan blob) noexcept {
    if (detection::isImage(blob))
        return DatScheme::Plain;
    if (hasSignature(blob, V4_SIGNATURE_V2))
        return DatScheme::AesV2;
    if (hasSignature(blob, V4_SIGNATURE_V1))
        return DatScheme::AesV1;
    return DatScheme::Xor;
}

ByteVector DatDecryptor::decryptXor(ByteSpan blob, uint8_t key) {
    ByteVector out(blob.size());
    const auto k = std::byte{key};
    std::transform(blob.begin(), blob.end(), out.begin(), [k](std::byte b) { return b ^ k; });
    return out;
}

Result<V4Header> DatDecryptor::parseV4Header(ByteSpan blob) {
    if (blob.size() < V4Header::SIZE) {
        return Error{ErrorCode::DecryptionFailed, "Blob shorter than V4 header"};
    }
    if (!hasSignature(blob, V4_SIGNATURE_V1) && !hasSignature(blob, V4_SIGNATURE_V2)) {
        return Error{ErrorCode::DecryptionFailed, "Missing V4 signature"};
    }
    V4Header header;
    header.aesSize = readLe32(blob, 6);
    header.xorSize = readLe32(blob, 10);
    return header;
}

Result<ByteVector> DatDecryptor::decryptV4(ByteSpan blob, const AesKey& aesKey, uint8_t xorKey) {
    auto header = parseV4Header(blob);
    if (!header) {
        return header.error();
    }

    const auto body = blob.subspan(V4Header::SIZE);
    // A whole padding block is present even when aesSize is already aligned
    const std::size_t alignedAes =
        static_cast<std::size_t>(header->aesSize) + (AES_KEY_SIZE - header->aesSize % AES_KEY_SIZE);
    if (alignedAes > body.size()) {
        return Error{ErrorCode::DecryptionFailed, "AES region exceeds blob body"};
    }
    const std::size_t rest = body.size() - alignedAes;
    if (header->xorSize > rest) {
        return Error{ErrorCode::DecryptionFailed, "XOR region exceeds blob body"};
    }

    auto plain = aesEcbDecrypt(body.first(alignedAes), aesKey);
    if (!plain) {
        return plain.error();
    }
    ByteVector out = std::move(plain).value();
    if (auto r = stripPkcs7(out); !r) {
        return r.error();
    }

    const auto raw = body.subspan(alignedAes, rest - header->xorSize);
    const auto tail = body.subspan(alignedAes + raw.size());
    out.reserve(out.size() + raw.size() + tail.size());
    out.insert(out.end(), raw.begin(), raw.end());
    auto xored = decryptXor(tail, xorKey);
    out.insert(out.end(), xored.begin(), xored.end());
    return out;
}

Result<DecryptedImage> DatDecryptor::decrypt(ByteSpan blob) const {
    if (blob.empty()) {
        return Error{ErrorCode::SourceMissing, "Empty blob"};
    }

    if (auto format = detection::detectImageFormat(blob); format != detection::ImageFormat::Unknown) {
        return DecryptedImage{ByteVector(blob.begin(), blob.end()), DatScheme::Plain, format};
    }

    std::string lastError = "no scheme produced an image";

    auto accept = [](ByteVector bytes, DatScheme scheme) -> std::optional<DecryptedImage> {
        auto format = detection::detectImageFormat(bytes);
        if (format == detection::ImageFormat::Unknown)
            return std::nullopt;
        return DecryptedImage{std::move(bytes), scheme, format};
    };

    if (hasSignature(blob, V4_SIGNATURE_V2)) {
        if (keys_.aesKey) {
            auto out = decryptV4(blob, *keys_.aesKey, keys_.xorKey);
            if (out) {
                if (auto img = accept(std::move(out).value(), DatScheme::AesV2))
                    return std::move(*img);
                lastError = "aes-v2 output has no image signature";
            } else {
                lastError = "aes-v2: " + out.error().message;
            }
        } else {
            spdlog::debug("DatDecryptor: V2 container but no AES key configured");
            lastError = "aes-v2 container requires an AES key";
        }
    }

    if (hasSignature(blob, V4_SIGNATURE_V1)) {
        auto out = decryptV4(blob, LEGACY_V1_AES_KEY, keys_.xorKey);
        if (out) {
            if (auto img = accept(std::move(out).value(), DatScheme::AesV1))
                return std::move(*img);
            lastError = "aes-v1 output has no image signature";
        } else {
            lastError = "aes-v1: " + out.error().message;
        }
    }

    if (auto img = accept(decryptXor(blob, keys_.xorKey), DatScheme::Xor))
        return std::move(*img);

    return Error{ErrorCode::DecryptionFailed, lastError};
}

} // namespace chatmedia::crypto
