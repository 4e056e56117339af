#include <chatmedia/crypto/key_store.h>

#include <cctype>

namespace chatmedia::crypto {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string_view stripSpace(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

} // namespace

std::optional<uint8_t> parseXorKey(std::string_view text) {
    auto s = stripSpace(text);
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X'))
        s.remove_prefix(2);
    if (s.empty())
        return std::nullopt;
    // A single digit is accepted as a low nibble ("7" -> 0x07)
    if (s.size() == 1) {
        int v = hexValue(s[0]);
        return v < 0 ? std::nullopt : std::optional<uint8_t>(static_cast<uint8_t>(v));
    }
    int hi = hexValue(s[0]);
    int lo = hexValue(s[1]);
    if (hi < 0 || lo < 0)
        return std::nullopt;
    return static_cast<uint8_t>((hi << 4) | lo);
}

std::optional<AesKey> parseAesKey(std::string_view text) {
    auto s = stripSpace(text);
    AesKey key{};

    if (s.size() == AES_KEY_SIZE * 2) {
        bool allHex = true;
        for (std::size_t i = 0; i < AES_KEY_SIZE && allHex; ++i) {
            int hi = hexValue(s[2 * i]);
            int lo = hexValue(s[2 * i + 1]);
            if (hi < 0 || lo < 0) {
                allHex = false;
                break;
            }
            key[i] = static_cast<uint8_t>((hi << 4) | lo);
        }
        if (allHex)
            return key;
    }

    if (s.size() < AES_KEY_SIZE)
        return std::nullopt;
    for (std::size_t i = 0; i < AES_KEY_SIZE; ++i)
        key[i] = static_cast<uint8_t>(s[i]);
    return key;
}

Result<KeyStore> KeyStore::fromStrings(std::string_view xorText, std::string_view aesText) {
    KeyStore store;
    if (!stripSpace(xorText).empty()) {
        auto xorKey = parseXorKey(xorText);
        if (!xorKey) {
            return Error{ErrorCode::InvalidArgument, "Invalid XOR key: " + std::string(xorText)};
        }
        store.keys_.xorKey = *xorKey;
        store.hasXor_ = true;
    }
    if (!stripSpace(aesText).empty()) {
        auto aesKey = parseAesKey(aesText);
        if (!aesKey) {
            return Error{ErrorCode::InvalidArgument, "AES key must be 32 hex digits or at least 16 characters"};
        }
        store.keys_.aesKey = *aesKey;
    }
    return store;
}

Result<KeySet> KeyStore::keys() const {
    if (!hasXor_) {
        return Error{ErrorCode::KeyMissing, "No XOR key configured"};
    }
    return keys_;
}

} // namespace chatmedia::crypto
