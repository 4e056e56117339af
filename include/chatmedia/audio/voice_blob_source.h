#pragma once

#include <chatmedia/core/types.h>

#include <cstdint>
#include <filesystem>
#include <string>

namespace chatmedia::audio {

/**
 * @brief Supplies raw SILK payloads for voice messages
 */
class IVoiceBlobSource {
public:
    virtual ~IVoiceBlobSource() = default;

    /// SourceMissing when no payload exists for the message
    virtual Result<ByteVector> fetchVoice(const std::string& senderId, int64_t timestamp) = 0;
};

/**
 * @brief Voice payloads stored as `<root>/<senderId>/<timestamp>.silk`
 */
class DirectoryVoiceStore : public IVoiceBlobSource {
public:
    explicit DirectoryVoiceStore(std::filesystem::path root) : root_(std::move(root)) {}

    Result<ByteVector> fetchVoice(const std::string& senderId, int64_t timestamp) override;

    std::filesystem::path pathFor(const std::string& senderId, int64_t timestamp) const;

private:
    std::filesystem::path root_;
};

} // namespace chatmedia::audio
