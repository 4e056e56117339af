#include <chatmedia/audio/voice_blob_source.h>
#include <chatmedia/core/file_utils.h>
#include <chatmedia/media/media_types.h>

namespace chatmedia::audio {

std::filesystem::path DirectoryVoiceStore::pathFor(const std::string& senderId,
                                                   int64_t timestamp) const {
    return root_ / media::sanitizeFileName(senderId) / (std::to_string(timestamp) + ".silk");
}

Result<ByteVector> DirectoryVoiceStore::fetchVoice(const std::string& senderId, int64_t timestamp) {
    if (senderId.empty()) {
        return Error{ErrorCode::SourceMissing, "Voice message has no sender"};
    }
    auto data = readFileToMemory(pathFor(senderId, timestamp));
    if (!data) {
        return Error{ErrorCode::SourceMissing, data.error().message};
    }
    return data;
}

} // namespace chatmedia::audio
