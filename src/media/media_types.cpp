#include <chatmedia/media/media_types.h>

namespace chatmedia::media {

std::string_view kindName(MediaKind kind) noexcept {
    switch (kind) {
        case MediaKind::Image:
            return "image";
        case MediaKind::Voice:
            return "voice";
        case MediaKind::Sticker:
            return "sticker";
    }
    return "image";
}

std::string_view kindDirectory(MediaKind kind) noexcept {
    switch (kind) {
        case MediaKind::Image:
            return "images";
        case MediaKind::Voice:
            return "voices";
        case MediaKind::Sticker:
            return "emojis";
    }
    return "images";
}

std::optional<MediaKind> parseKind(std::string_view name) {
    if (name == "image")
        return MediaKind::Image;
    if (name == "voice")
        return MediaKind::Voice;
    if (name == "sticker" || name == "emoji")
        return MediaKind::Sticker;
    return std::nullopt;
}

std::string ContentIdentifier::toString() const {
    return std::string(kindName(kind)) + ":" + value;
}

std::string_view variantName(AttachmentVariant v) noexcept {
    switch (v) {
        case AttachmentVariant::Big:
            return "big";
        case AttachmentVariant::Original:
            return "original";
        case AttachmentVariant::High:
            return "high";
        case AttachmentVariant::Cache:
            return "cache";
        case AttachmentVariant::Thumbnail:
            return "thumbnail";
        case AttachmentVariant::Other:
            return "other";
    }
    return "other";
}

std::string_view variantSuffix(AttachmentVariant v) noexcept {
    switch (v) {
        case AttachmentVariant::Big:
            return "_b";
        case AttachmentVariant::Original:
            return "";
        case AttachmentVariant::High:
            return "_h";
        case AttachmentVariant::Cache:
            return "_c";
        case AttachmentVariant::Thumbnail:
            return "_t";
        case AttachmentVariant::Other:
            return "_x";
    }
    return "";
}

std::string_view taskStateName(TaskState state) noexcept {
    switch (state) {
        case TaskState::Pending:
            return "pending";
        case TaskState::Running:
            return "running";
        case TaskState::Succeeded:
            return "succeeded";
        case TaskState::Failed:
            return "failed";
        case TaskState::TimedOut:
            return "timed_out";
    }
    return "pending";
}

std::string_view resolutionStateName(ResolutionState state) noexcept {
    switch (state) {
        case ResolutionState::Resolved:
            return "resolved";
        case ResolutionState::InProgress:
            return "in_progress";
        case ResolutionState::NeedsDecode:
            return "needs_decode";
        case ResolutionState::Unresolvable:
            return "unresolvable";
    }
    return "unresolvable";
}

ResolutionState resolutionStateFor(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return ResolutionState::Resolved;
        case ErrorCode::Unresolvable:
        case ErrorCode::SourceMissing:
            return ResolutionState::Unresolvable;
        default:
            return ResolutionState::NeedsDecode;
    }
}

std::string sanitizeFileName(std::string_view name) {
    std::string out(name);
    for (auto& c : out) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                        c == '_' || c == '@' || c == '.' || c == '-';
        if (!ok)
            c = '_';
    }
    return out;
}

} // namespace chatmedia::media
