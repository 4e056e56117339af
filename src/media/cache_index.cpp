#include <spdlog/spdlog.h>
#include <chatmedia/media/cache_index.h>
#include <chatmedia/media/variant_resolver.h>

#include <array>

namespace chatmedia::media {

namespace {

constexpr std::string_view STAGING_MARKER = ".staging";
constexpr std::array<MediaKind, 3> ALL_KINDS{MediaKind::Image, MediaKind::Voice, MediaKind::Sticker};

} // namespace

CacheIndex::CacheIndex(std::filesystem::path outputRoot) : root_(std::move(outputRoot)) {}

bool CacheIndex::isStagingFile(const std::filesystem::path& path) {
    const auto name = path.filename().string();
    auto pos = name.find(STAGING_MARKER);
    return pos != std::string::npos &&
           (pos + STAGING_MARKER.size() == name.size() || name[pos + STAGING_MARKER.size()] == '.');
}

std::filesystem::path CacheIndex::directoryFor(MediaKind kind) const {
    return root_ / std::string(kindDirectory(kind));
}

std::filesystem::path CacheIndex::outputPathFor(const ContentIdentifier& id,
                                                std::string_view extension) const {
    return directoryFor(id.kind) / (sanitizeFileName(id.value) + std::string(extension));
}

std::filesystem::path CacheIndex::stagingPathFor(const ContentIdentifier& id,
                                                 std::optional<AttachmentVariant> variant,
                                                 std::string_view extension) const {
    std::string name = sanitizeFileName(id.value);
    if (variant) {
        name += variantSuffix(*variant);
    }
    name += STAGING_MARKER;
    name += extension;
    return directoryFor(id.kind) / name;
}

std::size_t CacheIndex::scanKind(MediaKind kind,
                                 std::unordered_map<ContentIdentifier, CacheEntry>& out) {
    const auto dir = directoryFor(kind);
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return 0;
    }

    std::size_t count = 0;
    std::filesystem::recursive_directory_iterator it(
        dir, std::filesystem::directory_options::skip_permission_denied, ec);
    std::filesystem::recursive_directory_iterator end;
    while (!ec && it != end) {
        std::error_code typeEc;
        const auto& path = it->path();
        if (it->is_regular_file(typeEc) && !isStagingFile(path)) {
            const auto stem = path.stem().string();
            ContentIdentifier id{kind, stem};
            out.try_emplace(id, CacheEntry{id, kind, path, false});
            ++count;

            // "<hash>_b.jpg" also answers for "<hash>"
            if (kind != MediaKind::Voice) {
                auto alias = VariantResolver::normalize(path.filename().string());
                if (!alias.empty() && alias != stem) {
                    ContentIdentifier aliasId{kind, alias};
                    out.try_emplace(aliasId, CacheEntry{aliasId, kind, path, false});
                }
            }
        }
        it.increment(ec);
    }
    if (ec) {
        spdlog::warn("CacheIndex: scan of {} stopped early: {}", dir.string(), ec.message());
    }
    return count;
}

Result<std::size_t> CacheIndex::rebuild() {
    std::unordered_map<ContentIdentifier, CacheEntry> fresh;
    std::size_t total = 0;
    for (auto kind : ALL_KINDS) {
        total += scanKind(kind, fresh);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Entries recorded while the scan ran win over what the scan found
        for (auto& [id, entry] : entries_) {
            fresh.insert_or_assign(id, entry);
        }
        entries_ = std::move(fresh);
    }
    spdlog::info("CacheIndex: indexed {} outputs under {}", total, root_.string());
    return total;
}

Result<void> CacheIndex::ensureBuilt() {
    std::shared_future<Result<void>> future;
    std::promise<Result<void>> promise;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!buildFuture_.valid()) {
            buildFuture_ = promise.get_future().share();
            owner = true;
        }
        future = buildFuture_;
    }

    if (owner) {
        auto result = rebuild();
        if (result) {
            promise.set_value(Result<void>{});
        } else {
            promise.set_value(result.error());
            std::lock_guard<std::mutex> lock(mutex_);
            buildFuture_ = {};
        }
    }
    return future.get();
}

bool CacheIndex::built() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buildFuture_.valid() &&
           buildFuture_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

std::optional<CacheEntry> CacheIndex::lookup(const ContentIdentifier& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

bool CacheIndex::record(CacheEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = entry.id;
    return entries_.try_emplace(std::move(id), std::move(entry)).second;
}

void CacheIndex::invalidate(const ContentIdentifier& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(id);
}

std::size_t CacheIndex::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace chatmedia::media
