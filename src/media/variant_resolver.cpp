#include <spdlog/spdlog.h>
#include <chatmedia/media/variant_resolver.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace chatmedia::media {

namespace {

constexpr std::size_t HASH_LENGTH = 32;

constexpr std::array<std::string_view, 5> IMAGE_EXTENSIONS{".jpg", ".jpeg", ".png", ".gif", ".webp"};

std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool isHexHash(std::string_view s) {
    return s.size() == HASH_LENGTH &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string stemOf(std::string_view name) {
    std::string lower = toLower(name);
    auto slash = lower.find_last_of("/\\");
    if (slash != std::string::npos)
        lower.erase(0, slash + 1);
    auto dot = lower.rfind('.');
    if (dot != std::string::npos && dot != 0)
        lower.erase(dot);
    return lower;
}

AttachmentVariant variantForLetter(char c) {
    switch (c) {
        case 'b':
            return AttachmentVariant::Big;
        case 'h':
            return AttachmentVariant::High;
        case 'c':
            return AttachmentVariant::Cache;
        case 't':
            return AttachmentVariant::Thumbnail;
        default:
            return AttachmentVariant::Other;
    }
}

struct TagMatch {
    AttachmentVariant variant = AttachmentVariant::Original;
    std::size_t length = 0; // characters to strip, 0 when untagged
};

// Recognizes "_hd", "_b", "_h", "_c", "_t", ".t", "<hash>_x" and "<hash>x"
TagMatch matchTag(std::string_view stem) {
    if (stem.size() > 3 && stem.ends_with("_hd"))
        return {AttachmentVariant::High, 3};
    // "<name>.t.dat" is the client's other thumbnail spelling
    if (stem.size() > 2 && stem.ends_with(".t"))
        return {AttachmentVariant::Thumbnail, 2};
    if (stem.size() > 2 && stem[stem.size() - 2] == '_' &&
        std::isalpha(static_cast<unsigned char>(stem.back()))) {
        auto variant = variantForLetter(stem.back());
        if (variant != AttachmentVariant::Other || isHexHash(stem.substr(0, stem.size() - 2)))
            return {variant, 2};
    }
    if (stem.size() == HASH_LENGTH + 1 && isHexHash(stem.substr(0, HASH_LENGTH)) &&
        std::isalpha(static_cast<unsigned char>(stem.back())) &&
        !std::isxdigit(static_cast<unsigned char>(stem.back()))) {
        return {variantForLetter(stem.back()), 1};
    }
    return {};
}

} // namespace

VariantResolver::VariantResolver(std::filesystem::path sourceRoot) : root_(std::move(sourceRoot)) {}

std::string VariantResolver::normalize(std::string_view name) {
    std::string stem = stemOf(name);
    auto tag = matchTag(stem);
    stem.erase(stem.size() - tag.length);
    return stem;
}

AttachmentVariant VariantResolver::classify(std::string_view fileName) {
    return matchTag(stemOf(fileName)).variant;
}

bool VariantResolver::isIndexable(const std::filesystem::path& path) {
    const auto ext = toLower(path.extension().string());
    if (ext == ".dat")
        return true;
    return std::find(IMAGE_EXTENSIONS.begin(), IMAGE_EXTENSIONS.end(), ext) != IMAGE_EXTENSIONS.end();
}

void VariantResolver::insertLocked(std::unordered_map<std::string, VariantMap>& index,
                                   const std::filesystem::path& path) {
    const auto fileName = path.filename().string();
    auto key = normalize(fileName);
    if (key.empty())
        return;
    auto& variants = index[key];
    auto variant = classify(fileName);
    auto [it, inserted] = variants.emplace(variant, path);
    // Deterministic tie-break on duplicate variants
    if (!inserted && path < it->second) {
        it->second = path;
    }
}

Result<std::size_t> VariantResolver::scan() {
    std::unordered_map<std::string, VariantMap> fresh;
    std::size_t files = 0;

    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        spdlog::warn("VariantResolver: source root '{}' is not a directory", root_.string());
        std::lock_guard<std::mutex> lock(mutex_);
        index_.clear();
        return static_cast<std::size_t>(0);
    }

    std::filesystem::recursive_directory_iterator it(
        root_, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Cannot walk " + root_.string() + ": " + ec.message()};
    }
    std::filesystem::recursive_directory_iterator end;
    while (it != end) {
        std::error_code typeEc;
        if (it->is_regular_file(typeEc) && isIndexable(it->path())) {
            insertLocked(fresh, it->path());
            ++files;
        }
        it.increment(ec);
        if (ec) {
            spdlog::warn("VariantResolver: scan of {} stopped early: {}", root_.string(), ec.message());
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        index_ = std::move(fresh);
    }
    spdlog::info("VariantResolver: indexed {} files under {}", files, root_.string());
    return files;
}

Result<void> VariantResolver::ensureScanned() {
    std::shared_future<Result<void>> future;
    std::promise<Result<void>> promise;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!scanFuture_.valid()) {
            scanFuture_ = promise.get_future().share();
            owner = true;
        }
        future = scanFuture_;
    }

    if (owner) {
        auto result = scan();
        if (result) {
            promise.set_value(Result<void>{});
        } else {
            promise.set_value(result.error());
            // Allow a later caller to retry a failed scan
            std::lock_guard<std::mutex> lock(mutex_);
            scanFuture_ = {};
        }
    }
    return future.get();
}

bool VariantResolver::scanned() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scanFuture_.valid() &&
           scanFuture_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void VariantResolver::observe(const std::filesystem::path& path) {
    if (!isIndexable(path))
        return;
    std::lock_guard<std::mutex> lock(mutex_);
    insertLocked(index_, path);
}

std::vector<VariantCandidate> VariantResolver::candidates(const ContentIdentifier& id) const {
    std::vector<VariantCandidate> out;
    if (id.empty())
        return out;
    const auto key = normalize(id.value);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end())
        return out;
    out.reserve(it->second.size());
    // std::map iterates in ascending enum order, which is ascending rank
    for (auto v = it->second.rbegin(); v != it->second.rend(); ++v) {
        out.push_back(VariantCandidate{v->first, v->second});
    }
    return out;
}

std::size_t VariantResolver::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

} // namespace chatmedia::media
