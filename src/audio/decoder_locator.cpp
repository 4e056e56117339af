#include <spdlog/spdlog.h>
#include <chatmedia/audio/decoder_locator.h>

#include <cstdlib>

#include <unistd.h>

namespace chatmedia::audio {

DecoderLocator::DecoderLocator(Options options) : options_(std::move(options)) {}

bool DecoderLocator::isExecutable(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        return false;
    return access(path.c_str(), X_OK) == 0;
}

std::optional<std::filesystem::path> DecoderLocator::executableDir() {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty())
        return std::nullopt;
    return exe.parent_path();
}

std::vector<std::filesystem::path> DecoderLocator::searchPath() const {
    std::vector<std::filesystem::path> dirs = options_.searchDirs;
    if (auto exeDir = executableDir()) {
        dirs.push_back(*exeDir / "bin");
    }
    if (!options_.extractDir.empty()) {
        dirs.push_back(options_.extractDir);
    }
    return dirs;
}

Result<std::filesystem::path> DecoderLocator::extract(const std::filesystem::path& source) const {
    if (options_.extractDir.empty()) {
        return Error{ErrorCode::DecodeFailed, "No extraction directory configured for " +
                                                  source.string()};
    }
    std::error_code ec;
    std::filesystem::create_directories(options_.extractDir, ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Cannot create " + options_.extractDir.string() + ": " +
                                             ec.message()};
    }

    const auto target = options_.extractDir / source.filename();
    if (std::filesystem::equivalent(source, target, ec)) {
        ec.clear();
    } else {
        std::filesystem::copy_file(source, target,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            return Error{ErrorCode::IOError, "Cannot extract decoder to " + target.string() + ": " +
                                                 ec.message()};
        }
    }
    std::filesystem::permissions(target,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write |
                                     std::filesystem::perms::owner_exec,
                                 std::filesystem::perm_options::add, ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Cannot mark " + target.string() + " executable: " +
                                             ec.message()};
    }
    spdlog::info("DecoderLocator: extracted {} to {}", source.string(), target.string());
    return target;
}

Result<std::filesystem::path> DecoderLocator::locate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cached_ && isExecutable(*cached_)) {
        return *cached_;
    }

    std::vector<std::filesystem::path> candidates;
    if (const char* env = std::getenv(ENV_OVERRIDE); env && *env) {
        candidates.emplace_back(env);
    }
    for (const auto& dir : searchPath()) {
        candidates.push_back(dir / options_.binaryName);
    }

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(candidate, ec))
            continue;
        if (isExecutable(candidate)) {
            spdlog::debug("DecoderLocator: using {}", candidate.string());
            cached_ = candidate;
            return candidate;
        }
        auto extracted = extract(candidate);
        if (extracted) {
            cached_ = extracted.value();
            return extracted;
        }
        spdlog::warn("DecoderLocator: {} is not executable and extraction failed: {}",
                     candidate.string(), extracted.error().message);
    }

    return Error{ErrorCode::DecodeFailed, "Speech decoder '" + options_.binaryName + "' not found"};
}

} // namespace chatmedia::audio
