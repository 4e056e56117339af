#include <spdlog/spdlog.h>
#include <chatmedia/core/file_utils.h>

#include <fstream>

namespace chatmedia {

Result<ByteVector> readFileToMemory(const std::filesystem::path& path) {
    try {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file) {
            return Error{ErrorCode::SourceMissing, "Cannot open file: " + path.string()};
        }

        const auto size = file.tellg();
        if (size <= 0) {
            return Error{ErrorCode::InvalidArgument, "File is empty or invalid: " + path.string()};
        }

        ByteVector data(static_cast<size_t>(size));
        file.seekg(0);
        file.read(reinterpret_cast<char*>(data.data()), size);

        if (!file) {
            return Error{ErrorCode::IOError, "Failed to read file data: " + path.string()};
        }

        return data;
    } catch (const std::exception& e) {
        return Error{ErrorCode::IOError, std::string("File read error: ") + e.what()};
    }
}

Result<void> writeFile(const std::filesystem::path& path, ByteSpan data) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IOError,
                         "Cannot create " + path.parent_path().string() + ": " + ec.message()};
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IOError, "Cannot open for writing: " + path.string()};
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        return Error{ErrorCode::IOError, "Short write: " + path.string()};
    }
    return {};
}

Result<void> commitFile(const std::filesystem::path& from, const std::filesystem::path& to) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (ec) {
        return Error{ErrorCode::IOError,
                     "Cannot move " + from.string() + " to " + to.string() + ": " + ec.message()};
    }
    return {};
}

void removeQuietly(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        spdlog::debug("Failed to remove {}: {}", path.string(), ec.message());
    }
}

} // namespace chatmedia
