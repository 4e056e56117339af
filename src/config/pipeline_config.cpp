#include <spdlog/spdlog.h>
#include <chatmedia/config/config_helpers.h>
#include <chatmedia/config/pipeline_config.h>

#include <cctype>
#include <limits>

namespace chatmedia::config {

namespace {

const std::string* find(const ConfigValues& values, const std::string& key) {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty())
        return nullptr;
    return &it->second;
}

Result<void> readMs(const ConfigValues& values, const std::string& key,
                    std::chrono::milliseconds& out) {
    if (const auto* raw = find(values, key)) {
        auto parsed = parse_ms(*raw);
        if (!parsed) {
            return Error{ErrorCode::InvalidArgument, "Invalid duration for " + key + ": " + *raw};
        }
        out = *parsed;
    }
    return {};
}

template <typename T>
Result<void> readUnsigned(const ConfigValues& values, const std::string& key, T& out) {
    if (const auto* raw = find(values, key)) {
        // stoull would accept "-1" and leading blanks
        if (!std::isdigit(static_cast<unsigned char>(raw->front()))) {
            return Error{ErrorCode::InvalidArgument, "Invalid number for " + key + ": " + *raw};
        }
        try {
            std::size_t consumed = 0;
            auto n = std::stoull(*raw, &consumed);
            if (consumed != raw->size()) {
                return Error{ErrorCode::InvalidArgument, "Invalid number for " + key + ": " + *raw};
            }
            if (n > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
                return Error{ErrorCode::InvalidArgument, "Number out of range for " + key + ": " + *raw};
            }
            out = static_cast<T>(n);
        } catch (const std::exception&) {
            return Error{ErrorCode::InvalidArgument, "Invalid number for " + key + ": " + *raw};
        }
    }
    return {};
}

void readPath(const ConfigValues& values, const std::string& key, std::filesystem::path& out) {
    if (const auto* raw = find(values, key)) {
        out = expand_tilde(*raw);
    }
}

} // namespace

void applyDefaultPaths(PipelineConfig& config) {
    const auto cacheDir = get_cache_dir();
    if (config.outputRoot.empty()) {
        config.outputRoot = cacheDir / "output";
    }
    if (config.tempDir.empty()) {
        config.tempDir = cacheDir / "tmp";
    }
    if (config.decoderExtractDir.empty()) {
        config.decoderExtractDir = cacheDir / "bin";
    }
}

Result<PipelineConfig> loadPipelineConfig(const std::filesystem::path& path) {
    PipelineConfig config;

    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
        spdlog::debug("PipelineConfig: loading {}", path.string());
        const auto values = parse_config_file(path);

        if (const auto* v = find(values, "keys.xor"))
            config.xorKey = *v;
        if (const auto* v = find(values, "keys.aes"))
            config.aesKey = *v;

        readPath(values, "paths.source_root", config.sourceRoot);
        readPath(values, "paths.output_root", config.outputRoot);
        readPath(values, "paths.temp_dir", config.tempDir);
        readPath(values, "paths.voice_root", config.voiceRoot);
        readPath(values, "paths.decoder_extract_dir", config.decoderExtractDir);
        if (const auto* v = find(values, "paths.decoder_dirs"))
            config.decoderDirs = parse_path_list(*v);

        if (auto r = readUnsigned(values, "pipeline.workers", config.workers); !r)
            return r.error();
        if (auto r = readMs(values, "pipeline.task_timeout_ms", config.taskTimeout); !r)
            return r.error();
        if (auto r = readMs(values, "pipeline.voice_task_timeout_ms", config.voiceTaskTimeout); !r)
            return r.error();
        if (const auto* v = find(values, "pipeline.deep_image_check")) {
            auto b = parse_bool(*v);
            if (!b) {
                return Error{ErrorCode::InvalidArgument, "Invalid boolean for deep_image_check: " + *v};
            }
            config.deepImageCheck = *b;
        }

        auto& voice = config.voice;
        if (const auto* v = find(values, "voice.decoder"))
            voice.decoderName = *v;
        if (auto r = readUnsigned(values, "voice.sample_rate", voice.sampleRate); !r)
            return r.error();
        if (auto r = readUnsigned(values, "voice.bitrate", voice.bitrate); !r)
            return r.error();
        if (auto r = readMs(values, "voice.decode_timeout_ms", voice.decodeTimeout); !r)
            return r.error();
        if (auto r = readMs(values, "voice.encode_timeout_ms", voice.encodeTimeout); !r)
            return r.error();
        if (auto r = readMs(values, "voice.heartbeat_ms", voice.heartbeat); !r)
            return r.error();
        if (auto r = readUnsigned(values, "voice.encoder_workers", voice.encoderWorkers); !r)
            return r.error();
        if (const auto* v = find(values, "voice.encoder")) {
            if (*v == "pooled") {
                voice.encoderMode = EncoderMode::Pooled;
            } else if (*v == "dedicated") {
                voice.encoderMode = EncoderMode::Dedicated;
            } else {
                return Error{ErrorCode::InvalidArgument, "Unknown voice.encoder mode: " + *v};
            }
        }
        if (voice.sampleRate == 0) {
            return Error{ErrorCode::InvalidArgument, "voice.sample_rate must be positive"};
        }
    } else {
        spdlog::debug("PipelineConfig: no config at '{}', using defaults", path.string());
    }

    applyDefaultPaths(config);
    return config;
}

} // namespace chatmedia::config
