#pragma once

#include <chatmedia/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace chatmedia::config {

enum class EncoderMode { Pooled, Dedicated };

struct VoiceSettings {
    std::string decoderName = "silk_v3_decoder";
    uint32_t sampleRate = 24000;
    uint32_t bitrate = 32000;
    std::chrono::milliseconds decodeTimeout{45000};
    std::chrono::milliseconds encodeTimeout{90000};
    std::chrono::milliseconds heartbeat{5000};
    EncoderMode encoderMode = EncoderMode::Pooled;
    std::size_t encoderWorkers = 2;
};

/**
 * @brief Everything a MediaPipeline needs to run
 *
 * Values come from the `[keys]`, `[paths]`, `[pipeline]` and `[voice]` sections
 * of config.toml. Missing keys keep the defaults below.
 */
struct PipelineConfig {
    // [keys] raw strings; KeyStore parses them
    std::string xorKey;
    std::string aesKey;

    // [paths]
    std::filesystem::path sourceRoot;
    std::filesystem::path outputRoot;
    std::filesystem::path tempDir;
    std::filesystem::path voiceRoot;
    std::vector<std::filesystem::path> decoderDirs;
    std::filesystem::path decoderExtractDir;

    // [pipeline]
    std::size_t workers = 0; // 0 = derive from hardware
    std::chrono::milliseconds taskTimeout{120000};
    std::chrono::milliseconds voiceTaskTimeout{150000};
    bool deepImageCheck = true;

    VoiceSettings voice;
};

/**
 * @brief Load a pipeline configuration from a TOML-style file
 *
 * A missing file yields defaults (with temp and extraction dirs under the user cache
 * dir). Malformed numeric or boolean values are reported as InvalidArgument.
 */
Result<PipelineConfig> loadPipelineConfig(const std::filesystem::path& path);

/// Fill directories left empty with locations derived from the output root and cache dir
void applyDefaultPaths(PipelineConfig& config);

} // namespace chatmedia::config
