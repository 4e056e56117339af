#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace chatmedia::media {

enum class ProgressStage : uint8_t { Indexing, Decrypting, Decoding, Encoding, Heartbeat, Completed };

constexpr std::string_view stageLabel(ProgressStage stage) noexcept {
    switch (stage) {
        case ProgressStage::Indexing:
            return "indexing";
        case ProgressStage::Decrypting:
            return "decrypting";
        case ProgressStage::Decoding:
            return "decoding";
        case ProgressStage::Encoding:
            return "encoding";
        case ProgressStage::Heartbeat:
            return "heartbeat";
        case ProgressStage::Completed:
            return "completed";
    }
    return "completed";
}

// Progress information emitted by background work
struct PipelineProgress {
    ProgressStage stage = ProgressStage::Indexing;
    uint64_t current = 0;
    uint64_t total = 0;
    std::string detail;
};

// Progress callback type
using ProgressCallback = std::function<void(const PipelineProgress&)>;

// Batch completion callback: (done, total, label of the item that just finished)
using BatchProgressCallback =
    std::function<void(std::size_t done, std::size_t total, const std::string& label)>;

} // namespace chatmedia::media
