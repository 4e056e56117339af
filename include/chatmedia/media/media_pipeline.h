#pragma once

#include <chatmedia/audio/speech_transcoder.h>
#include <chatmedia/audio/voice_blob_source.h>
#include <chatmedia/config/pipeline_config.h>
#include <chatmedia/core/types.h>
#include <chatmedia/crypto/key_store.h>
#include <chatmedia/media/cache_index.h>
#include <chatmedia/media/concurrency_coordinator.h>
#include <chatmedia/media/media_types.h>
#include <chatmedia/media/media_validator.h>
#include <chatmedia/media/progress.h>
#include <chatmedia/media/variant_resolver.h>

#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace chatmedia::media {

struct BatchItem {
    AttachmentReference ref;
    ContentIdentifier id;
    ResolveResult result;
};

struct PipelineStats {
    CoordinatorStats coordinator;
    std::size_t cacheEntries = 0;
    std::size_t sourceKeys = 0;
    std::size_t blacklisted = 0;
};

/**
 * @brief Entry point turning attachment references into playable or viewable files
 *
 * Owns every cache it uses; nothing is shared between pipeline instances. Calls never
 * block the caller: results arrive through futures.
 *
 * @code
 * auto pipeline = MediaPipeline::create(config).value();
 * auto future = pipeline->resolve(ref);
 * if (auto media = future.get()) {
 *     open(media->path);
 * }
 * @endcode
 */
class MediaPipeline {
public:
    /**
     * @param voiceSource Optional; when null voice references fail with SourceMissing
     * @param locator Optional; when null one is built from the config
     */
    MediaPipeline(config::PipelineConfig config, crypto::KeyStore keys,
                  std::shared_ptr<audio::IVoiceBlobSource> voiceSource = nullptr,
                  std::shared_ptr<audio::DecoderLocator> locator = nullptr);
    ~MediaPipeline();

    MediaPipeline(const MediaPipeline&) = delete;
    MediaPipeline& operator=(const MediaPipeline&) = delete;

    /// Build keys and the directory voice store from a loaded config
    static Result<std::unique_ptr<MediaPipeline>> create(const config::PipelineConfig& config);

    [[nodiscard]] ContentIdentifier identify(const AttachmentReference& ref) const;

    ResolveFuture resolve(const AttachmentReference& ref, ProgressCallback progress = {});

    /**
     * @brief Resolve many references with bounded parallelism
     *
     * References sharing an identifier run once. A lane is refilled as soon as any
     * running resolution finishes, so one slow item does not hold back the rest.
     * Results come back in input order. The pipeline must outlive the returned future.
     */
    std::future<std::vector<BatchItem>> resolveBatch(std::vector<AttachmentReference> refs,
                                                     std::size_t concurrencyHint,
                                                     BatchProgressCallback onProgress = {});

    [[nodiscard]] ResolutionState resolutionState(const AttachmentReference& ref);

    /// Voice length: TagLib on a resolved MP3, otherwise decoded PCM size
    Result<Duration> voiceDuration(const AttachmentReference& ref);

    [[nodiscard]] PipelineStats stats() const;

    const config::PipelineConfig& config() const noexcept { return config_; }
    CacheIndex& cache() noexcept { return cache_; }
    MediaValidator& validator() noexcept { return validator_; }
    VariantResolver& sources() noexcept { return resolver_; }

private:
    ResolveResult resolveImage(const ContentIdentifier& id, const TaskContext& ctx);
    ResolveResult resolveVoice(const ContentIdentifier& id, const AttachmentReference& ref,
                               const TaskContext& ctx);
    void rememberOutcome(const ContentIdentifier& id, const ResolveResult& result);

    config::PipelineConfig config_;
    crypto::KeyStore keys_;
    VariantResolver resolver_;
    MediaValidator validator_;
    CacheIndex cache_;
    std::unique_ptr<audio::SpeechTranscoder> transcoder_;

    mutable std::mutex outcomeMutex_;
    std::unordered_map<ContentIdentifier, ErrorCode> lastErrors_;

    std::mutex batchMutex_;
    std::condition_variable batchCv_;
    std::size_t activeBatches_ = 0;

    // Declared last: its workers call back into the members above
    std::unique_ptr<ConcurrencyCoordinator> coordinator_;
};

} // namespace chatmedia::media
