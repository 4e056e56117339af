#include <spdlog/spdlog.h>
#include <chatmedia/core/file_utils.h>
#include <chatmedia/crypto/dat_decryptor.h>
#include <chatmedia/detection/image_signature.h>
#include <chatmedia/media/media_pipeline.h>

#include <algorithm>
#include <cctype>

namespace chatmedia::media {

namespace {

constexpr std::string_view STAGING_IMAGE_EXT = ".part";
constexpr std::string_view VOICE_EXT = ".mp3";
constexpr auto BATCH_POLL = std::chrono::milliseconds{20};

std::string lowerTrimmed(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string errorLabel(const ResolveResult& result) {
    return result ? std::string(stageLabel(ProgressStage::Completed))
                  : std::string(errorToString(result.error().code));
}

} // namespace

MediaPipeline::MediaPipeline(config::PipelineConfig config, crypto::KeyStore keys,
                             std::shared_ptr<audio::IVoiceBlobSource> voiceSource,
                             std::shared_ptr<audio::DecoderLocator> locator)
    : config_(std::move(config)), keys_(keys), resolver_(config_.sourceRoot),
      validator_(MediaValidator::Options{config_.deepImageCheck}), cache_(config_.outputRoot) {
    if (voiceSource) {
        if (!locator) {
            locator = std::make_shared<audio::DecoderLocator>(audio::DecoderLocator::Options{
                config_.voice.decoderName, config_.decoderDirs, config_.decoderExtractDir});
        }
        transcoder_ = std::make_unique<audio::SpeechTranscoder>(
            audio::SpeechTranscoder::Options{config_.voice, config_.tempDir}, std::move(voiceSource),
            std::move(locator));
    }
    coordinator_ = std::make_unique<ConcurrencyCoordinator>(
        cache_, validator_, ConcurrencyCoordinator::Options{config_.workers});
    spdlog::info("MediaPipeline: sources={} output={} workers={}", config_.sourceRoot.string(),
                 config_.outputRoot.string(), coordinator_->poolSize());
}

MediaPipeline::~MediaPipeline() {
    coordinator_->shutdown();
    std::unique_lock<std::mutex> lock(batchMutex_);
    batchCv_.wait(lock, [this] { return activeBatches_ == 0; });
}

Result<std::unique_ptr<MediaPipeline>> MediaPipeline::create(const config::PipelineConfig& config) {
    auto keys = crypto::KeyStore::fromStrings(config.xorKey, config.aesKey);
    if (!keys) {
        return keys.error();
    }
    std::shared_ptr<audio::IVoiceBlobSource> voices;
    if (!config.voiceRoot.empty()) {
        voices = std::make_shared<audio::DirectoryVoiceStore>(config.voiceRoot);
    }
    try {
        return std::make_unique<MediaPipeline>(config, keys.value(), std::move(voices));
    } catch (const std::exception& e) {
        return Error{ErrorCode::InternalError, std::string("Pipeline setup failed: ") + e.what()};
    }
}

ContentIdentifier MediaPipeline::identify(const AttachmentReference& ref) const {
    ContentIdentifier id;
    id.kind = ref.kind;
    if (ref.kind == MediaKind::Voice) {
        if (!ref.senderId.empty()) {
            id.value = std::to_string(ref.timestamp) + "_" + std::to_string(ref.localMessageId) + "_" +
                       sanitizeFileName(ref.senderId);
        }
        return id;
    }
    if (ref.contentHash) {
        id.value = lowerTrimmed(*ref.contentHash);
    }
    if (id.value.empty() && ref.fallbackName) {
        id.value = VariantResolver::normalize(*ref.fallbackName);
    }
    return id;
}

void MediaPipeline::rememberOutcome(const ContentIdentifier& id, const ResolveResult& result) {
    std::lock_guard<std::mutex> lock(outcomeMutex_);
    if (result) {
        lastErrors_.erase(id);
    } else {
        lastErrors_[id] = result.error().code;
    }
}

ResolveFuture MediaPipeline::resolve(const AttachmentReference& ref, ProgressCallback progress) {
    const auto id = identify(ref);
    if (id.empty()) {
        std::promise<ResolveResult> promise;
        promise.set_value(Error{ErrorCode::InvalidArgument, "Attachment reference has no identifier"});
        return promise.get_future().share();
    }

    ResolveWork work;
    std::chrono::milliseconds timeout;
    if (ref.kind == MediaKind::Voice) {
        timeout = config_.voiceTaskTimeout;
        work = [this, id, ref](const TaskContext& ctx) {
            auto result = resolveVoice(id, ref, ctx);
            rememberOutcome(id, result);
            return result;
        };
    } else {
        timeout = config_.taskTimeout;
        work = [this, id](const TaskContext& ctx) {
            auto result = resolveImage(id, ctx);
            rememberOutcome(id, result);
            return result;
        };
    }
    return coordinator_->resolve(id, std::move(work), timeout, std::move(progress));
}

ResolveResult MediaPipeline::resolveImage(const ContentIdentifier& id, const TaskContext& ctx) {
    ctx.report(ProgressStage::Indexing, 0, 0, id.toString());
    if (auto scanned = resolver_.ensureScanned(); !scanned) {
        return scanned.error();
    }

    const auto candidates = resolver_.candidates(id);
    if (candidates.empty()) {
        return Error{ErrorCode::SourceMissing, "No source blob for " + id.toString()};
    }

    std::optional<crypto::DatDecryptor> decryptor;
    std::string lastError = "no variant attempted";

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        const auto& candidate = candidates[i];
        const auto variant = variantName(candidate.variant);
        if (ctx.shouldStop()) {
            return Error{ErrorCode::Timeout, "Cancelled before variant " + std::string(variant)};
        }

        const auto staging = cache_.stagingPathFor(id, candidate.variant, STAGING_IMAGE_EXT);
        if (validator_.isBlacklisted(staging)) {
            lastError = std::string(variant) + ": rejected earlier this session";
            continue;
        }

        ctx.report(ProgressStage::Decrypting, i + 1, candidates.size(), std::string(variant));
        auto blob = readFileToMemory(candidate.path);
        if (!blob) {
            lastError = std::string(variant) + ": " + blob.error().message;
            continue;
        }

        ByteVector plain;
        if (detection::isImage(blob.value())) {
            plain = std::move(blob).value();
        } else {
            if (!decryptor) {
                auto keys = keys_.keys();
                if (!keys) {
                    return keys.error();
                }
                decryptor.emplace(keys.value());
            }
            auto decrypted = decryptor->decrypt(blob.value());
            if (!decrypted) {
                lastError = std::string(variant) + ": " + decrypted.error().message;
                spdlog::debug("MediaPipeline: {} {} failed to decrypt: {}", id.toString(), variant,
                              decrypted.error().message);
                continue;
            }
            plain = std::move(decrypted).value().bytes;
        }
        const auto format = detection::detectImageFormat(ByteSpan(plain));

        if (ctx.shouldStop()) {
            return Error{ErrorCode::Timeout, "Cancelled before writing " + std::string(variant)};
        }
        if (auto written = writeFile(staging, plain); !written) {
            lastError = std::string(variant) + ": " + written.error().message;
            removeQuietly(staging);
            continue;
        }

        if (auto verdict = validator_.check(staging, id.kind); !verdict) {
            removeQuietly(staging);
            lastError = std::string(variant) + ": " + verdict.error().message;
            continue;
        }

        const auto finalPath = cache_.outputPathFor(id, detection::extensionFor(format));
        if (auto committed = commitFile(staging, finalPath); !committed) {
            removeQuietly(staging);
            lastError = std::string(variant) + ": " + committed.error().message;
            continue;
        }
        validator_.markValid(finalPath);

        ResolvedMedia media;
        media.id = id;
        media.kind = id.kind;
        media.path = finalPath;
        media.variant = candidate.variant;
        media.degraded = candidate.variant != candidates.front().variant;
        if (media.degraded) {
            spdlog::warn("MediaPipeline: {} fell back from {} to {}", id.toString(),
                         variantName(candidates.front().variant), variant);
        }
        ctx.report(ProgressStage::Completed, i + 1, candidates.size(), finalPath.string());
        return media;
    }

    return Error{ErrorCode::Unresolvable, "All " + std::to_string(candidates.size()) +
                                              " variants failed for " + id.toString() +
                                              "; last: " + lastError};
}

ResolveResult MediaPipeline::resolveVoice(const ContentIdentifier& id, const AttachmentReference& ref,
                                          const TaskContext& ctx) {
    if (!transcoder_) {
        return Error{ErrorCode::SourceMissing, "No voice source configured"};
    }

    const auto staging = cache_.stagingPathFor(id, std::nullopt, VOICE_EXT);
    if (validator_.isBlacklisted(staging)) {
        return Error{ErrorCode::CorruptOutput, "Voice output rejected earlier this session"};
    }

    auto transcoded = transcoder_->transcode(
        audio::TranscodeRequest{ref.senderId, ref.timestamp, staging}, ctx);
    if (!transcoded) {
        return transcoded.error();
    }

    if (auto verdict = validator_.check(staging, MediaKind::Voice); !verdict) {
        removeQuietly(staging);
        return verdict.error();
    }

    const auto finalPath = cache_.outputPathFor(id, VOICE_EXT);
    if (auto committed = commitFile(staging, finalPath); !committed) {
        removeQuietly(staging);
        return committed.error();
    }
    validator_.markValid(finalPath);

    ResolvedMedia media;
    media.id = id;
    media.kind = MediaKind::Voice;
    media.path = finalPath;
    ctx.report(ProgressStage::Completed, 1, 1, finalPath.string());
    return media;
}

std::future<std::vector<BatchItem>>
MediaPipeline::resolveBatch(std::vector<AttachmentReference> refs, std::size_t concurrencyHint,
                            BatchProgressCallback onProgress) {
    {
        std::lock_guard<std::mutex> lock(batchMutex_);
        ++activeBatches_;
    }

    return std::async(std::launch::async, [this, refs = std::move(refs), concurrencyHint,
                                           onProgress = std::move(onProgress)]() {
        struct BatchGuard {
            MediaPipeline* self;
            ~BatchGuard() {
                std::lock_guard<std::mutex> lock(self->batchMutex_);
                --self->activeBatches_;
                self->batchCv_.notify_all();
            }
        } guard{this};

        std::vector<ContentIdentifier> ids;
        ids.reserve(refs.size());
        std::vector<std::size_t> unique; // index of first reference per identifier
        std::unordered_map<ContentIdentifier, std::size_t> firstIndex;
        for (std::size_t i = 0; i < refs.size(); ++i) {
            ids.push_back(identify(refs[i]));
            if (firstIndex.try_emplace(ids.back(), i).second) {
                unique.push_back(i);
            }
        }

        const std::size_t pool = coordinator_->poolSize();
        const std::size_t lanes =
            std::max<std::size_t>(1, std::min(concurrencyHint == 0 ? pool : concurrencyHint, pool));
        const std::size_t total = unique.size();
        spdlog::info("MediaPipeline: batch of {} references, {} unique, {} lanes", refs.size(), total,
                     lanes);

        std::unordered_map<ContentIdentifier, ResolveResult> results;
        std::vector<std::pair<std::size_t, ResolveFuture>> window;
        std::size_t done = 0;

        // Reap whichever lanes have finished until fewer than `limit` remain busy
        auto reapUntilBelow = [&](std::size_t limit) {
            while (!window.empty() && window.size() >= limit) {
                bool reaped = false;
                for (auto it = window.begin(); it != window.end();) {
                    if (it->second.wait_for(std::chrono::seconds{0}) != std::future_status::ready) {
                        ++it;
                        continue;
                    }
                    const auto index = it->first;
                    auto result = it->second.get();
                    it = window.erase(it);
                    reaped = true;
                    ++done;
                    if (onProgress) {
                        onProgress(done, total, errorLabel(result) + ":" + ids[index].toString());
                    }
                    results.insert_or_assign(ids[index], std::move(result));
                }
                if (!reaped) {
                    window.front().second.wait_for(BATCH_POLL);
                }
            }
        };

        for (auto index : unique) {
            reapUntilBelow(lanes);
            window.emplace_back(index, resolve(refs[index]));
        }
        reapUntilBelow(1);

        std::vector<BatchItem> items;
        items.reserve(refs.size());
        for (std::size_t i = 0; i < refs.size(); ++i) {
            auto it = results.find(ids[i]);
            items.push_back(BatchItem{refs[i], ids[i],
                                      it != results.end()
                                          ? it->second
                                          : ResolveResult(Error{ErrorCode::InternalError,
                                                                "Missing batch result"})});
        }
        return items;
    });
}

ResolutionState MediaPipeline::resolutionState(const AttachmentReference& ref) {
    const auto id = identify(ref);
    if (id.empty()) {
        return ResolutionState::Unresolvable;
    }

    if (auto entry = cache_.lookup(id)) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(entry->resolvedPath, ec) &&
            !validator_.isBlacklisted(entry->resolvedPath)) {
            return ResolutionState::Resolved;
        }
    }
    if (coordinator_->inFlight(id)) {
        return ResolutionState::InProgress;
    }

    {
        std::lock_guard<std::mutex> lock(outcomeMutex_);
        if (auto it = lastErrors_.find(id); it != lastErrors_.end()) {
            return resolutionStateFor(it->second);
        }
    }

    if (id.kind == MediaKind::Voice) {
        if (validator_.isBlacklisted(cache_.stagingPathFor(id, std::nullopt, VOICE_EXT)))
            return ResolutionState::Unresolvable;
        return ResolutionState::NeedsDecode;
    }

    if (resolver_.scanned()) {
        const auto candidates = resolver_.candidates(id);
        if (candidates.empty())
            return ResolutionState::Unresolvable;
        const bool allRejected =
            std::all_of(candidates.begin(), candidates.end(), [&](const VariantCandidate& c) {
                return validator_.isBlacklisted(cache_.stagingPathFor(id, c.variant, STAGING_IMAGE_EXT));
            });
        if (allRejected)
            return ResolutionState::Unresolvable;
    }
    return ResolutionState::NeedsDecode;
}

Result<Duration> MediaPipeline::voiceDuration(const AttachmentReference& ref) {
    const auto id = identify(ref);
    if (id.empty() || id.kind != MediaKind::Voice) {
        return Error{ErrorCode::InvalidArgument, "Not a voice reference"};
    }
    if (auto entry = cache_.lookup(id)) {
        if (auto d = validator_.readAudioDuration(entry->resolvedPath))
            return d;
    }
    if (!transcoder_) {
        return Error{ErrorCode::SourceMissing, "No voice source configured"};
    }
    const auto& voice = config_.voice;
    TaskContext ctx(voice.decodeTimeout);
    return transcoder_->measureDuration(ref.senderId, ref.timestamp, ctx);
}

PipelineStats MediaPipeline::stats() const {
    PipelineStats s;
    s.coordinator = coordinator_->stats();
    s.cacheEntries = cache_.size();
    s.sourceKeys = resolver_.size();
    s.blacklisted = validator_.blacklistSize();
    return s;
}

} // namespace chatmedia::media
