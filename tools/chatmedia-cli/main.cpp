#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chatmedia/config/config_helpers.h>
#include <chatmedia/config/pipeline_config.h>
#include <chatmedia/media/media_pipeline.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace chatmedia;

constexpr int EXIT_PARTIAL = 2;

struct CliOptions {
    fs::path manifest;
    std::string configPath;
    std::size_t concurrency = 0;
    bool verbose = false;
};

// A manifest is a JSON array of objects:
//   {"kind": "image|voice|sticker", "hash": "...", "name": "...",
//    "sender": "...", "timestamp": 0, "local_id": 0}
Result<std::vector<media::AttachmentReference>> loadManifest(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::SourceMissing, "Cannot open manifest: " + path.string()};
    }

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidArgument, std::string("Malformed manifest: ") + e.what()};
    }
    if (!doc.is_array()) {
        return Error{ErrorCode::InvalidArgument, "Manifest must be a JSON array"};
    }

    std::vector<media::AttachmentReference> refs;
    refs.reserve(doc.size());
    for (const auto& item : doc) {
        if (!item.is_object()) {
            return Error{ErrorCode::InvalidArgument, "Manifest entries must be objects"};
        }
        auto kind = media::parseKind(item.value("kind", std::string("image")));
        if (!kind) {
            return Error{ErrorCode::InvalidArgument,
                         "Unknown kind: " + item.value("kind", std::string())};
        }

        media::AttachmentReference ref;
        ref.kind = *kind;
        if (item.contains("hash") && item["hash"].is_string())
            ref.contentHash = item["hash"].get<std::string>();
        if (item.contains("name") && item["name"].is_string())
            ref.fallbackName = item["name"].get<std::string>();
        ref.senderId = item.value("sender", std::string());
        ref.timestamp = item.value("timestamp", int64_t{0});
        ref.localMessageId = item.value("local_id", int64_t{0});
        refs.push_back(std::move(ref));
    }
    return refs;
}

Result<std::unique_ptr<media::MediaPipeline>> openPipeline(const CliOptions& opts) {
    const auto path = config::get_config_path(opts.configPath);
    auto cfg = config::loadPipelineConfig(path);
    if (!cfg) {
        return cfg.error();
    }
    auto loaded = std::move(cfg).value();
    config::applyDefaultPaths(loaded);
    spdlog::debug("chatmedia: config {}", path.string());
    return media::MediaPipeline::create(loaded);
}

int runResolve(const CliOptions& opts) {
    auto refs = loadManifest(opts.manifest);
    if (!refs) {
        spdlog::error("{}", refs.error().message);
        return 1;
    }
    auto pipeline = openPipeline(opts);
    if (!pipeline) {
        spdlog::error("{}", pipeline.error().message);
        return 1;
    }

    auto batch = pipeline.value()->resolveBatch(
        std::move(refs).value(), opts.concurrency,
        [](std::size_t done, std::size_t total, const std::string& label) {
            spdlog::info("[{}/{}] {}", done, total, label);
        });
    const auto items = batch.get();

    json out = json::array();
    bool allResolved = true;
    for (const auto& item : items) {
        json j;
        j["id"] = item.id.value;
        j["kind"] = std::string(media::kindName(item.id.kind));
        if (item.result) {
            const auto& media = item.result.value();
            j["path"] = media.path.string();
            j["variant"] = media.variant ? json(std::string(media::variantName(*media.variant)))
                                         : json(nullptr);
            j["degraded"] = media.degraded;
            j["cached"] = media.fromCache;
        } else {
            allResolved = false;
            j["error"] = item.result.error().message;
            j["code"] = std::string(errorToString(item.result.error().code));
        }
        out.push_back(std::move(j));
    }
    std::cout << out.dump(2) << std::endl;

    const auto s = pipeline.value()->stats();
    spdlog::debug("chatmedia: executions={} cache_hits={} joins={} failures={} timeouts={}",
                  s.coordinator.executions, s.coordinator.cacheHits, s.coordinator.dedupJoins,
                  s.coordinator.failures, s.coordinator.timeouts);
    return allResolved ? 0 : EXIT_PARTIAL;
}

int runStatus(const CliOptions& opts) {
    auto refs = loadManifest(opts.manifest);
    if (!refs) {
        spdlog::error("{}", refs.error().message);
        return 1;
    }
    auto pipeline = openPipeline(opts);
    if (!pipeline) {
        spdlog::error("{}", pipeline.error().message);
        return 1;
    }

    auto& p = *pipeline.value();
    // Probing does not decrypt, but unknown candidates need a scan first
    if (auto scanned = p.sources().ensureScanned(); !scanned) {
        spdlog::warn("Source scan failed: {}", scanned.error().message);
    }
    if (auto built = p.cache().ensureBuilt(); !built) {
        spdlog::warn("Cache index unavailable: {}", built.error().message);
    }

    json out = json::array();
    bool allResolved = true;
    for (const auto& ref : refs.value()) {
        const auto state = p.resolutionState(ref);
        allResolved = allResolved && state == media::ResolutionState::Resolved;
        out.push_back({{"id", p.identify(ref).value},
                       {"kind", std::string(media::kindName(ref.kind))},
                       {"state", std::string(media::resolutionStateName(state))}});
    }
    std::cout << out.dump(2) << std::endl;
    return allResolved ? 0 : EXIT_PARTIAL;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        spdlog::set_level(spdlog::level::warn);
        spdlog::set_pattern("[%H:%M:%S] [%l] %v");

        CLI::App app{"chatmedia - resolve chat attachments into viewable media"};
        app.require_subcommand(1);

        CliOptions opts;
        auto addCommon = [&](CLI::App* cmd) {
            cmd->add_option("--manifest", opts.manifest, "JSON array of attachment references")
                ->required()
                ->check(CLI::ExistingFile);
            cmd->add_option("--config", opts.configPath, "Config file (default: XDG config dir)");
            cmd->add_flag("-v,--verbose", opts.verbose, "Enable debug logging");
        };

        auto* resolve = app.add_subcommand("resolve", "Decrypt or transcode referenced media");
        addCommon(resolve);
        resolve->add_option("--concurrency", opts.concurrency,
                            "Parallel resolutions (capped by the worker pool)");

        auto* status = app.add_subcommand("status", "Report resolution state without decoding");
        addCommon(status);

        CLI11_PARSE(app, argc, argv);

        if (opts.verbose) {
            spdlog::set_level(spdlog::level::debug);
        }

        if (resolve->parsed()) {
            return runResolve(opts);
        }
        return runStatus(opts);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
