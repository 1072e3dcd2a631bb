#include <media_compat_platform/mcp_compat_pipeline.h>
#include "impl/mcp_log.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

// Runs fn() when the enclosing scope exits, on every path.
namespace {
template<typename F>
struct ScopeExit {
    F fn;
    ~ScopeExit() { fn(); }
};
template<typename F>
ScopeExit<F> make_scope_exit(F fn) { return {std::move(fn)}; }

std::string next_job_name() {
    static std::atomic<uint64_t> counter{0};
    auto stamp = std::chrono::system_clock::now().time_since_epoch().count();
    return "job-" + std::to_string(stamp) + "-" + std::to_string(counter.fetch_add(1));
}
} // namespace

namespace mcp {

TranscodedArtifact::TranscodedArtifact(std::string path)
    : m_path(std::move(path)) {}

TranscodedArtifact::~TranscodedArtifact() {
    std::error_code ec;
    fs::remove(m_path, ec);
    if (ec) {
        MCP_LOG_WARN("could not remove transcoded file %s: %s", m_path.c_str(), ec.message().c_str());
    }
}

const char* pipeline_outcome_to_string(PipelineOutcome outcome) {
    switch (outcome) {
        case PipelineOutcome::PassThroughEngineDisabled: return "PassThroughEngineDisabled";
        case PipelineOutcome::PassThroughNotAddressable: return "PassThroughNotAddressable";
        case PipelineOutcome::PassThroughExtension:      return "PassThroughExtension";
        case PipelineOutcome::PassThroughCompatible:     return "PassThroughCompatible";
        case PipelineOutcome::Transcoded:                return "Transcoded";
        case PipelineOutcome::FallbackEngineUnavailable: return "FallbackEngineUnavailable";
        case PipelineOutcome::FallbackProbeFailed:       return "FallbackProbeFailed";
        case PipelineOutcome::FallbackTranscodeFailed:   return "FallbackTranscodeFailed";
        case PipelineOutcome::Cancelled:                 return "Cancelled";
    }
    return "Unknown";
}

CompatibilityPipeline::CompatibilityPipeline(PipelineConfig config, EngineCache& cache)
    : m_config(std::move(config)), m_cache(cache) {}

std::string CompatibilityPipeline::work_directory() const {
    if (!m_config.work_directory.empty()) {
        return m_config.work_directory;
    }
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec) {
        tmp = fs::path("/tmp");
    }
    return (tmp / "folderplay").string();
}

PlayableMedia CompatibilityPipeline::pass_through(const MediaSource& source, PipelineOutcome outcome,
                                                  const std::string& detail) const {
    PlayableMedia media;
    media.path = source.path;
    media.was_transcoded = false;
    media.outcome = outcome;
    media.detail = detail;
    return media;
}

PlayableMedia CompatibilityPipeline::EnsurePlayable(const MediaSource& source,
                                                    const ProgressCallback& progress,
                                                    const CancellationToken& cancel) {
    // Fast paths: no engine work, no side effects
    if (!m_config.engine_enabled) {
        return pass_through(source, PipelineOutcome::PassThroughEngineDisabled);
    }
    if (source.path.empty()) {
        return pass_through(source, PipelineOutcome::PassThroughNotAddressable);
    }
    const std::string file_name = source.name.empty()
        ? fs::path(source.path).filename().string()
        : source.name;
    if (!MightNeedTranscoding(file_name, m_config.candidate_extensions)) {
        return pass_through(source, PipelineOutcome::PassThroughExtension);
    }
    if (cancel.is_cancelled()) {
        return pass_through(source, PipelineOutcome::Cancelled);
    }

    // Blocks while another job holds the engine
    auto acquired = m_cache.Acquire();
    if (acquired.is_error()) {
        MCP_LOG_WARN("engine unavailable, playing %s as is: %s",
                     file_name.c_str(), acquired.error().message.c_str());
        return pass_through(source, PipelineOutcome::FallbackEngineUnavailable,
                            acquired.error().message);
    }
    EngineCache::EngineHandle engine = std::move(acquired.value());

    if (cancel.is_cancelled()) {
        return pass_through(source, PipelineOutcome::Cancelled);
    }

    auto probe = engine->Probe(source.path);
    if (probe.is_error()) {
        MCP_LOG_WARN("probe failed for %s: %s", file_name.c_str(), probe.error().message.c_str());
        return pass_through(source, PipelineOutcome::FallbackProbeFailed, probe.error().message);
    }

    const TranscodePlan plan = BuildTranscodePlan(probe.value(), m_config.policy);
    if (!plan.needs_transcode()) {
        MCP_LOG_DEBUG("%s is natively playable", file_name.c_str());
        return pass_through(source, PipelineOutcome::PassThroughCompatible);
    }

    MCP_LOG_DEBUG("transcoding %s (video %s, audio %s)", file_name.c_str(),
                  plan.video_stream >= 0 ? stream_action_to_string(plan.video_action) : "none",
                  plan.audio_stream >= 0 ? stream_action_to_string(plan.audio_action) : "none");

    const fs::path work_dir(work_directory());
    const std::string job_name = next_job_name();
    const fs::path scratch = work_dir / job_name;

    std::error_code ec;
    fs::create_directories(scratch, ec);
    if (ec) {
        MCP_LOG_WARN("cannot create work directory %s: %s", scratch.string().c_str(), ec.message().c_str());
        return pass_through(source, PipelineOutcome::FallbackTranscodeFailed, ec.message());
    }

    // The scratch directory never outlives this call, whatever the outcome
    auto cleanup = make_scope_exit([&scratch]() {
        std::error_code remove_ec;
        fs::remove_all(scratch, remove_ec);
        if (remove_ec) {
            MCP_LOG_WARN("could not remove %s: %s", scratch.string().c_str(), remove_ec.message().c_str());
        }
    });

    const fs::path scratch_output = scratch / "output.mp4";
    auto transcoded = engine->Transcode(source.path, scratch_output.string(), plan, progress, cancel);
    if (transcoded.is_error()) {
        if (transcoded.error().code == ErrorCode::Cancelled) {
            MCP_LOG_DEBUG("transcode of %s cancelled", file_name.c_str());
            return pass_through(source, PipelineOutcome::Cancelled);
        }
        MCP_LOG_WARN("transcode failed for %s: %s", file_name.c_str(), transcoded.error().message.c_str());
        return pass_through(source, PipelineOutcome::FallbackTranscodeFailed, transcoded.error().message);
    }

    // Move the result out of the scratch area; the artifact owns it from here
    const fs::path final_output = work_dir / (job_name + ".mp4");
    fs::rename(scratch_output, final_output, ec);
    if (ec) {
        MCP_LOG_WARN("cannot move transcoded output: %s", ec.message().c_str());
        return pass_through(source, PipelineOutcome::FallbackTranscodeFailed, ec.message());
    }

    PlayableMedia media;
    media.path = final_output.string();
    media.was_transcoded = true;
    media.outcome = PipelineOutcome::Transcoded;
    media.artifact = std::make_shared<TranscodedArtifact>(media.path);
    return media;
}

} // namespace mcp
