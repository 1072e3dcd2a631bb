#pragma once

#include "mcp_compat_policy.h"
#include "mcp_engine_cache.h"
#include "mcp_transcode_engine.h"

#include <memory>
#include <set>
#include <string>

namespace mcp {

// Byte source handed to the pipeline. path is empty when the source
// is not addressable on the local filesystem.
struct MediaSource {
    std::string path;
    std::string name;  // display / file name, used for the extension fast path
};

// Transcoded output file. The file is deleted when the last reference goes away.
class TranscodedArtifact {
public:
    explicit TranscodedArtifact(std::string path);
    ~TranscodedArtifact();

    TranscodedArtifact(const TranscodedArtifact&) = delete;
    TranscodedArtifact& operator=(const TranscodedArtifact&) = delete;

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

enum class PipelineOutcome {
    PassThroughEngineDisabled,
    PassThroughNotAddressable,
    PassThroughExtension,
    PassThroughCompatible,
    Transcoded,
    FallbackEngineUnavailable,
    FallbackProbeFailed,
    FallbackTranscodeFailed,
    Cancelled
};

const char* pipeline_outcome_to_string(PipelineOutcome outcome);

struct PlayableMedia {
    std::string path;          // what the renderer should open
    bool was_transcoded = false;
    PipelineOutcome outcome = PipelineOutcome::PassThroughExtension;
    std::string detail;        // error text for fallbacks, empty otherwise
    std::shared_ptr<const TranscodedArtifact> artifact;  // set when was_transcoded
};

struct PipelineConfig {
    bool engine_enabled = true;
    std::string work_directory;  // empty = system temp dir + "/folderplay"
    std::set<std::string> candidate_extensions{"mkv", "mp4", "m4v", "avi", "mov"};
    CompatibilityPolicy policy = CompatibilityPolicy::Default();
};

// ensurePlayable: returns the original source or a transcoded copy.
// Never fails; every engine/probe/transcode failure degrades to the original.
class CompatibilityPipeline {
public:
    CompatibilityPipeline(PipelineConfig config, EngineCache& cache);

    PlayableMedia EnsurePlayable(const MediaSource& source,
                                 const ProgressCallback& progress = {},
                                 const CancellationToken& cancel = {});

    const PipelineConfig& config() const { return m_config; }
    std::string work_directory() const;

private:
    PlayableMedia pass_through(const MediaSource& source, PipelineOutcome outcome,
                               const std::string& detail = std::string()) const;

    PipelineConfig m_config;
    EngineCache& m_cache;
};

} // namespace mcp
