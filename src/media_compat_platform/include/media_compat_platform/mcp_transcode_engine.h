#pragma once

#include "mcp_errors.h"
#include "mcp_stream_info.h"
#include "mcp_compat_policy.h"

#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace mcp {

// Progress in percent, 0..100
using ProgressCallback = std::function<void(int percent)>;

// Shared cancel flag. Default-constructed tokens can never be cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    static CancellationToken Create() {
        CancellationToken token;
        token.m_flag = std::make_shared<std::atomic<bool>>(false);
        return token;
    }

    void cancel() const {
        if (m_flag) m_flag->store(true);
    }

    bool is_cancelled() const {
        return m_flag && m_flag->load();
    }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

// Encoder choices for re-encoded streams
struct EncoderSettings {
    std::string video_encoder = "libx264";
    std::string video_preset = "ultrafast";  // speed over compression ratio
    int video_crf = 23;

    std::string audio_encoder = "aac";
    int64_t audio_bitrate = 192000;

    std::string container = "mp4";
    bool faststart = true;
};

// Transcoding backend. Implementations expose no internal concurrency
// guarantee; callers serialize access (see EngineCache::Acquire).
class TranscodeEngine {
public:
    virtual ~TranscodeEngine() = default;

    virtual std::string name() const = 0;

    // Metadata-only inspection, produces no output
    virtual Result<ProbeReport> Probe(const std::string& input_path) = 0;

    // Write output_path according to plan. Copied streams are passed through packet for packet.
    virtual Result<void> Transcode(const std::string& input_path,
                                   const std::string& output_path,
                                   const TranscodePlan& plan,
                                   const ProgressCallback& progress,
                                   const CancellationToken& cancel) = 0;
};

using EngineFactory = std::function<Result<std::shared_ptr<TranscodeEngine>>()>;

// Native engine backed by the linked FFmpeg libraries
Result<std::shared_ptr<TranscodeEngine>> CreateFFmpegEngine(const EncoderSettings& settings);

} // namespace mcp
