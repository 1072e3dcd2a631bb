#pragma once

#include "mcp_stream_info.h"

#include <set>
#include <string>

namespace mcp {

// Codecs the native renderer cannot decode and that therefore need re-encoding.
// Names are FFmpeg short codec names, compared case-insensitively.
struct CompatibilityPolicy {
    std::set<std::string> video_codecs_requiring_reencode;
    std::set<std::string> audio_codecs_requiring_reencode;

    // HEVC video; AC-3, E-AC-3 and DTS (every DTS profile) audio
    static CompatibilityPolicy Default();

    bool video_needs_reencode(const StreamDescriptor& stream) const;
    bool audio_needs_reencode(const StreamDescriptor& stream) const;
};

enum class StreamAction { Copy, Reencode };

inline const char* stream_action_to_string(StreamAction action) {
    return action == StreamAction::Copy ? "copy" : "reencode";
}

// Which input streams go into the output and what happens to each.
// Index -1 means the output carries no stream of that kind.
struct TranscodePlan {
    int video_stream = -1;
    StreamAction video_action = StreamAction::Copy;

    int audio_stream = -1;
    StreamAction audio_action = StreamAction::Copy;

    bool reencodes_video() const { return video_stream >= 0 && video_action == StreamAction::Reencode; }
    bool reencodes_audio() const { return audio_stream >= 0 && audio_action == StreamAction::Reencode; }

    // False when every mapped stream can be copied, i.e. the file already plays natively
    bool needs_transcode() const { return reencodes_video() || reencodes_audio(); }
};

// Map the primary video and audio streams, re-encoding only those the policy flags
TranscodePlan BuildTranscodePlan(const ProbeReport& report, const CompatibilityPolicy& policy);

// Cheap check on the file name alone: can this container carry a problematic encoding?
// extensions are lowercase without the dot ("mkv").
bool MightNeedTranscoding(const std::string& file_name, const std::set<std::string>& extensions);

} // namespace mcp
