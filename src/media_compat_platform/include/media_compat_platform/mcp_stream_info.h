#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mcp {

// Microseconds, same unit everywhere in MCP
using TimeUS = int64_t;

enum class StreamKind { Video, Audio, Subtitle, Other };

inline const char* stream_kind_to_string(StreamKind kind) {
    switch (kind) {
        case StreamKind::Video:    return "video";
        case StreamKind::Audio:    return "audio";
        case StreamKind::Subtitle: return "subtitle";
        case StreamKind::Other:    return "other";
    }
    return "other";
}

// One elementary stream as reported by the container, without decoding it
struct StreamDescriptor {
    int index = -1;
    StreamKind kind = StreamKind::Other;

    // FFmpeg short codec name ("h264", "hevc", "ac3", "dts", ...)
    std::string codec_name;
    // Codec profile name when the codec exposes one ("Main 10", "DTS-HD MA"), else empty
    std::string profile_name;

    // Cover art stored as a single-picture video stream
    bool attached_picture = false;

    // Video
    int width = 0;
    int height = 0;

    // Audio
    int channels = 0;
    int sample_rate = 0;
};

// Result of a metadata-only inspection of a media file
struct ProbeReport {
    std::string path;
    std::string container;   // demuxer short name ("matroska,webm", "mov,mp4,...")
    TimeUS duration_us = 0;  // 0 when unknown
    std::vector<StreamDescriptor> streams;

    // First stream of the given kind (skips cover art for video); nullptr if none
    const StreamDescriptor* primary(StreamKind kind) const {
        for (const auto& s : streams) {
            if (s.kind != kind) continue;
            if (kind == StreamKind::Video && s.attached_picture) continue;
            return &s;
        }
        return nullptr;
    }

    bool has_video() const { return primary(StreamKind::Video) != nullptr; }
    bool has_audio() const { return primary(StreamKind::Audio) != nullptr; }
};

} // namespace mcp
