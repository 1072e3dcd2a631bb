#include <media_compat_platform/mcp_compat_policy.h>

#include <algorithm>
#include <cctype>

namespace mcp {

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool contains_codec(const std::set<std::string>& codecs, const std::string& name) {
    const std::string lowered = to_lower(name);
    for (const auto& codec : codecs) {
        if (to_lower(codec) == lowered) {
            return true;
        }
    }
    return false;
}

CompatibilityPolicy CompatibilityPolicy::Default() {
    CompatibilityPolicy policy;
    policy.video_codecs_requiring_reencode = {"hevc"};
    // DTS is flagged regardless of profile (core, ES, HD MA all alike)
    policy.audio_codecs_requiring_reencode = {"ac3", "eac3", "dts"};
    return policy;
}

bool CompatibilityPolicy::video_needs_reencode(const StreamDescriptor& stream) const {
    return stream.kind == StreamKind::Video &&
           contains_codec(video_codecs_requiring_reencode, stream.codec_name);
}

bool CompatibilityPolicy::audio_needs_reencode(const StreamDescriptor& stream) const {
    return stream.kind == StreamKind::Audio &&
           contains_codec(audio_codecs_requiring_reencode, stream.codec_name);
}

TranscodePlan BuildTranscodePlan(const ProbeReport& report, const CompatibilityPolicy& policy) {
    TranscodePlan plan;

    if (const StreamDescriptor* video = report.primary(StreamKind::Video)) {
        plan.video_stream = video->index;
        plan.video_action = policy.video_needs_reencode(*video) ? StreamAction::Reencode
                                                                : StreamAction::Copy;
    }
    if (const StreamDescriptor* audio = report.primary(StreamKind::Audio)) {
        plan.audio_stream = audio->index;
        plan.audio_action = policy.audio_needs_reencode(*audio) ? StreamAction::Reencode
                                                                : StreamAction::Copy;
    }
    return plan;
}

bool MightNeedTranscoding(const std::string& file_name, const std::set<std::string>& extensions) {
    const auto dot = file_name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= file_name.size()) {
        return false;
    }
    return extensions.count(to_lower(file_name.substr(dot + 1))) > 0;
}

} // namespace mcp
