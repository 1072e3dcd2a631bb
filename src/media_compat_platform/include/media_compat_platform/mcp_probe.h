#pragma once

#include "mcp_errors.h"
#include "mcp_stream_info.h"

#include <cstdint>
#include <string>

namespace mcp {

// Structured stream introspection (no decoding, no output)
Result<ProbeReport> ProbeFile(const std::string& path);

// Content digest of the primary stream of `kind`: FNV-1a over every packet payload.
// Equal digests mean the stream was copied packet for packet.
Result<uint64_t> StreamDigest(const std::string& path, StreamKind kind);

} // namespace mcp
