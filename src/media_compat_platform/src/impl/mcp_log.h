#pragma once

#include <cstdio>
#include <cstdlib>

// Logging controlled by MCP_LOG_LEVEL: 0 = silent (default), 1 = warnings, 2 = debug
namespace mcp {
namespace impl {
inline int mcp_log_level() {
    static int level = -1;
    if (level < 0) {
        const char* env = std::getenv("MCP_LOG_LEVEL");
        level = env ? std::atoi(env) : 0;
    }
    return level;
}
} // namespace impl
} // namespace mcp

#define MCP_LOG_WARN(...) do { if (mcp::impl::mcp_log_level() >= 1) { fprintf(stderr, "[MCP WARN] "); fprintf(stderr, __VA_ARGS__); fprintf(stderr, "\n"); } } while(0)
#define MCP_LOG_DEBUG(...) do { if (mcp::impl::mcp_log_level() >= 2) { fprintf(stderr, "[MCP] "); fprintf(stderr, __VA_ARGS__); fprintf(stderr, "\n"); } } while(0)
