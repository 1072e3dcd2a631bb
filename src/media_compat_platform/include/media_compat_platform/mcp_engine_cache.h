#pragma once

#include "mcp_errors.h"
#include "mcp_transcode_engine.h"

#include <cassert>
#include <future>
#include <memory>
#include <mutex>

namespace mcp {

// Lazily initialized, shared transcoding engine.
// Concurrent callers during initialization wait on the same in-flight attempt.
// A failed attempt is forgotten so the next Acquire() retries.
class EngineCache {
public:
    explicit EngineCache(EngineFactory factory);

    // Process-wide cache backed by the FFmpeg engine with default encoder settings
    static EngineCache& Process();

    // RAII handle: holds the engine plus exclusive use of it.
    // A second Acquire() blocks until the first handle is released.
    struct EngineHandle {
        std::shared_ptr<TranscodeEngine> engine;
        std::unique_lock<std::mutex> lock;

        bool valid() const { return engine != nullptr; }
        TranscodeEngine* operator->() const {
            assert(engine && "EngineHandle::operator->: dereferencing invalid handle");
            return engine.get();
        }
        explicit operator bool() const { return valid(); }
    };

    Result<EngineHandle> Acquire();

    // Engine instance without taking the use lock (initializes if needed)
    Result<std::shared_ptr<TranscodeEngine>> Engine();

    bool is_ready() const;
    int init_attempts() const;

    // Drop the cached engine; the next Acquire() initializes a new one
    void Reset();

private:
    using InitResult = Result<std::shared_ptr<TranscodeEngine>>;

    EngineFactory m_factory;

    mutable std::mutex m_state_mutex;
    std::shared_ptr<TranscodeEngine> m_engine;
    std::shared_future<InitResult> m_pending;
    int m_init_attempts = 0;

    // Serializes engine use (one active probe/transcode at a time)
    std::mutex m_use_mutex;
};

} // namespace mcp
