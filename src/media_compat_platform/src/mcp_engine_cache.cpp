#include <media_compat_platform/mcp_engine_cache.h>
#include "impl/mcp_log.h"

#include <exception>

namespace mcp {

EngineCache::EngineCache(EngineFactory factory)
    : m_factory(std::move(factory)) {}

EngineCache& EngineCache::Process() {
    static EngineCache cache([] { return CreateFFmpegEngine(EncoderSettings{}); });
    return cache;
}

Result<std::shared_ptr<TranscodeEngine>> EngineCache::Engine() {
    std::promise<InitResult> promise;
    std::shared_future<InitResult> pending;
    bool initiator = false;

    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        if (m_engine) {
            return m_engine;
        }
        if (!m_pending.valid()) {
            // First caller runs the factory; later callers join its future
            m_pending = promise.get_future().share();
            ++m_init_attempts;
            initiator = true;
        }
        pending = m_pending;
    }

    if (!initiator) {
        MCP_LOG_DEBUG("EngineCache: waiting on in-flight initialization");
        return pending.get();
    }

    InitResult result = Error::engine_unavailable("No engine factory");
    if (m_factory) {
        try {
            result = m_factory();
        } catch (const std::exception& e) {
            result = Error::engine_unavailable(std::string("Engine factory threw: ") + e.what());
        }
    }
    if (result.is_ok() && !result.value()) {
        result = Error::engine_unavailable("Engine factory returned no engine");
    }

    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        if (result.is_ok()) {
            m_engine = result.value();
        }
        // A failed attempt is not cached; the next caller starts over
        m_pending = std::shared_future<InitResult>();
    }

    if (result.is_error()) {
        MCP_LOG_WARN("EngineCache: initialization failed: %s", result.error().message.c_str());
    } else {
        MCP_LOG_DEBUG("EngineCache: engine '%s' ready", result.value()->name().c_str());
    }

    promise.set_value(result);
    return result;
}

Result<EngineCache::EngineHandle> EngineCache::Acquire() {
    auto engine = Engine();
    if (engine.is_error()) {
        return engine.error();
    }

    EngineHandle handle;
    handle.engine = engine.value();
    handle.lock = std::unique_lock<std::mutex>(m_use_mutex);
    return std::move(handle);
}

bool EngineCache::is_ready() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_engine != nullptr;
}

int EngineCache::init_attempts() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_init_attempts;
}

void EngineCache::Reset() {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    m_engine.reset();
}

} // namespace mcp
