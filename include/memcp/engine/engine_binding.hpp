#pragma once

#include "memcp/engine/memory_engine.hpp"

#include <functional>
#include <memory>
#include <mutex>

namespace memcp {

// ─────────────────────────────────────────────────────────────────────────────
// EngineBinding
// ─────────────────────────────────────────────────────────────────────────────
// Owns the engine handle shared by every tool call. The engine is created
// by the factory on first use and kept for the life of the binding. A factory
// failure propagates to the caller and leaves the binding unbound, so the
// next call tries again. Creation is serialized by a mutex.

class EngineBinding {
public:
    using Factory = std::function<std::shared_ptr<MemoryEngine>()>;

    explicit EngineBinding(Factory factory);

    /// Already-bound handle; the factory is never needed.
    explicit EngineBinding(std::shared_ptr<MemoryEngine> engine);

    EngineBinding(const EngineBinding&) = delete;
    EngineBinding& operator=(const EngineBinding&) = delete;
    EngineBinding(EngineBinding&&) = delete;
    EngineBinding& operator=(EngineBinding&&) = delete;

    ~EngineBinding() = default;

    /// Binds on first use. Throws whatever the factory throws, or
    /// std::runtime_error if it returns null.
    [[nodiscard]] MemoryEngine& get();

    [[nodiscard]] bool is_bound() const;

private:
    Factory factory_;
    mutable std::mutex mutex_;
    std::shared_ptr<MemoryEngine> engine_;
};

}  // namespace memcp
