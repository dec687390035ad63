#include "memcp/engine/engine_binding.hpp"

#include "memcp/log/logger.hpp"

#include <stdexcept>

namespace memcp {

EngineBinding::EngineBinding(Factory factory)
    : factory_(std::move(factory))
{
    if (!factory_) {
        throw std::invalid_argument("EngineBinding: factory cannot be empty");
    }
}

EngineBinding::EngineBinding(std::shared_ptr<MemoryEngine> engine)
    : engine_(std::move(engine))
{
    if (!engine_) {
        throw std::invalid_argument("EngineBinding: engine cannot be null");
    }
}

MemoryEngine& EngineBinding::get() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (engine_) {
        return *engine_;
    }

    auto engine = factory_();
    if (!engine) {
        throw std::runtime_error("Memory engine factory returned no engine");
    }
    engine_ = std::move(engine);
    MEMCP_LOG_INFO("Memory instance initialized");
    return *engine_;
}

bool EngineBinding::is_bound() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_ != nullptr;
}

}  // namespace memcp
