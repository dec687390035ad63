#include "memcp/engine/instrumented_engine.hpp"

#include "memcp/log/logger.hpp"

#include <format>
#include <stdexcept>

namespace memcp {

InstrumentedEngine::InstrumentedEngine(std::shared_ptr<MemoryEngine> inner)
    : inner_(std::move(inner))
{
    if (!inner_) {
        throw std::invalid_argument("InstrumentedEngine: inner engine cannot be null");
    }
}

template <typename Call>
Value InstrumentedEngine::instrument(EngineOperation operation, Call&& call) {
    auto& counters = counters_[static_cast<std::size_t>(operation)];
    counters.calls.fetch_add(1, std::memory_order_relaxed);

    const auto started = std::chrono::steady_clock::now();
    const auto elapsed_us = [&started]() {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started).count();
    };

    try {
        Value result = call();
        const auto us = elapsed_us();
        counters.latency_us.fetch_add(us, std::memory_order_relaxed);
        MEMCP_LOG_DEBUG(std::format("engine.{} completed in {}us", to_string(operation), us));
        return result;
    } catch (const std::exception& e) {
        const auto us = elapsed_us();
        counters.latency_us.fetch_add(us, std::memory_order_relaxed);
        counters.failures.fetch_add(1, std::memory_order_relaxed);
        MEMCP_LOG_DEBUG(std::format("engine.{} failed after {}us: {}", to_string(operation), us, e.what()));
        throw;
    }
}

Value InstrumentedEngine::add(const AddRequest& request) {
    return instrument(EngineOperation::Add, [&] { return inner_->add(request); });
}

Value InstrumentedEngine::search(const SearchRequest& request) {
    return instrument(EngineOperation::Search, [&] { return inner_->search(request); });
}

Value InstrumentedEngine::get(const GetRequest& request) {
    return instrument(EngineOperation::Get, [&] { return inner_->get(request); });
}

Value InstrumentedEngine::update(const UpdateRequest& request) {
    return instrument(EngineOperation::Update, [&] { return inner_->update(request); });
}

Value InstrumentedEngine::remove(const DeleteRequest& request) {
    return instrument(EngineOperation::Delete, [&] { return inner_->remove(request); });
}

Value InstrumentedEngine::remove_all(const DeleteAllRequest& request) {
    return instrument(EngineOperation::DeleteAll, [&] { return inner_->remove_all(request); });
}

Value InstrumentedEngine::get_all(const ListRequest& request) {
    return instrument(EngineOperation::GetAll, [&] { return inner_->get_all(request); });
}

EngineOperationStats InstrumentedEngine::stats(EngineOperation operation) const {
    const auto& counters = counters_[static_cast<std::size_t>(operation)];
    EngineOperationStats snapshot;
    snapshot.calls = counters.calls.load(std::memory_order_relaxed);
    snapshot.failures = counters.failures.load(std::memory_order_relaxed);
    snapshot.total_latency = std::chrono::microseconds(counters.latency_us.load(std::memory_order_relaxed));
    return snapshot;
}

std::size_t InstrumentedEngine::total_calls() const {
    std::size_t total = 0;
    for (const auto& counters : counters_) {
        total += counters.calls.load(std::memory_order_relaxed);
    }
    return total;
}

void InstrumentedEngine::log_summary() const {
    for (std::size_t i = 0; i < kEngineOperationCount; ++i) {
        const auto operation = static_cast<EngineOperation>(i);
        const auto snapshot = stats(operation);
        if (snapshot.calls == 0) {
            continue;
        }
        const auto average_us = snapshot.total_latency.count() / static_cast<std::int64_t>(snapshot.calls);
        MEMCP_LOG_INFO(std::format("engine.{}: {} calls, {} failed, {}us avg",
                                   to_string(operation), snapshot.calls, snapshot.failures, average_us));
    }
    MEMCP_LOG_INFO(std::format("engine: {} calls in total", total_calls()));
}

}  // namespace memcp
