#include "pipeline/pipeline_manager.hpp"
#include "common/errors.hpp"
#include "common/log.hpp"

namespace arbor {

PipelineManager::PipelineManager(PipelineConfig config)
    : config_(std::move(config)) {}

void PipelineManager::requireCapacityLocked() {
    if (live_.size() >= config_.max_live_contexts) {
        stats_.rejected++;
        throw CapacityExceededError("live context limit of " +
                                    std::to_string(config_.max_live_contexts) +
                                    " reached");
    }
}

std::shared_ptr<ProcessingContext> PipelineManager::findLocked(uint64_t context_id) const {
    auto it = live_.find(context_id);
    if (it == live_.end()) {
        throw UnknownContextError("unknown or inactive context: " + std::to_string(context_id));
    }
    return it->second;
}

uint64_t PipelineManager::create(std::optional<uint64_t> parent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (parent_id && !live_.count(*parent_id) && !archive_.count(*parent_id)) {
        throw UnknownContextError("unknown parent context: " + std::to_string(*parent_id));
    }
    requireCapacityLocked();
    uint64_t id = next_id_++;
    live_.emplace(id, std::make_shared<ProcessingContext>(id, config_.context, parent_id));
    stats_.created++;
    return id;
}

uint64_t PipelineManager::fork(uint64_t context_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto parent = findLocked(context_id);
    requireCapacityLocked();
    uint64_t id = next_id_++;
    std::shared_ptr<ProcessingContext> child = parent->fork(id);
    live_.emplace(id, std::move(child));
    stats_.forked++;
    ARBOR_LOG_DEBUG("pipeline", "forked context %llu from %llu",
                    static_cast<unsigned long long>(id),
                    static_cast<unsigned long long>(context_id));
    return id;
}

std::shared_ptr<ProcessingContext> PipelineManager::acquire(uint64_t context_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return findLocked(context_id);
}

std::optional<EmitRecord> PipelineManager::getResult(uint64_t context_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ait = archive_.find(context_id);
    if (ait != archive_.end()) return ait->second;
    return findLocked(context_id)->result();
}

void PipelineManager::archive(uint64_t context_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto ctx = findLocked(context_id);
    if (!ctx->result()) {
        throw ContextNotResolvedError("context " + std::to_string(context_id) +
                                      " has not resolved");
    }
    archive_[context_id] = *ctx->result();
    archive_order_.push_back(context_id);
    live_.erase(context_id);

    while (archive_order_.size() > config_.archive_capacity) {
        archive_.erase(archive_order_.front());
        archive_order_.pop_front();
    }
}

void PipelineManager::cancel(uint64_t context_id) {
    std::shared_ptr<ProcessingContext> ctx;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ctx = findLocked(context_id);
        live_.erase(context_id);
        stats_.cancelled++;
    }
    ctx->cancel();
}

void PipelineManager::merge(uint64_t child_id, uint64_t parent_id) {
    std::optional<EmitRecord> child_result = getResult(child_id);
    if (!child_result) {
        throw ContextNotResolvedError("context " + std::to_string(child_id) +
                                      " has not resolved");
    }
    acquire(parent_id)->adopt(*child_result);
}

bool PipelineManager::isLive(uint64_t context_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.count(context_id) > 0;
}

size_t PipelineManager::liveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_.size();
}

PipelineStats PipelineManager::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PipelineStats s = stats_;
    s.live = live_.size();
    s.archived = archive_.size();
    return s;
}

} // namespace arbor
