#include "core/cache/memory/MemoryTier.hpp"
#include "core/common/Logging.hpp"
#include <algorithm>
#include <vector>

namespace infercache {
namespace core {
namespace cache {

namespace {

size_t entrySize(const CacheEntry& entry) {
    return entry.payload.bytes.size() + entry.payload.typeTag.size();
}

} // namespace

MemoryTier::MemoryTier(size_t maxBytes, double trimFraction)
    : maxBytes_(maxBytes)
    , trimFraction_(trimFraction)
    , logger_(common::componentLogger("memorytier")) {}

std::optional<CacheEntry> MemoryTier::get(const std::string& compositeKey, common::Clock::TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(compositeKey);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    auto& slot = it->second.second;
    if (slot.entry.isExpired(now)) {
        eraseLocked(compositeKey);
        return std::nullopt;
    }
    ++slot.accessCount;
    slot.lastAccess = now;
    lruList_.splice(lruList_.begin(), lruList_, it->second.first);
    return slot.entry;
}

void MemoryTier::put(const std::string& compositeKey, const CacheEntry& entry, common::Clock::TimePoint now) {
    if (!enabled()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    eraseLocked(compositeKey);

    const size_t size = entrySize(entry);
    if (size > maxBytes_) {
        logger_->debug("Запись {} ({} байт) не помещается в память", compositeKey, size);
        return;
    }

    if (bytes_ + size > maxBytes_) {
        auto target = std::min(static_cast<size_t>(maxBytes_ * trimFraction_), maxBytes_ - size);
        size_t removed = trimLocked(target, now);
        logger_->debug("Уровень памяти сокращён: удалено {}, занято {} из {} байт", removed, bytes_, maxBytes_);
    }

    lruList_.push_front(compositeKey);
    Slot slot;
    slot.entry = entry;
    slot.sizeBytes = size;
    slot.accessCount = 1;
    slot.lastAccess = now;
    entries_.emplace(compositeKey, std::make_pair(lruList_.begin(), std::move(slot)));
    bytes_ += size;
}

void MemoryTier::erase(const std::string& compositeKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    eraseLocked(compositeKey);
}

void MemoryTier::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lruList_.clear();
    bytes_ = 0;
}

size_t MemoryTier::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t MemoryTier::bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_;
}

void MemoryTier::eraseLocked(const std::string& compositeKey) {
    auto it = entries_.find(compositeKey);
    if (it == entries_.end()) return;
    bytes_ -= it->second.second.sizeBytes;
    lruList_.erase(it->second.first);
    entries_.erase(it);
}

size_t MemoryTier::trimLocked(size_t target, common::Clock::TimePoint now) {
    // Кандидаты от давно не использованных к свежим
    std::vector<std::pair<double, std::string>> candidates;
    candidates.reserve(entries_.size());
    for (auto it = lruList_.rbegin(); it != lruList_.rend(); ++it) {
        const auto& slot = entries_.at(*it).second;
        double idleSeconds = std::chrono::duration<double>(now - slot.lastAccess).count();
        double score = static_cast<double>(slot.accessCount) / (std::max(0.0, idleSeconds) + 1.0);
        candidates.emplace_back(score, *it);
    }
    std::stable_sort(candidates.begin(), candidates.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    size_t removed = 0;
    for (const auto& candidate : candidates) {
        if (bytes_ <= target) break;
        eraseLocked(candidate.second);
        ++removed;
    }
    return removed;
}

} // namespace cache
} // namespace core
} // namespace infercache
