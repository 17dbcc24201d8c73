#include "core/cache/eviction/EvictionManager.hpp"
#include "core/common/Logging.hpp"
#include <algorithm>
#include <cmath>

namespace infercache {
namespace core {
namespace cache {

namespace {
constexpr double kSecondsPerDay = 24.0 * 60.0 * 60.0;
constexpr double kBytesPerMiB = 1024.0 * 1024.0;
} // namespace

EvictionManager::EvictionManager(const CacheConfig& config, std::shared_ptr<const common::Clock> clock)
    : config_(config)
    , clock_(std::move(clock))
    , logger_(common::componentLogger("eviction")) {}

double EvictionManager::score(const CacheMetadata& metadata, common::Clock::TimePoint now) const {
    const auto& w = config_.weights;
    double result = 0.0;
    if (metadata.isExpired(now)) {
        result += w.expiredScore;
    }
    auto age = std::chrono::duration<double>(now - metadata.createdAt).count();
    result += std::max(0.0, age / kSecondsPerDay) * w.perDayOfAge;
    result += (static_cast<double>(metadata.sizeBytes) / kBytesPerMiB) * w.perMiB;
    result += config_.policy(metadata.category).evictionWeight;
    return result;
}

std::vector<CacheMetadata> EvictionManager::rank(std::vector<CacheMetadata> entries,
                                                 common::Clock::TimePoint now) const {
    std::vector<std::pair<double, CacheMetadata>> scored;
    scored.reserve(entries.size());
    for (auto& entry : entries) {
        double s = score(entry, now);
        scored.emplace_back(s, std::move(entry));
    }

    std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        if (a.second.createdAt != b.second.createdAt) return a.second.createdAt < b.second.createdAt;
        return a.second.compositeKey() < b.second.compositeKey();
    });

    std::vector<CacheMetadata> ordered;
    ordered.reserve(scored.size());
    for (auto& item : scored) {
        ordered.push_back(std::move(item.second));
    }
    return ordered;
}

EvictionReport EvictionManager::evictToTarget(EvictableStore& store, double targetFraction) const {
    EvictionReport report;
    const auto now = clock_->now();
    const double fraction = std::min(1.0, std::max(0.0, targetFraction));
    const auto target = static_cast<size_t>(std::floor(static_cast<double>(store.maxSize()) * fraction));

    report.sizeBefore = store.totalSize();
    auto ordered = rank(store.metadataSnapshot(), now);

    for (const auto& entry : ordered) {
        const bool expired = entry.isExpired(now);
        if (!expired && store.totalSize() <= target) {
            continue;
        }
        if (store.removeEntry(entry.category, entry.key)) {
            ++report.removedEntries;
            report.freedBytes += entry.sizeBytes;
            if (expired) ++report.removedExpired;
        }
    }

    report.sizeAfter = store.totalSize();
    if (report.removedEntries > 0) {
        logger_->info("Вытеснение: удалено {} записей (просрочено {}), освобождено {} байт, размер {} -> {} (цель {})",
            report.removedEntries, report.removedExpired, report.freedBytes,
            report.sizeBefore, report.sizeAfter, target);
    } else {
        logger_->debug("Вытеснение не требуется: размер {} байт, цель {}", report.sizeBefore, target);
    }
    return report;
}

EvictionReport EvictionManager::evict(EvictableStore& store) const {
    return evictToTarget(store, config_.evictionTargetFraction);
}

} // namespace cache
} // namespace core
} // namespace infercache
