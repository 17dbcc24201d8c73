#include "core/balancer/AdaptiveConcurrencyController.hpp"
#include "core/common/Logging.hpp"
#include <algorithm>

namespace infercache {
namespace core {
namespace balancer {

namespace {
constexpr double kGiB = 1024.0 * 1024.0 * 1024.0;
} // namespace

const char* toString(NetworkQuality quality) {
    switch (quality) {
        case NetworkQuality::Excellent: return "excellent";
        case NetworkQuality::Good:      return "good";
        case NetworkQuality::Fair:      return "fair";
        case NetworkQuality::Poor:      return "poor";
    }
    return "good";
}

const char* toString(DeviceClass deviceClass) {
    switch (deviceClass) {
        case DeviceClass::High:   return "high";
        case DeviceClass::Medium: return "medium";
        case DeviceClass::Low:    return "low";
    }
    return "medium";
}

nlohmann::json ConcurrencyConfig::toJson() const {
    return {
        {"hard_cap", hardCap},
        {"initial_rtt_seconds", initialRttSeconds},
        {"rtt_smoothing", rttSmoothing},
        {"tier_thresholds", tierThresholds},
        {"tier_limits", tierLimits},
        {"multipliers", {
            {"network", multipliers.network},
            {"device", multipliers.device},
            {"load_high", multipliers.loadHigh},
            {"load_medium", multipliers.loadMedium},
            {"load_low", multipliers.loadLow}
        }}
    };
}

ConcurrencyConfig ConcurrencyConfig::fromJson(const nlohmann::json& j, const ConcurrencyConfig& defaults) {
    ConcurrencyConfig config = defaults;
    config.hardCap = j.value("hard_cap", defaults.hardCap);
    config.initialRttSeconds = j.value("initial_rtt_seconds", defaults.initialRttSeconds);
    config.rttSmoothing = j.value("rtt_smoothing", defaults.rttSmoothing);
    config.tierThresholds = j.value("tier_thresholds", defaults.tierThresholds);
    config.tierLimits = j.value("tier_limits", defaults.tierLimits);
    if (j.contains("multipliers")) {
        const auto& m = j.at("multipliers");
        config.multipliers.network = m.value("network", defaults.multipliers.network);
        config.multipliers.device = m.value("device", defaults.multipliers.device);
        config.multipliers.loadHigh = m.value("load_high", defaults.multipliers.loadHigh);
        config.multipliers.loadMedium = m.value("load_medium", defaults.multipliers.loadMedium);
        config.multipliers.loadLow = m.value("load_low", defaults.multipliers.loadLow);
    }
    return config;
}

nlohmann::json ConcurrencySnapshot::toJson() const {
    return {
        {"limit", limit},
        {"networkCeiling", networkCeiling},
        {"deviceCeiling", deviceCeiling},
        {"memoryCeiling", memoryCeiling},
        {"activeCount", activeCount},
        {"averageRttSeconds", averageRttSeconds},
        {"memoryPressure", memoryPressure},
        {"networkQuality", toString(networkQuality)},
        {"deviceClass", toString(deviceClass)}
    };
}

AdaptiveConcurrencyController::AdaptiveConcurrencyController(
        const ConcurrencyConfig& config,
        std::shared_ptr<const platform::ResourceProbe> probe)
    : config_(config)
    , probe_(std::move(probe))
    , device_(probe_->deviceProfile())
    , deviceCeiling_(deviceCeilingFor(device_))
    , deviceClass_(deviceClassFor(device_))
    , averageRtt_(config.initialRttSeconds)
    , logger_(common::componentLogger("concurrency")) {
    logger_->info("Контроллер параллелизма: {} CPU, {:.1f} ГиБ, потолок устройства {}, класс {}",
        device_.cpuCount, device_.totalMemoryGiB(), deviceCeiling_, toString(deviceClass_));
}

size_t AdaptiveConcurrencyController::networkCeilingFor(double averageRttSeconds,
                                                        const ConcurrencyConfig& config) {
    for (size_t i = 0; i < config.tierThresholds.size(); ++i) {
        if (averageRttSeconds < config.tierThresholds[i]) {
            return config.tierLimits[i];
        }
    }
    return config.tierLimits.back();
}

size_t AdaptiveConcurrencyController::deviceCeilingFor(const platform::DeviceProfile& profile) {
    const double memoryGiB = static_cast<double>(profile.totalMemoryBytes) / kGiB;
    if (profile.cpuCount >= 8 && memoryGiB > 6.0) return 6;
    if (profile.cpuCount >= 6 && memoryGiB > 4.0) return 4;
    if (profile.cpuCount >= 4 && memoryGiB > 2.0) return 3;
    return 2;
}

size_t AdaptiveConcurrencyController::memoryCeilingFor(double memoryPressure) {
    if (memoryPressure > 0.8) return 1;
    if (memoryPressure > 0.6) return 2;
    if (memoryPressure > 0.4) return 3;
    return 5;
}

DeviceClass AdaptiveConcurrencyController::deviceClassFor(const platform::DeviceProfile& profile) {
    const double memoryGiB = static_cast<double>(profile.totalMemoryBytes) / kGiB;
    if (memoryGiB > 6.0 && profile.cpuCount >= 6) return DeviceClass::High;
    if (memoryGiB > 3.0 && profile.cpuCount >= 4) return DeviceClass::Medium;
    return DeviceClass::Low;
}

NetworkQuality AdaptiveConcurrencyController::qualityLocked() const {
    const auto& t = config_.tierThresholds;
    if (averageRtt_ < t[0]) return NetworkQuality::Excellent;
    if (averageRtt_ < t[1]) return NetworkQuality::Good;
    if (averageRtt_ < t[2]) return NetworkQuality::Fair;
    return NetworkQuality::Poor;
}

size_t AdaptiveConcurrencyController::computeLimitLocked(ConcurrencySnapshot* details) const {
    const double pressure = probe_->memoryPressure();
    const size_t network = networkCeilingFor(averageRtt_, config_);
    const size_t memory = memoryCeilingFor(pressure);

    size_t limit = std::min({network, deviceCeiling_, memory, config_.hardCap});
    limit = std::max<size_t>(1, limit);

    if (details) {
        details->limit = limit;
        details->networkCeiling = network;
        details->deviceCeiling = deviceCeiling_;
        details->memoryCeiling = memory;
        details->activeCount = activeCount_;
        details->averageRttSeconds = averageRtt_;
        details->memoryPressure = pressure;
        details->networkQuality = qualityLocked();
        details->deviceClass = deviceClass_;
    }

    if (limit != lastLimit_) {
        logger_->info("Лимит параллелизма {} -> {} (сеть {}, устройство {}, память {}, RTT {:.2f} с)",
            lastLimit_, limit, network, deviceCeiling_, memory, averageRtt_);
        lastLimit_ = limit;
    }
    return limit;
}

size_t AdaptiveConcurrencyController::currentLimit() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return computeLimitLocked(nullptr);
}

void AdaptiveConcurrencyController::observe(std::chrono::duration<double> roundTripTime) {
    std::lock_guard<std::mutex> lock(mutex_);
    const double sample = std::max(0.0, roundTripTime.count());
    averageRtt_ = averageRtt_ * (1.0 - config_.rttSmoothing) + sample * config_.rttSmoothing;
    logger_->debug("RTT {:.3f} с, среднее {:.3f} с ({})", sample, averageRtt_, toString(qualityLocked()));
}

void AdaptiveConcurrencyController::observeLoad(size_t activeCount) {
    std::lock_guard<std::mutex> lock(mutex_);
    activeCount_ = activeCount;
}

double AdaptiveConcurrencyController::timeoutMultiplier() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& m = config_.multipliers;

    double network = m.network[static_cast<size_t>(qualityLocked())];
    double device = m.device[static_cast<size_t>(deviceClass_)];

    size_t limit = computeLimitLocked(nullptr);
    double load = static_cast<double>(activeCount_) / static_cast<double>(limit);
    double loadFactor = m.loadLow;
    if (load > 0.8) {
        loadFactor = m.loadHigh;
    } else if (load > 0.5) {
        loadFactor = m.loadMedium;
    }
    return network * device * loadFactor;
}

NetworkQuality AdaptiveConcurrencyController::networkQuality() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return qualityLocked();
}

DeviceClass AdaptiveConcurrencyController::deviceClass() const {
    return deviceClass_;
}

double AdaptiveConcurrencyController::averageRttSeconds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return averageRtt_;
}

ConcurrencySnapshot AdaptiveConcurrencyController::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ConcurrencySnapshot s;
    computeLimitLocked(&s);
    return s;
}

} // namespace balancer
} // namespace core
} // namespace infercache
