#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include "core/balancer/AdaptiveConcurrencyController.hpp"

using namespace infercache::core;
using balancer::AdaptiveConcurrencyController;
using balancer::ConcurrencyConfig;

namespace {

constexpr uint64_t kGiB = 1024ULL * 1024ULL * 1024ULL;

std::shared_ptr<platform::StaticResourceProbe> makeProbe(size_t cpus, uint64_t memoryGiB, double pressure) {
    platform::DeviceProfile profile;
    profile.cpuCount = cpus;
    profile.totalMemoryBytes = memoryGiB * kGiB;
    return std::make_shared<platform::StaticResourceProbe>(profile, pressure);
}

void feed(AdaptiveConcurrencyController& controller, double seconds, int samples) {
    for (int i = 0; i < samples; ++i) {
        controller.observe(std::chrono::duration<double>(seconds));
    }
}

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

} // namespace

void smokeTestInitialLimit() {
    AdaptiveConcurrencyController controller(ConcurrencyConfig{}, makeProbe(8, 16, 0.1));
    // Начальное RTT 2 с: уровень Good, потолок 3
    assert(controller.networkQuality() == balancer::NetworkQuality::Good);
    assert(controller.currentLimit() == 3);
    assert(controller.deviceClass() == balancer::DeviceClass::High);

    auto snapshot = controller.snapshot();
    assert(snapshot.deviceCeiling == 6);
    assert(snapshot.memoryCeiling == 5);
    assert(snapshot.networkCeiling == 3);
    assert(snapshot.toJson()["limit"] == 3);
    std::cout << "[OK] AdaptiveConcurrency initial limit\n";
}

void smokeTestNetworkTiers() {
    AdaptiveConcurrencyController controller(ConcurrencyConfig{}, makeProbe(8, 16, 0.1));
    feed(controller, 0.1, 20);
    assert(controller.networkQuality() == balancer::NetworkQuality::Excellent);
    assert(controller.currentLimit() == 5);

    feed(controller, 10.0, 40);
    assert(controller.networkQuality() == balancer::NetworkQuality::Poor);
    assert(controller.currentLimit() == 1);

    feed(controller, 5.0, 60);
    assert(controller.networkQuality() == balancer::NetworkQuality::Fair);
    assert(controller.currentLimit() == 2);
    std::cout << "[OK] AdaptiveConcurrency network tiers\n";
}

void smokeTestEwma() {
    AdaptiveConcurrencyController controller(ConcurrencyConfig{}, makeProbe(8, 16, 0.1));
    assert(near(controller.averageRttSeconds(), 2.0));
    controller.observe(std::chrono::duration<double>(1.0));
    assert(near(controller.averageRttSeconds(), 1.8));
    std::cout << "[OK] AdaptiveConcurrency EWMA\n";
}

void smokeTestResourceCeilings() {
    auto probe = makeProbe(8, 16, 0.1);
    AdaptiveConcurrencyController controller(ConcurrencyConfig{}, probe);
    feed(controller, 0.1, 20);
    assert(controller.currentLimit() == 5);

    // Давление памяти читается при каждом вычислении лимита
    probe->setMemoryPressure(0.85);
    assert(controller.currentLimit() == 1);
    probe->setMemoryPressure(0.65);
    assert(controller.currentLimit() == 2);
    probe->setMemoryPressure(0.1);
    assert(controller.currentLimit() == 5);

    AdaptiveConcurrencyController small(ConcurrencyConfig{}, makeProbe(2, 2, 0.1));
    feed(small, 0.1, 20);
    assert(small.currentLimit() == 2);
    assert(small.deviceClass() == balancer::DeviceClass::Low);

    ConcurrencyConfig capped;
    capped.hardCap = 2;
    AdaptiveConcurrencyController limited(capped, makeProbe(8, 16, 0.1));
    feed(limited, 0.1, 20);
    assert(limited.currentLimit() == 2);

    assert(AdaptiveConcurrencyController::deviceCeilingFor({6, 8 * kGiB}) == 4);
    assert(AdaptiveConcurrencyController::deviceCeilingFor({4, 4 * kGiB}) == 3);
    assert(AdaptiveConcurrencyController::memoryCeilingFor(0.5) == 3);
    std::cout << "[OK] AdaptiveConcurrency resource ceilings\n";
}

void smokeTestTimeoutMultiplier() {
    AdaptiveConcurrencyController controller(ConcurrencyConfig{}, makeProbe(8, 16, 0.1));
    // Good (1.0) * High (0.8) * низкая нагрузка (0.9)
    assert(near(controller.timeoutMultiplier(), 0.72));

    controller.observeLoad(3);
    // Все слоты заняты: множитель нагрузки 1.2
    assert(near(controller.timeoutMultiplier(), 0.96));

    controller.observeLoad(0);
    feed(controller, 10.0, 40);
    assert(near(controller.timeoutMultiplier(), 2.0 * 0.8 * 0.9));
    std::cout << "[OK] AdaptiveConcurrency timeout multiplier\n";
}

void smokeTestConfigJson() {
    ConcurrencyConfig config;
    config.hardCap = 4;
    config.rttSmoothing = 0.5;
    auto restored = ConcurrencyConfig::fromJson(config.toJson());
    assert(restored.hardCap == 4);
    assert(near(restored.rttSmoothing, 0.5));
    assert(restored.validate());

    ConcurrencyConfig broken;
    broken.tierThresholds = {{3.0, 1.0, 8.0}};
    assert(!broken.validate());
    std::cout << "[OK] AdaptiveConcurrency config\n";
}

int main() {
    smokeTestInitialLimit();
    smokeTestNetworkTiers();
    smokeTestEwma();
    smokeTestResourceCeilings();
    smokeTestTimeoutMultiplier();
    smokeTestConfigJson();
    std::cout << "All AdaptiveConcurrency tests passed!\n";
    return 0;
}
