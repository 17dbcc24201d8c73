#include "core/platform/ResourceProbe.hpp"
#include <algorithm>
#include <fstream>
#include <thread>

// Platform detection
#if defined(__APPLE__)
    #define INFERCACHE_PLATFORM_APPLE
    #include <mach/mach.h>
    #include <sys/sysctl.h>
#elif defined(__linux__)
    #define INFERCACHE_PLATFORM_LINUX
    #include <sys/sysinfo.h>
    #include <unistd.h>
#else
    #error "Неподдерживаемая платформа. Поддерживаются только Apple и Linux"
#endif

namespace infercache {
namespace core {
namespace platform {

DeviceProfile SystemResourceProbe::deviceProfile() const {
    DeviceProfile profile;
    profile.cpuCount = std::max<size_t>(1, std::thread::hardware_concurrency());

#ifdef INFERCACHE_PLATFORM_APPLE
    uint64_t memsize = 0;
    size_t size = sizeof(memsize);
    if (sysctlbyname("hw.memsize", &memsize, &size, nullptr, 0) == 0) {
        profile.totalMemoryBytes = memsize;
    }
    int ncpu = 0;
    size = sizeof(ncpu);
    if (sysctlbyname("hw.ncpu", &ncpu, &size, nullptr, 0) == 0 && ncpu > 0) {
        profile.cpuCount = static_cast<size_t>(ncpu);
    }
#elif defined(INFERCACHE_PLATFORM_LINUX)
    struct sysinfo si;
    if (sysinfo(&si) == 0) {
        profile.totalMemoryBytes = static_cast<uint64_t>(si.totalram) * si.mem_unit;
    }
#endif
    return profile;
}

double SystemResourceProbe::memoryPressure() const {
    uint64_t resident = 0;
    uint64_t total = deviceProfile().totalMemoryBytes;

#ifdef INFERCACHE_PLATFORM_APPLE
    mach_task_basic_info_data_t info;
    mach_msg_type_number_t count = MACH_TASK_BASIC_INFO_COUNT;
    if (task_info(mach_task_self(), MACH_TASK_BASIC_INFO,
                  reinterpret_cast<task_info_t>(&info), &count) == KERN_SUCCESS) {
        resident = info.resident_size;
    }
#elif defined(INFERCACHE_PLATFORM_LINUX)
    std::ifstream statm("/proc/self/statm");
    uint64_t sizePages = 0, residentPages = 0;
    if (statm >> sizePages >> residentPages) {
        long pageSize = sysconf(_SC_PAGESIZE);
        resident = residentPages * static_cast<uint64_t>(pageSize > 0 ? pageSize : 4096);
    }
#endif

    if (total == 0) {
        return 0.0;
    }
    return std::min(1.0, static_cast<double>(resident) / static_cast<double>(total));
}

} // namespace platform
} // namespace core
} // namespace infercache
