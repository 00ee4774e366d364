#pragma once
#include <beacon/core/metrics/metric_api.hpp>
#include <cstdint>
#include <string>

namespace Beacon {

struct ProcessSample {
    int64_t memory_rss_kb = 0;
    int64_t thread_count = 0;
    double cpu_user_ms = 0.0;
    double cpu_system_ms = 0.0;
};

/**
 * @class ProcessProbe
 * @brief Default probe reporting memory, threads and CPU time of this process
 *
 * Registered as "process". Emits process_memory_rss_kb, process_thread_count,
 * process_cpu_user_ms and process_cpu_system_ms, tagged with the hostname.
 */
class ProcessProbe {
public:
    static constexpr const char* NAME = "process";

    ProcessProbe(MetricApi& metrics, std::string hostname, std::string proc_root = "/proc/self");

    // Throws std::runtime_error when the proc files cannot be read
    void operator()() const;

    /**
     * @brief Parse <proc_root>/status and <proc_root>/stat
     * @param clock_ticks Ticks per second for the stat CPU fields; 0 asks sysconf
     */
    static ProcessSample read(const std::string& proc_root, long clock_ticks = 0);

private:
    MetricApi& metrics_;
    std::string hostname_;
    std::string proc_root_;
};

} // namespace Beacon
