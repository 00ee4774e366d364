#include <beacon/core/probes/process_probe.hpp>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <unistd.h>

namespace Beacon {

namespace {

// Fields after the ")" that closes comm in /proc/<pid>/stat
constexpr size_t STAT_UTIME_INDEX = 11;
constexpr size_t STAT_STIME_INDEX = 12;

std::ifstream openProcFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot read " + path);
    }
    return file;
}

} // namespace

ProcessProbe::ProcessProbe(MetricApi& metrics, std::string hostname, std::string proc_root)
    : metrics_(metrics), hostname_(std::move(hostname)), proc_root_(std::move(proc_root)) {}

void ProcessProbe::operator()() const {
    const ProcessSample sample = read(proc_root_);
    const TagSet tags{{"hostname", hostname_}};

    metrics_.setGauge("process_memory_rss_kb", sample.memory_rss_kb, tags);
    metrics_.setGauge("process_thread_count", sample.thread_count, tags);
    metrics_.setGauge("process_cpu_user_ms", sample.cpu_user_ms, tags);
    metrics_.setGauge("process_cpu_system_ms", sample.cpu_system_ms, tags);
}

ProcessSample ProcessProbe::read(const std::string& proc_root, long clock_ticks) {
    ProcessSample sample;

    const std::string status_path = proc_root + "/status";
    std::ifstream status = openProcFile(status_path);
    bool have_rss = false;
    bool have_threads = false;
    std::string line;
    while (std::getline(status, line)) {
        std::istringstream fields(line);
        std::string key;
        fields >> key;
        if (key == "VmRSS:") {
            have_rss = static_cast<bool>(fields >> sample.memory_rss_kb);
        } else if (key == "Threads:") {
            have_threads = static_cast<bool>(fields >> sample.thread_count);
        }
    }
    if (!have_threads) {
        throw std::runtime_error("No Threads entry in " + status_path);
    }
    // Kernel threads have no VmRSS line
    if (!have_rss) {
        sample.memory_rss_kb = 0;
    }

    const std::string stat_path = proc_root + "/stat";
    std::ifstream stat = openProcFile(stat_path);
    std::string content((std::istreambuf_iterator<char>(stat)), std::istreambuf_iterator<char>());

    // comm may contain spaces and parentheses; the last ')' ends it
    const auto comm_end = content.rfind(')');
    if (comm_end == std::string::npos) {
        throw std::runtime_error("Malformed " + stat_path);
    }
    std::istringstream rest(content.substr(comm_end + 1));
    std::vector<std::string> fields;
    std::string field;
    while (rest >> field) {
        fields.push_back(field);
    }
    if (fields.size() <= STAT_STIME_INDEX) {
        throw std::runtime_error("Truncated " + stat_path);
    }

    if (clock_ticks <= 0) {
        clock_ticks = sysconf(_SC_CLK_TCK);
    }
    if (clock_ticks <= 0) {
        throw std::runtime_error("Cannot determine clock ticks per second");
    }

    try {
        const double ms_per_tick = 1000.0 / static_cast<double>(clock_ticks);
        sample.cpu_user_ms = std::stoull(fields[STAT_UTIME_INDEX]) * ms_per_tick;
        sample.cpu_system_ms = std::stoull(fields[STAT_STIME_INDEX]) * ms_per_tick;
    } catch (const std::logic_error& e) {
        throw std::runtime_error("Malformed CPU times in " + stat_path + ": " + e.what());
    }

    return sample;
}

} // namespace Beacon
