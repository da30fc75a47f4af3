#ifndef CUTIE_SYSTEM_INFO_H
#define CUTIE_SYSTEM_INFO_H

#include <optional>
#include <string>

#include "util.h"

namespace cutie {

struct SystemMetrics {
    double cpu_percent = 0.0;
    double mem_used_mb = 0.0;
    double mem_total_mb = 0.0;
    double disk_used_gb = 0.0;
    double disk_total_gb = 0.0;
    double temp_c = 0.0;
    std::string uptime = "N/A";
    std::string ip_address = "N/A";
    std::string hostname = "unknown";
    int fan_rpm = 0;

    double mem_percent() const;
    double disk_percent() const;
};

std::string format_uptime(double seconds);

// Reads /proc and /sys below `root` (empty on a real device).
class SystemInfo {
public:
    explicit SystemInfo(std::string root = "", CommandRunner runner = run_shell);

    SystemMetrics sample();

private:
    struct CpuTimes {
        long long idle = 0;
        long long total = 0;
    };

    std::string path(const std::string& p) const { return root_ + p; }

    void read_cpu(SystemMetrics& m);
    void read_memory(SystemMetrics& m) const;
    void read_disk(SystemMetrics& m) const;
    void read_temperature(SystemMetrics& m) const;
    void read_uptime(SystemMetrics& m) const;
    void read_network(SystemMetrics& m) const;
    void read_fan(SystemMetrics& m) const;

    std::string root_;
    CommandRunner runner_;
    std::optional<CpuTimes> last_cpu_;
    double last_cpu_percent_ = 0.0;
};

}  // namespace cutie

#endif  // CUTIE_SYSTEM_INFO_H
