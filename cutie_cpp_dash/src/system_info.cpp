#include "system_info.h"

#include <sys/statvfs.h>

#include <algorithm>
#include <sstream>
#include <utility>
#include <vector>

#include "log.h"

namespace cutie {

namespace {

const char* kFanPaths[] = {
    "/sys/devices/platform/cooling_fan/hwmon/hwmon2/fan1_input",
    "/sys/devices/platform/cooling_fan/hwmon/hwmon3/fan1_input",
    "/sys/devices/platform/cooling_fan/hwmon/hwmon1/fan1_input",
};

}  // namespace

double SystemMetrics::mem_percent() const {
    return mem_total_mb > 0.0 ? mem_used_mb / mem_total_mb * 100.0 : 0.0;
}

double SystemMetrics::disk_percent() const {
    return disk_total_gb > 0.0 ? disk_used_gb / disk_total_gb * 100.0 : 0.0;
}

std::string format_uptime(double seconds) {
    if (seconds < 0.0) {
        return "N/A";
    }
    const long long secs = static_cast<long long>(seconds);
    const long long days = secs / 86400;
    const long long hours = (secs % 86400) / 3600;
    const long long mins = (secs % 3600) / 60;
    std::ostringstream oss;
    if (days > 0) {
        oss << days << "d ";
    }
    oss << hours << "h " << mins << "m";
    return oss.str();
}

SystemInfo::SystemInfo(std::string root, CommandRunner runner)
    : root_(std::move(root)), runner_(std::move(runner)) {}

SystemMetrics SystemInfo::sample() {
    SystemMetrics m;
    read_cpu(m);
    read_memory(m);
    read_disk(m);
    read_temperature(m);
    read_uptime(m);
    read_network(m);
    read_fan(m);
    return m;
}

void SystemInfo::read_cpu(SystemMetrics& m) {
    m.cpu_percent = last_cpu_percent_;
    const std::optional<std::string> text = read_text_file(path("/proc/stat"));
    if (!text) {
        spdlog::debug("system: /proc/stat unreadable");
        return;
    }
    std::istringstream in(*text);
    std::string label;
    in >> label;
    if (label != "cpu") {
        return;
    }
    std::vector<long long> fields;
    long long v = 0;
    while (fields.size() < 10 && in >> v) {
        fields.push_back(v);
    }
    if (fields.size() < 4) {
        return;
    }
    CpuTimes now;
    now.idle = fields[3];
    for (long long f : fields) {
        now.total += f;
    }
    if (last_cpu_) {
        const long long idle_delta = now.idle - last_cpu_->idle;
        const long long total_delta = now.total - last_cpu_->total;
        if (total_delta > 0) {
            last_cpu_percent_ = 100.0 * (1.0 - static_cast<double>(idle_delta) / static_cast<double>(total_delta));
            m.cpu_percent = last_cpu_percent_;
        }
    }
    last_cpu_ = now;
}

void SystemInfo::read_memory(SystemMetrics& m) const {
    const std::optional<std::string> text = read_text_file(path("/proc/meminfo"));
    if (!text) {
        spdlog::debug("system: /proc/meminfo unreadable");
        return;
    }
    long long total_kb = 0;
    long long available_kb = 0;
    std::istringstream in(*text);
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream ls(line);
        std::string key;
        long long value = 0;
        if (!(ls >> key >> value)) {
            continue;
        }
        if (key == "MemTotal:") total_kb = value;
        if (key == "MemAvailable:") available_kb = value;
    }
    m.mem_total_mb = static_cast<double>(total_kb) / 1024.0;
    m.mem_used_mb = static_cast<double>(total_kb - available_kb) / 1024.0;
}

void SystemInfo::read_disk(SystemMetrics& m) const {
    struct statvfs st{};
    const std::string mount = root_.empty() ? "/" : root_;
    if (statvfs(mount.c_str(), &st) != 0) {
        spdlog::debug("system: statvfs({}) failed", mount);
        return;
    }
    constexpr double kGiB = 1024.0 * 1024.0 * 1024.0;
    const double frsize = static_cast<double>(st.f_frsize);
    m.disk_total_gb = static_cast<double>(st.f_blocks) * frsize / kGiB;
    m.disk_used_gb = static_cast<double>(st.f_blocks - st.f_bfree) * frsize / kGiB;
}

void SystemInfo::read_temperature(SystemMetrics& m) const {
    const std::optional<std::string> text = read_text_file(path("/sys/class/thermal/thermal_zone0/temp"));
    if (!text) {
        return;
    }
    const std::optional<int> milli = parse_int(*text);
    m.temp_c = milli ? static_cast<double>(*milli) / 1000.0 : 0.0;
}

void SystemInfo::read_uptime(SystemMetrics& m) const {
    const std::optional<std::string> text = read_text_file(path("/proc/uptime"));
    if (!text) {
        return;
    }
    std::istringstream in(*text);
    double secs = -1.0;
    if (in >> secs) {
        m.uptime = format_uptime(secs);
    }
}

void SystemInfo::read_network(SystemMetrics& m) const {
    if (runner_) {
        const ShellResult shell = runner_("hostname -I 2>/dev/null");
        if (shell.exit_code == 0 && !shell.lines.empty()) {
            std::istringstream in(shell.lines.front());
            std::string first;
            if (in >> first) {
                m.ip_address = first;
            }
        }
    }
    const std::optional<std::string> host = read_text_file(path("/etc/hostname"));
    if (host && !trim(*host).empty()) {
        m.hostname = trim(*host);
    }
}

void SystemInfo::read_fan(SystemMetrics& m) const {
    for (const char* fan : kFanPaths) {
        const std::optional<std::string> text = read_text_file(path(fan));
        if (!text) {
            continue;
        }
        const std::optional<int> rpm = parse_int(*text);
        if (rpm) {
            m.fan_rpm = std::max(0, *rpm);
            return;
        }
    }
}

}  // namespace cutie
