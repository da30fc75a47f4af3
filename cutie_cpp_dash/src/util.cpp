#include "util.h"

#include <sys/wait.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cutie {

ShellResult run_shell(const std::string& command) {
    ShellResult result;
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        result.output = "failed to spawn shell";
        return result;
    }

    std::array<char, 4096> buffer{};
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        result.output.append(buffer.data());
    }

    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = -1;
    }

    std::stringstream ss(result.output);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            result.lines.push_back(line);
        }
    }
    return result;
}

int clampi(int v, int lo, int hi) {
    return std::max(lo, std::min(v, hi));
}

std::string to_lower(std::string s) {
    for (char& ch : s) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return s;
}

std::string to_upper(std::string s) {
    for (char& ch : s) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return s;
}

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

std::optional<int> parse_int(const std::string& value) {
    const std::string t = trim(value);
    if (t.empty()) {
        return std::nullopt;
    }
    try {
        size_t used = 0;
        const int parsed = std::stoi(t, &used);
        if (used != t.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> parse_bool(const std::string& value) {
    const std::string t = to_lower(trim(value));
    if (t == "1" || t == "true" || t == "yes" || t == "on") {
        return true;
    }
    if (t == "0" || t == "false" || t == "no" || t == "off") {
        return false;
    }
    return std::nullopt;
}

int to_int(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

long long to_ll(const std::string& value, long long fallback) {
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double to_double(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string format_double(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

std::string format_count(long long value) {
    if (value >= 1000000) {
        return format_double(static_cast<double>(value) / 1000000.0, 1) + "M";
    }
    if (value >= 1000) {
        return format_double(static_cast<double>(value) / 1000.0, 0) + "K";
    }
    return std::to_string(value);
}

std::string fit(const std::string& s, int w) {
    if (w <= 0) return "";
    if (static_cast<int>(s.size()) <= w) {
        return s;
    }
    if (w <= 3) {
        return s.substr(0, w);
    }
    return s.substr(0, w - 3) + "...";
}

std::string shell_quote(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 8);
    out.push_back('\'');
    for (char ch : value) {
        if (ch == '\'') {
            out += "'\"'\"'";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
}

namespace {

std::string unescape_tsv_field(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '\\' && i + 1 < value.size()) {
            ++i;
            switch (value[i]) {
                case 'n': out.push_back(' '); break;
                case 'r': out.push_back(' '); break;
                case 't': out.push_back(' '); break;
                case '\\': out.push_back('\\'); break;
                default:
                    out.push_back(value[i]);
                    break;
            }
        } else {
            out.push_back(value[i]);
        }
    }
    return out;
}

}  // namespace

std::vector<std::string> split_tsv_line(const std::string& line) {
    std::vector<std::string> cols;
    std::string cur;
    for (char ch : line) {
        if (ch == '\t') {
            cols.push_back(unescape_tsv_field(cur));
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    cols.push_back(unescape_tsv_field(cur));
    return cols;
}

std::optional<std::string> read_text_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return oss.str();
}

}  // namespace cutie
