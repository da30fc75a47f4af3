#ifndef CUTIE_UTIL_H
#define CUTIE_UTIL_H

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cutie {

struct ShellResult {
    int exit_code = -1;
    std::vector<std::string> lines;
    std::string output;
};

// Runs a shell command and captures stdout. Swappable so tests can script responses.
using CommandRunner = std::function<ShellResult(const std::string&)>;

ShellResult run_shell(const std::string& command);

int clampi(int v, int lo, int hi);
std::string to_lower(std::string s);
std::string to_upper(std::string s);
std::string trim(const std::string& s);

std::optional<int> parse_int(const std::string& value);
std::optional<bool> parse_bool(const std::string& value);
int to_int(const std::string& value, int fallback = 0);
long long to_ll(const std::string& value, long long fallback = 0);
double to_double(const std::string& value, double fallback = 0.0);

std::string format_double(double value, int precision = 1);
std::string format_count(long long value);
std::string fit(const std::string& s, int w);

std::string shell_quote(const std::string& value);
std::vector<std::string> split_tsv_line(const std::string& line);

std::optional<std::string> read_text_file(const std::string& path);

// Visitor built from lambdas, for std::visit over the event and action variants.
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace cutie

#endif  // CUTIE_UTIL_H
