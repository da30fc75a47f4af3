#include "pihole_client.h"

#include <stdlib.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <utility>

#include "log.h"

namespace cutie {

namespace {

constexpr int kCurlHttpError = 22;

const char* kSummaryJq =
    "[(.queries.total // 0), (.queries.blocked // 0), (.queries.percent_blocked // 0), "
    "(.clients.active // 0), (.gravity.domains_being_blocked // 0), "
    "((.blocking // true) | if type == \"string\" then (. == \"enabled\") else . end)] "
    "| map(tostring) | @tsv";

const char* kHistoryJq =
    "(.history // [])[] | [(.timestamp // 0), (.total // 0), (.blocked // 0)] | map(tostring) | @tsv";

const char* kTopDomainsJq =
    "(.domains // [])[] | [(.domain // \"unknown\"), (.count // 0)] | map(tostring) | @tsv";

const char* kTopClientsJq =
    "(.clients // [])[] | [(if ((.name // \"\") != \"\") then .name else (.ip // \"unknown\") end), (.count // 0)] "
    "| map(tostring) | @tsv";

std::string curl_prefix() {
    return "curl -sS --fail --max-time " + std::to_string(kRequestTimeoutSec) + " ";
}

bool export_env(const char* name, const std::string& value) {
    const int rc = value.empty() ? ::unsetenv(name) : ::setenv(name, value.c_str(), 1);
    if (rc != 0) {
        spdlog::error("pihole: cannot export {}: {}", name, std::strerror(errno));
        return false;
    }
    return true;
}

}  // namespace

Summary parse_summary(const TsvRows& rows) {
    Summary s;
    if (rows.empty() || rows.front().size() < 6) {
        return s;
    }
    const auto& row = rows.front();
    s.total_queries = std::max(0LL, to_ll(row[0], 0));
    s.blocked = std::max(0LL, to_ll(row[1], 0));
    s.percent_blocked = std::clamp(to_double(row[2], 0.0), 0.0, 100.0);
    s.active_clients = std::max(0, to_int(row[3], 0));
    s.domains_blocked = std::max(0LL, to_ll(row[4], 0));
    s.enabled = row[5] != "false";
    return s;
}

History parse_history(const TsvRows& rows) {
    History out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        if (row.size() < 3) {
            continue;
        }
        HistoryPoint p;
        p.timestamp = static_cast<long long>(std::llround(to_double(row[0], 0.0)));
        p.total = std::max(0, to_int(row[1], 0));
        p.blocked = std::clamp(to_int(row[2], 0), 0, p.total);
        out.push_back(p);
    }
    return out;
}

TopList parse_top_list(const TsvRows& rows) {
    TopList out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        if (row.size() < 2) {
            continue;
        }
        out.push_back({row[0].empty() ? std::string("unknown") : row[0], std::max(0, to_int(row[1], 0))});
    }
    return out;
}

PiholeClient::PiholeClient(std::string base_url, std::string password, CommandRunner runner)
    : base_url_(std::move(base_url)), password_(std::move(password)), runner_(std::move(runner)) {
    if (!export_env(kSessionEnv, "") || !export_env(kPasswordEnv, password_)) {
        last_error_ = "cannot pass password to curl";
        return;
    }
    authenticate();
}

bool PiholeClient::authenticate() {
    if (password_.empty()) {
        return false;
    }
    const std::string script =
        "set -o pipefail; jq -nc '{password: env." + std::string(kPasswordEnv) + "}' | " +
        curl_prefix() + "-X POST -H 'Content-Type: application/json' --data @- " +
        shell_quote(base_url_ + "/auth") + " 2>/dev/null | jq -r '.session.sid // empty'";

    const ShellResult shell = runner_("bash -c " + shell_quote(script));
    const std::string sid = shell.lines.empty() ? std::string() : trim(shell.lines.front());
    if (shell.exit_code != 0 || sid.empty() || !export_env(kSessionEnv, sid)) {
        sid_.clear();
        last_error_ = "auth failed";
        spdlog::warn("pihole: authentication against {} failed (exit {})", base_url_, shell.exit_code);
        return false;
    }
    sid_ = sid;
    spdlog::info("pihole: authenticated");
    return true;
}

PiholeClient::QueryResult PiholeClient::run_query(const std::string& endpoint, const std::string& jq_program) const {
    QueryResult out;
    std::string script = "set -o pipefail; ";
    if (!sid_.empty()) {
        // printf is a bash builtin, so the sid only travels through the pipe.
        script += "printf 'sid: %s\\n' \"$" + std::string(kSessionEnv) + "\" | " + curl_prefix() + "-H @- ";
    } else {
        script += curl_prefix();
    }
    script += shell_quote(base_url_ + endpoint) + " 2>/dev/null | jq -r " + shell_quote(jq_program);

    const ShellResult shell = runner_("bash -c " + shell_quote(script));
    out.exit_code = shell.exit_code;
    if (shell.exit_code != 0) {
        out.error = shell.output.empty() ? "query failed" : trim(shell.output);
        return out;
    }

    out.ok = true;
    out.rows.reserve(shell.lines.size());
    for (const auto& line : shell.lines) {
        out.rows.push_back(split_tsv_line(line));
    }
    return out;
}

PiholeClient::QueryResult PiholeClient::query(const std::string& endpoint, const std::string& jq_program) {
    QueryResult result = run_query(endpoint, jq_program);
    if (!result.ok && result.exit_code == kCurlHttpError && !password_.empty()) {
        // Session expired or never established.
        if (authenticate()) {
            result = run_query(endpoint, jq_program);
        }
    }
    if (!result.ok) {
        last_error_ = endpoint + ": " + result.error;
        spdlog::warn("pihole: {} failed (exit {}): {}", endpoint, result.exit_code, result.error);
    } else {
        last_error_.clear();
    }
    return result;
}

Summary PiholeClient::get_summary() {
    const QueryResult q = query("/stats/summary", kSummaryJq);
    return q.ok ? parse_summary(q.rows) : Summary{};
}

History PiholeClient::get_history() {
    const QueryResult q = query("/history", kHistoryJq);
    return q.ok ? parse_history(q.rows) : History{};
}

TopList PiholeClient::get_top_blocked(int n) {
    const QueryResult q = query("/stats/top_domains?blocked=true&count=" + std::to_string(n), kTopDomainsJq);
    return q.ok ? parse_top_list(q.rows) : TopList{};
}

TopList PiholeClient::get_top_clients(int n) {
    const QueryResult q = query("/stats/top_clients?count=" + std::to_string(n), kTopClientsJq);
    return q.ok ? parse_top_list(q.rows) : TopList{};
}

}  // namespace cutie
