#ifndef CUTIE_PIHOLE_CLIENT_H
#define CUTIE_PIHOLE_CLIENT_H

#include <string>
#include <vector>

#include "util.h"

namespace cutie {

constexpr int kTopListSize = 10;
constexpr int kRequestTimeoutSec = 5;

// The password and session id reach curl/jq through these environment
// variables, never through the command line.
constexpr const char* kPasswordEnv = "CUTIE_PIHOLE_AUTH_PASSWORD";
constexpr const char* kSessionEnv = "CUTIE_PIHOLE_SID";

struct Summary {
    long long total_queries = 0;
    long long blocked = 0;
    double percent_blocked = 0.0;
    int active_clients = 0;
    long long domains_blocked = 0;
    bool enabled = true;
};

struct HistoryPoint {
    long long timestamp = 0;
    int total = 0;
    int blocked = 0;
};

struct TopEntry {
    std::string name;
    int count = 0;
};

using History = std::vector<HistoryPoint>;
using TopList = std::vector<TopEntry>;

// Every call degrades to an empty/zeroed value on failure; nothing here throws.
class StatsClient {
public:
    virtual ~StatsClient() = default;

    virtual Summary get_summary() = 0;
    virtual History get_history() = 0;
    virtual TopList get_top_blocked(int n) = 0;
    virtual TopList get_top_clients(int n) = 0;
};

using TsvRows = std::vector<std::vector<std::string>>;

Summary parse_summary(const TsvRows& rows);
History parse_history(const TsvRows& rows);
TopList parse_top_list(const TsvRows& rows);

// Pi-hole v6 REST API through curl | jq.
class PiholeClient : public StatsClient {
public:
    PiholeClient(std::string base_url, std::string password, CommandRunner runner = run_shell);

    Summary get_summary() override;
    History get_history() override;
    TopList get_top_blocked(int n) override;
    TopList get_top_clients(int n) override;

    bool authenticate();
    bool has_session() const { return !sid_.empty(); }
    const std::string& last_error() const { return last_error_; }

private:
    struct QueryResult {
        bool ok = false;
        int exit_code = -1;
        TsvRows rows;
        std::string error;
    };

    QueryResult query(const std::string& endpoint, const std::string& jq_program);
    QueryResult run_query(const std::string& endpoint, const std::string& jq_program) const;

    std::string base_url_;
    std::string password_;
    CommandRunner runner_;
    std::string sid_;
    std::string last_error_;
};

}  // namespace cutie

#endif  // CUTIE_PIHOLE_CLIENT_H
