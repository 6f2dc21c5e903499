#include "core/config.hpp"
#include "core/logging.hpp"
#include "engine/risk_monitor.hpp"
#include "output/alert_text.hpp"
#include "storage/sqlite_store.hpp"
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

using riskwatch::Config;
using riskwatch::storage::SqliteStore;

constexpr int kDefaultCleanupDays = 30;

void print_banner() {
    std::cout << "\nriskwatch\n" << std::endl;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] [alerts <command>]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>    Load configuration from JSON file\n"
              << "  -d, --database <path>  SQLite database file\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n"
              << "\nAlert commands:\n"
              << "  alerts summary            Counts of stored alerts\n"
              << "  alerts list [SEVERITY]    Unacknowledged alerts, newest first\n"
              << "  alerts ack <user> <id>... Acknowledge one or more alerts\n"
              << "  alerts cleanup [days]     Delete acknowledged alerts older than days (default "
              << kDefaultCleanupDays << ")\n"
              << "\nEnvironment Variables:\n"
              << "  RISKWATCH_DB_PATH                    Database file\n"
              << "  RISKWATCH_CLIENT_EXPOSURE_THRESHOLD  Client exposure threshold\n"
              << "  RISKWATCH_SYMBOL_EXPOSURE_THRESHOLD  Symbol exposure threshold\n"
              << "  RISKWATCH_VELOCITY_THRESHOLD         Transactions per velocity window\n"
              << "  RISKWATCH_ANOMALY_THRESHOLD          Anomaly z-score threshold\n"
              << "  RISKWATCH_POLL_INTERVAL_MS           Feed poll interval\n"
              << "  RISKWATCH_WEBHOOK_URL                Chat webhook URL\n"
              << "  RISKWATCH_SMTP_USERNAME              SMTP user (enables e-mail)\n"
              << "  RISKWATCH_SMTP_PASSWORD              SMTP password\n"
              << "  RISKWATCH_ALERT_EMAIL_TO             Comma-separated recipients\n"
              << "  RISKWATCH_WS_SERVER_PORT             Dashboard port (0 disables)\n"
              << "  RISKWATCH_LOG_LEVEL                  trace, debug, info, warn, error\n"
              << "\nPriority: CLI args > Environment > Config file > Defaults\n"
              << std::endl;
}

void print_version() {
    std::cout << "riskwatch v1.0.0\n"
              << "Real-time risk detection for brokerage transactions\n"
              << std::endl;
}

struct CliArgs {
    std::optional<std::string> config_path;
    std::optional<std::string> database;
    std::vector<std::string> command;  // "alerts ..." and its arguments
    bool show_help = false;
    bool show_version = false;
};

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (!args.command.empty()) {
            args.command.push_back(arg);
        } else if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if ((arg == "-d" || arg == "--database") && i + 1 < argc) {
            args.database = argv[++i];
        } else if (arg == "alerts") {
            args.command.push_back(arg);
        } else {
            std::cerr << "Ignoring unknown argument: " << arg << std::endl;
        }
    }

    return args;
}

std::optional<long long> parse_integer(const std::string& text) {
    try {
        std::size_t used = 0;
        long long value = std::stoll(text, &used);
        if (used != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

int alerts_summary(SqliteStore& store) {
    auto summary = store.alert_summary();
    if (summary.is_err()) {
        std::cerr << summary.error().describe() << std::endl;
        return 1;
    }

    const auto& s = summary.value();
    std::cout << "Total alerts:          " << s.total << "\n"
              << "Unacknowledged alerts: " << s.unacknowledged << "\n";

    if (!s.by_severity.empty()) {
        std::cout << "\nBy severity:\n";
        for (const auto& [severity, count] : s.by_severity) {
            std::cout << "  " << std::left << std::setw(10) << severity << count << "\n";
        }
    }
    if (!s.by_type.empty()) {
        std::cout << "\nBy type:\n";
        for (const auto& [type, count] : s.by_type) {
            std::cout << "  " << std::left << std::setw(27) << type << count << "\n";
        }
    }
    std::cout << std::endl;
    return 0;
}

int alerts_list(SqliteStore& store, const std::vector<std::string>& args) {
    riskwatch::storage::AlertFilter filter;
    filter.acknowledged = false;
    filter.limit = 50;

    if (args.size() > 2) {
        auto severity = riskwatch::parse_severity(args[2]);
        if (!severity) {
            std::cerr << "Unknown severity: " << args[2]
                      << " (expected LOW, MEDIUM, HIGH or CRITICAL)" << std::endl;
            return 1;
        }
        filter.severity = severity;
    }

    auto alerts = store.list_alerts(filter);
    if (alerts.is_err()) {
        std::cerr << alerts.error().describe() << std::endl;
        return 1;
    }

    if (alerts.value().empty()) {
        std::cout << "No unacknowledged alerts" << std::endl;
        return 0;
    }

    for (const auto& stored : alerts.value()) {
        const auto& alert = stored.alert;
        std::cout << "[" << stored.row_id << "] "
                  << riskwatch::output::format_local_time(alert.timestamp) << "  "
                  << riskwatch::to_string(alert.severity) << "  "
                  << riskwatch::to_string(alert.alert_type) << "  "
                  << riskwatch::to_string(alert.entity_type) << ":" << alert.entity_id << "\n"
                  << "    " << alert.message << "\n";
    }
    std::cout << std::endl;
    return 0;
}

int alerts_ack(SqliteStore& store, const std::vector<std::string>& args) {
    if (args.size() < 4) {
        std::cerr << "Usage: riskwatch alerts ack <user> <id> [<id>...]" << std::endl;
        return 1;
    }

    const std::string& user = args[2];
    std::vector<std::int64_t> row_ids;
    for (std::size_t i = 3; i < args.size(); ++i) {
        auto row_id = parse_integer(args[i]);
        if (!row_id || *row_id <= 0) {
            std::cerr << "Invalid alert id: " << args[i] << std::endl;
            return 1;
        }
        row_ids.push_back(*row_id);
    }

    auto missing = store.acknowledge_alerts(row_ids, user);
    if (missing.is_err()) {
        std::cerr << missing.error().describe() << std::endl;
        return 1;
    }
    for (std::int64_t row_id : missing.value()) {
        std::cerr << "No alert with id " << row_id << std::endl;
    }

    std::size_t acknowledged = row_ids.size() - missing.value().size();
    std::cout << acknowledged << " alert(s) acknowledged by " << user << std::endl;
    return missing.value().empty() ? 0 : 1;
}

int alerts_cleanup(SqliteStore& store, const std::vector<std::string>& args) {
    long long days = kDefaultCleanupDays;
    if (args.size() > 2) {
        auto parsed = parse_integer(args[2]);
        if (!parsed || *parsed < 0) {
            std::cerr << "Invalid number of days: " << args[2] << std::endl;
            return 1;
        }
        days = *parsed;
    }

    auto cutoff = std::chrono::system_clock::now() - std::chrono::hours{24 * days};
    auto deleted = store.delete_acknowledged_alerts(cutoff);
    if (deleted.is_err()) {
        std::cerr << deleted.error().describe() << std::endl;
        return 1;
    }

    std::cout << "Deleted " << deleted.value() << " acknowledged alert(s) older than "
              << days << " day(s)" << std::endl;
    return 0;
}

int run_alert_command(SqliteStore& store, const std::vector<std::string>& args) {
    const std::string sub = args.size() > 1 ? args[1] : "summary";

    if (sub == "summary") {
        return alerts_summary(store);
    }
    if (sub == "list") {
        return alerts_list(store, args);
    }
    if (sub == "ack") {
        return alerts_ack(store, args);
    }
    if (sub == "cleanup") {
        return alerts_cleanup(store, args);
    }

    std::cerr << "Unknown alerts command: " << sub
              << " (expected summary, list, ack or cleanup)" << std::endl;
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse command line arguments
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Load configuration with priority: CLI > env > file > defaults
    auto loaded = Config::load(args.config_path);
    if (loaded.is_err()) {
        std::cerr << "Fatal error: " << loaded.error().describe() << std::endl;
        return 1;
    }
    Config config = std::move(loaded).take_value();

    // CLI argument overrides (highest priority)
    if (args.database) {
        config.database.path = *args.database;
    }

    riskwatch::setup_logging(config.output.log_level);

    auto opened = SqliteStore::open(config.database.path, config.database.busy_timeout);
    if (opened.is_err()) {
        std::cerr << "Fatal error: cannot open " << config.database.path << ": "
                  << opened.error().describe() << std::endl;
        return 1;
    }
    std::unique_ptr<SqliteStore> store = std::move(opened).take_value();

    if (!args.command.empty()) {
        return run_alert_command(*store, args.command);
    }

    print_banner();

    // Print active configuration
    std::cout << "Configuration:\n"
              << "  Database: " << config.database.path << "\n"
              << "  Client threshold: "
              << riskwatch::output::format_money(config.thresholds.client_exposure) << "\n"
              << "  Symbol threshold: "
              << riskwatch::output::format_money(config.thresholds.symbol_exposure) << "\n"
              << "  Velocity: " << config.thresholds.velocity << " per "
              << config.thresholds.velocity_window.count() << "s\n"
              << "  Anomaly: " << config.thresholds.anomaly_stddev << " std dev\n"
              << "  Local WS port: " << config.output.ws_server_port << "\n"
              << std::endl;

    try {
        riskwatch::RiskMonitor monitor(config, *store);

        auto initialized = monitor.initialize();
        if (initialized.is_err()) {
            std::cerr << "Fatal error: " << initialized.error().describe() << std::endl;
            return 1;
        }

        monitor.run();

        std::cout << "Goodbye!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
