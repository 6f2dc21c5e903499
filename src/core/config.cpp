#include "core/config.hpp"
#include <array>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>

namespace riskwatch {

using json = nlohmann::json;

namespace {

/// Get environment variable value, or nullopt if not set
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/// Get environment variable as integer (with optional range validation)
std::optional<int> get_env_int(const char* name, int min_val = std::numeric_limits<int>::min(),
                               int max_val = std::numeric_limits<int>::max()) {
    auto value = get_env(name);
    if (value) {
        try {
            int result = std::stoi(*value);
            if (result < min_val || result > max_val) {
                std::cerr << "Warning: " << name << " value " << result
                          << " out of range [" << min_val << ", " << max_val
                          << "], ignoring" << std::endl;
                return std::nullopt;
            }
            return result;
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid integer value for " << name
                      << ": " << *value << ", ignoring" << std::endl;
            return std::nullopt;
        }
    }
    return std::nullopt;
}

/// Get environment variable as positive size_t
std::optional<std::size_t> get_env_size(const char* name, std::size_t max_val = std::numeric_limits<std::size_t>::max()) {
    auto value = get_env(name);
    if (value) {
        try {
            long long result = std::stoll(*value);
            if (result <= 0) {
                std::cerr << "Warning: " << name << " must be positive, ignoring"
                          << std::endl;
                return std::nullopt;
            }
            if (static_cast<unsigned long long>(result) > max_val) {
                std::cerr << "Warning: " << name << " value too large, ignoring"
                          << std::endl;
                return std::nullopt;
            }
            return static_cast<std::size_t>(result);
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid size value for " << name
                      << ": " << *value << ", ignoring" << std::endl;
            return std::nullopt;
        }
    }
    return std::nullopt;
}

/// Get environment variable as positive double
std::optional<double> get_env_positive_double(const char* name) {
    auto value = get_env(name);
    if (value) {
        try {
            double result = std::stod(*value);
            if (result <= 0.0) {
                std::cerr << "Warning: " << name << " must be positive, ignoring"
                          << std::endl;
                return std::nullopt;
            }
            return result;
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid numeric value for " << name
                      << ": " << *value << ", ignoring" << std::endl;
            return std::nullopt;
        }
    }
    return std::nullopt;
}

/// Apply environment variable overrides to config
void apply_env_overrides(Config& config) {
    if (auto v = get_env("RISKWATCH_DB_PATH")) {
        config.database.path = *v;
    }

    // Thresholds
    if (auto v = get_env_positive_double("RISKWATCH_CLIENT_EXPOSURE_THRESHOLD")) {
        config.thresholds.client_exposure = *v;
    }
    if (auto v = get_env_positive_double("RISKWATCH_SYMBOL_EXPOSURE_THRESHOLD")) {
        config.thresholds.symbol_exposure = *v;
    }
    if (auto v = get_env_size("RISKWATCH_VELOCITY_THRESHOLD", 1000000)) {
        config.thresholds.velocity = *v;
    }
    // Velocity window: 1 second to 1 day
    if (auto v = get_env_int("RISKWATCH_VELOCITY_WINDOW_SECONDS", 1, 86400)) {
        config.thresholds.velocity_window = std::chrono::seconds(*v);
    }
    if (auto v = get_env_positive_double("RISKWATCH_ANOMALY_THRESHOLD")) {
        config.thresholds.anomaly_stddev = *v;
    }

    // Engine
    if (auto v = get_env_int("RISKWATCH_POLL_INTERVAL_MS", 10, 600000)) {
        config.engine.poll_interval = std::chrono::milliseconds(*v);
    }
    if (auto v = get_env_size("RISKWATCH_BATCH_SIZE", 1000000)) {
        config.engine.batch_size = *v;
    }
    if (auto v = get_env_size("RISKWATCH_WORKER_THREADS", 256)) {
        config.engine.worker_threads = *v;
    }
    if (auto v = get_env_size("RISKWATCH_ANOMALY_WINDOW", 100000)) {
        config.engine.anomaly_window = *v;
    }
    if (auto v = get_env_int("RISKWATCH_ALERT_COOLDOWN_SECONDS", 0, 86400)) {
        config.engine.alert_cooldown = std::chrono::seconds(*v);
    }
    if (auto v = get_env_int("RISKWATCH_SNAPSHOT_INTERVAL_MS", 100, 3600000)) {
        config.engine.snapshot_interval = std::chrono::milliseconds(*v);
    }

    // Notifications
    if (auto v = get_env("RISKWATCH_WEBHOOK_URL")) {
        config.notifications.webhook_url = *v;
    }
    if (auto v = get_env("RISKWATCH_SMTP_HOST")) {
        config.notifications.smtp_host = *v;
    }
    if (auto v = get_env("RISKWATCH_SMTP_PORT")) {
        config.notifications.smtp_port = *v;
    }
    if (auto v = get_env("RISKWATCH_SMTP_USERNAME")) {
        config.notifications.smtp_username = *v;
    }
    if (auto v = get_env("RISKWATCH_SMTP_PASSWORD")) {
        config.notifications.smtp_password = *v;
    }
    if (auto v = get_env("RISKWATCH_ALERT_EMAIL_FROM")) {
        config.notifications.email_from = *v;
    }
    if (auto v = get_env("RISKWATCH_ALERT_EMAIL_TO")) {
        config.notifications.email_to = *v;
    }
    if (auto v = get_env("RISKWATCH_TLS_CA_FILE")) {
        config.notifications.tls_ca_file = *v;
    }

    // Output: 0 disables the server, otherwise non-privileged ports only
    if (auto v = get_env_int("RISKWATCH_WS_SERVER_PORT", 0, 65535)) {
        if (*v == 0 || *v >= 1024) {
            config.output.ws_server_port = static_cast<std::uint16_t>(*v);
        }
    }
    if (auto v = get_env("RISKWATCH_LOG_LEVEL")) {
        config.output.log_level = *v;
    }
}

void read_overrides(const json& j, std::map<std::string, double>& out) {
    for (const auto& [key, value] : j.items()) {
        out[key] = value.get<double>();
    }
}

bool is_known_log_level(const std::string& level) {
    static constexpr std::array<const char*, 7> kLevels{
        "trace", "debug", "info", "warn", "error", "critical", "off"};
    for (const char* known : kLevels) {
        if (level == known) {
            return true;
        }
    }
    return false;
}

}  // namespace

Result<Config, std::string> Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config, std::string>::Err("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    json j;
    try {
        j = json::parse(content);
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Failed to parse JSON: " + std::string(e.what()));
    }

    Config config = Config::defaults();

    try {
        if (j.contains("database")) {
            const auto& db = j["database"];
            if (db.contains("path")) {
                config.database.path = db["path"].get<std::string>();
            }
            if (db.contains("busy_timeout_ms")) {
                config.database.busy_timeout =
                    std::chrono::milliseconds(db["busy_timeout_ms"].get<int>());
            }
        }

        if (j.contains("thresholds")) {
            const auto& th = j["thresholds"];
            if (th.contains("client_exposure")) {
                config.thresholds.client_exposure = th["client_exposure"].get<double>();
            }
            if (th.contains("symbol_exposure")) {
                config.thresholds.symbol_exposure = th["symbol_exposure"].get<double>();
            }
            if (th.contains("velocity")) {
                config.thresholds.velocity = th["velocity"].get<std::size_t>();
            }
            if (th.contains("velocity_window_seconds")) {
                config.thresholds.velocity_window =
                    std::chrono::seconds(th["velocity_window_seconds"].get<int>());
            }
            if (th.contains("anomaly_stddev")) {
                config.thresholds.anomaly_stddev = th["anomaly_stddev"].get<double>();
            }
            if (th.contains("risk_bands")) {
                const auto& bands = th["risk_bands"];
                if (bands.contains("medium")) {
                    config.thresholds.medium_ratio = bands["medium"].get<double>();
                }
                if (bands.contains("high")) {
                    config.thresholds.high_ratio = bands["high"].get<double>();
                }
                if (bands.contains("critical")) {
                    config.thresholds.critical_ratio = bands["critical"].get<double>();
                }
            }
            if (th.contains("client_overrides")) {
                read_overrides(th["client_overrides"], config.thresholds.client_overrides);
            }
            if (th.contains("symbol_overrides")) {
                read_overrides(th["symbol_overrides"], config.thresholds.symbol_overrides);
            }
        }

        if (j.contains("engine")) {
            const auto& eng = j["engine"];
            if (eng.contains("poll_interval_ms")) {
                config.engine.poll_interval =
                    std::chrono::milliseconds(eng["poll_interval_ms"].get<int>());
            }
            if (eng.contains("batch_size")) {
                config.engine.batch_size = eng["batch_size"].get<std::size_t>();
            }
            if (eng.contains("worker_threads")) {
                config.engine.worker_threads = eng["worker_threads"].get<std::size_t>();
            }
            if (eng.contains("anomaly_window")) {
                config.engine.anomaly_window = eng["anomaly_window"].get<std::size_t>();
            }
            if (eng.contains("anomaly_min_samples")) {
                config.engine.anomaly_min_samples = eng["anomaly_min_samples"].get<std::size_t>();
            }
            if (eng.contains("alert_cooldown_seconds")) {
                config.engine.alert_cooldown =
                    std::chrono::seconds(eng["alert_cooldown_seconds"].get<int>());
            }
            if (eng.contains("snapshot_interval_ms")) {
                config.engine.snapshot_interval =
                    std::chrono::milliseconds(eng["snapshot_interval_ms"].get<int>());
            }
            if (eng.contains("retry_delay_initial_ms")) {
                config.engine.retry_delay_initial =
                    std::chrono::milliseconds(eng["retry_delay_initial_ms"].get<int>());
            }
            if (eng.contains("retry_delay_max_ms")) {
                config.engine.retry_delay_max =
                    std::chrono::milliseconds(eng["retry_delay_max_ms"].get<int>());
            }
            if (eng.contains("retry_backoff_multiplier")) {
                config.engine.retry_backoff_multiplier = eng["retry_backoff_multiplier"].get<double>();
            }
            if (eng.contains("retry_jitter_factor")) {
                config.engine.retry_jitter_factor = eng["retry_jitter_factor"].get<double>();
            }
        }

        if (j.contains("notifications")) {
            const auto& n = j["notifications"];
            if (n.contains("webhook_url")) {
                config.notifications.webhook_url = n["webhook_url"].get<std::string>();
            }
            if (n.contains("smtp_host")) {
                config.notifications.smtp_host = n["smtp_host"].get<std::string>();
            }
            if (n.contains("smtp_port")) {
                config.notifications.smtp_port = n["smtp_port"].get<std::string>();
            }
            if (n.contains("smtp_username")) {
                config.notifications.smtp_username = n["smtp_username"].get<std::string>();
            }
            if (n.contains("smtp_password")) {
                config.notifications.smtp_password = n["smtp_password"].get<std::string>();
            }
            if (n.contains("email_from")) {
                config.notifications.email_from = n["email_from"].get<std::string>();
            }
            if (n.contains("email_to")) {
                config.notifications.email_to = n["email_to"].get<std::string>();
            }
            if (n.contains("max_attempts")) {
                config.notifications.max_attempts = n["max_attempts"].get<std::size_t>();
            }
            if (n.contains("retry_delay_ms")) {
                config.notifications.retry_delay =
                    std::chrono::milliseconds(n["retry_delay_ms"].get<int>());
            }
            if (n.contains("timeout_ms")) {
                config.notifications.timeout =
                    std::chrono::milliseconds(n["timeout_ms"].get<int>());
            }
            if (n.contains("tls_verify")) {
                config.notifications.tls_verify = n["tls_verify"].get<bool>();
            }
            if (n.contains("tls_ca_file")) {
                config.notifications.tls_ca_file = n["tls_ca_file"].get<std::string>();
            }
        }

        if (j.contains("output")) {
            const auto& out = j["output"];
            if (out.contains("console_interval_ms")) {
                config.output.console_interval =
                    std::chrono::milliseconds(out["console_interval_ms"].get<int>());
            }
            if (out.contains("ws_server_port")) {
                config.output.ws_server_port = out["ws_server_port"].get<std::uint16_t>();
            }
            if (out.contains("log_level")) {
                config.output.log_level = out["log_level"].get<std::string>();
            }
        }
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Error reading config field: " + std::string(e.what()));
    }

    return Result<Config, std::string>::Ok(config);
}

Result<Config> Config::load(const std::optional<std::string>& config_path) {
    Config config = Config::defaults();

    if (config_path) {
        auto result = load_from_file(*config_path);
        if (result.is_err()) {
            return Result<Config>::Err(Error::config(
                "cannot load '" + *config_path + "': " + result.error()));
        }
        config = std::move(result).take_value();
    }

    // Environment variables have the highest priority below the CLI
    apply_env_overrides(config);

    return Result<Config>::Ok(std::move(config));
}

Status Config::apply_threshold_overrides(const std::map<std::string, double>& values) {
    for (const auto& [name, value] : values) {
        if (name == "client_exposure_threshold") {
            thresholds.client_exposure = value;
        } else if (name == "symbol_exposure_threshold") {
            thresholds.symbol_exposure = value;
        } else if (name == "velocity_threshold") {
            if (value < 1.0) {
                return Status::Err(Error::config("velocity_threshold must be >= 1"));
            }
            thresholds.velocity = static_cast<std::size_t>(value);
        } else if (name == "velocity_window_seconds") {
            if (value < 1.0) {
                return Status::Err(Error::config("velocity_window_seconds must be >= 1"));
            }
            thresholds.velocity_window = std::chrono::seconds(static_cast<std::int64_t>(value));
        } else if (name == "anomaly_stddev_threshold") {
            thresholds.anomaly_stddev = value;
        } else {
            return Status::Err(Error::config("unknown threshold setting '" + name + "'"));
        }
    }
    return ok_status();
}

Status Config::validate() const {
    auto fail = [](const std::string& msg) {
        return Status::Err(Error::config(msg));
    };

    if (database.path.empty()) {
        return fail("database.path must not be empty");
    }

    if (thresholds.client_exposure <= 0.0) {
        return fail("client exposure threshold must be positive");
    }
    if (thresholds.symbol_exposure <= 0.0) {
        return fail("symbol exposure threshold must be positive");
    }
    if (thresholds.velocity == 0) {
        return fail("velocity threshold must be at least 1");
    }
    if (thresholds.velocity_window.count() <= 0) {
        return fail("velocity window must be positive");
    }
    if (thresholds.anomaly_stddev <= 0.0) {
        return fail("anomaly threshold must be positive");
    }
    if (!(thresholds.medium_ratio > 0.0 &&
          thresholds.medium_ratio < thresholds.high_ratio &&
          thresholds.high_ratio <= thresholds.critical_ratio)) {
        return fail("risk bands must satisfy 0 < medium < high <= critical");
    }
    for (const auto& [id, value] : thresholds.client_overrides) {
        if (value <= 0.0) {
            return fail("client threshold override for '" + id + "' must be positive");
        }
    }
    for (const auto& [id, value] : thresholds.symbol_overrides) {
        if (value <= 0.0) {
            return fail("symbol threshold override for '" + id + "' must be positive");
        }
    }

    if (engine.poll_interval.count() <= 0) {
        return fail("poll interval must be positive");
    }
    if (engine.batch_size == 0) {
        return fail("batch size must be at least 1");
    }
    if (engine.worker_threads == 0 || engine.worker_threads > 256) {
        return fail("worker threads must be in [1, 256]");
    }
    if (engine.anomaly_min_samples < 2) {
        return fail("anomaly minimum sample size must be at least 2");
    }
    if (engine.anomaly_window < engine.anomaly_min_samples) {
        return fail("anomaly window must hold at least the minimum sample size");
    }
    if (engine.alert_cooldown.count() < 0) {
        return fail("alert cooldown must not be negative");
    }
    if (engine.snapshot_interval.count() <= 0) {
        return fail("snapshot interval must be positive");
    }
    if (engine.retry_delay_initial.count() <= 0 ||
        engine.retry_delay_max < engine.retry_delay_initial) {
        return fail("retry delays must satisfy 0 < initial <= max");
    }
    if (engine.retry_backoff_multiplier < 1.0) {
        return fail("retry backoff multiplier must be >= 1");
    }
    if (engine.retry_jitter_factor < 0.0 || engine.retry_jitter_factor >= 1.0) {
        return fail("retry jitter factor must be in [0, 1)");
    }

    if (notifications.webhook_enabled() &&
        notifications.webhook_url.rfind("https://", 0) != 0) {
        return fail("webhook_url must be an https:// URL");
    }
    if (notifications.email_enabled() &&
        (notifications.smtp_host.empty() || notifications.email_to.empty())) {
        return fail("e-mail notifications need smtp_host and email_to");
    }
    if (notifications.max_attempts == 0) {
        return fail("notification max_attempts must be at least 1");
    }

    if (!is_known_log_level(output.log_level)) {
        return fail("unknown log level '" + output.log_level + "'");
    }

    return ok_status();
}

}  // namespace riskwatch
