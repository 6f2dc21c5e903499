#pragma once

#include "core/status.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace riskwatch {

/// Immutable configuration for riskwatch, loaded once at startup
struct Config {
    /// Persistence configuration
    struct Database {
        std::string path = "riskwatch.db";
        std::chrono::milliseconds busy_timeout{5000};
    };

    /// Risk rule thresholds
    struct Thresholds {
        double client_exposure = 1'000'000.0;
        double symbol_exposure = 500'000.0;
        std::size_t velocity = 10;  // transactions per window
        std::chrono::seconds velocity_window{60};
        double anomaly_stddev = 3.0;

        // Risk band boundaries as fractions of the entity threshold
        double medium_ratio = 0.5;
        double high_ratio = 0.8;
        double critical_ratio = 1.0;

        // Per-entity threshold overrides
        std::map<std::string, double> client_overrides;
        std::map<std::string, double> symbol_overrides;

        [[nodiscard]] double client_threshold(const std::string& client_id) const {
            auto it = client_overrides.find(client_id);
            return it != client_overrides.end() ? it->second : client_exposure;
        }

        [[nodiscard]] double symbol_threshold(const std::string& symbol) const {
            auto it = symbol_overrides.find(symbol);
            return it != symbol_overrides.end() ? it->second : symbol_exposure;
        }
    };

    /// Processing engine configuration
    struct Engine {
        std::chrono::milliseconds poll_interval{5000};
        std::size_t batch_size = 1000;
        std::size_t worker_threads = 4;
        std::size_t anomaly_window = 100;
        std::size_t anomaly_min_samples = 5;
        std::chrono::seconds alert_cooldown{300};
        std::chrono::milliseconds snapshot_interval{10000};

        // Backoff for transient store failures
        std::chrono::milliseconds retry_delay_initial{1000};
        std::chrono::milliseconds retry_delay_max{30000};
        double retry_backoff_multiplier = 2.0;
        double retry_jitter_factor = 0.3;  // +/- 30%
    };

    /// Notification channel configuration
    struct Notifications {
        std::string webhook_url;
        std::string smtp_host = "smtp.gmail.com";
        std::string smtp_port = "587";
        std::string smtp_username;
        std::string smtp_password;
        std::string email_from = "alerts@brokerage.com";
        std::string email_to = "risk-team@brokerage.com";
        std::size_t max_attempts = 3;
        std::chrono::milliseconds retry_delay{500};
        std::chrono::milliseconds timeout{5000};

        // TLS for the webhook and SMTP connections
        bool tls_verify = true;
        std::string tls_ca_file;  // extra CA bundle (PEM), e.g. a corporate mail relay

        [[nodiscard]] bool webhook_enabled() const noexcept {
            return !webhook_url.empty();
        }

        [[nodiscard]] bool email_enabled() const noexcept {
            return !smtp_username.empty() && !smtp_password.empty();
        }
    };

    /// Output configuration
    struct Output {
        std::chrono::milliseconds console_interval{5000};
        std::uint16_t ws_server_port = 9001;  // 0 disables the server
        std::string log_level = "info";
    };

    Database database;
    Thresholds thresholds;
    Engine engine;
    Notifications notifications;
    Output output;

    /// Create default configuration
    [[nodiscard]] static Config defaults() {
        return Config{};
    }

    /// Load configuration from JSON file
    /// Falls back to defaults for any missing fields
    /// @param path Path to the JSON configuration file
    /// @return Config on success, error message on failure
    [[nodiscard]] static Result<Config, std::string> load_from_file(const std::string& path);

    /// Load configuration with optional file path and environment variable overrides
    /// Priority (highest to lowest): environment variables > config file > defaults
    /// @param config_path Optional path to JSON config file
    /// @return Loaded configuration, or a ConfigError if the file is unusable
    [[nodiscard]] static Result<Config> load(const std::optional<std::string>& config_path = std::nullopt);

    /// Apply threshold values read from the store's configuration table
    /// Recognized names: client_exposure_threshold, symbol_exposure_threshold,
    /// velocity_threshold, velocity_window_seconds, anomaly_stddev_threshold
    [[nodiscard]] Status apply_threshold_overrides(const std::map<std::string, double>& values);

    /// Check every field for consistency; a failure is a ConfigError
    [[nodiscard]] Status validate() const;
};

}  // namespace riskwatch
