#include "output/json_formatter.hpp"
#include "output/alert_text.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace riskwatch::output {

std::string JsonFormatter::serialize(const nlohmann::json& message) {
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json JsonFormatter::format_alert(const Alert& alert) {
    return nlohmann::json{
        {"type", "alert"},
        {"id", alert.id},
        {"timestamp", iso_timestamp(alert.timestamp)},
        {"alertType", std::string(to_string(alert.alert_type))},
        {"severity", std::string(to_string(alert.severity))},
        {"entityType", std::string(to_string(alert.entity_type))},
        {"entityId", alert.entity_id},
        {"message", alert.message},
        {"thresholdValue", alert.threshold_value},
        {"currentValue", alert.current_value}
    };
}

nlohmann::json JsonFormatter::format_metrics(const RiskMetricsSnapshot& snapshot) {
    return nlohmann::json{
        {"type", "metrics"},
        {"timestamp", iso_timestamp(snapshot.timestamp)},
        {"totalTransactions", snapshot.total_transactions},
        {"totalExposure", snapshot.total_exposure},
        {"activeClients", snapshot.active_clients},
        {"activeSymbols", snapshot.active_symbols},
        {"highRiskClients", snapshot.high_risk_clients},
        {"highRiskSymbols", snapshot.high_risk_symbols},
        {"alertsGenerated", snapshot.alerts_generated}
    };
}

nlohmann::json JsonFormatter::format_exposures(
    const std::vector<ClientExposure>& clients,
    const std::vector<SymbolExposure>& symbols
) {
    auto client_list = nlohmann::json::array();
    for (const auto& c : clients) {
        client_list.push_back({
            {"clientId", c.client_id},
            {"totalExposure", c.total_exposure},
            {"positionCount", c.position_count},
            {"riskLevel", std::string(to_string(c.risk_level))},
            {"lastUpdated", iso_timestamp(c.last_updated)}
        });
    }

    auto symbol_list = nlohmann::json::array();
    for (const auto& s : symbols) {
        symbol_list.push_back({
            {"symbol", s.symbol},
            {"totalExposure", s.total_exposure},
            {"transactionCount", s.transaction_count},
            {"riskLevel", std::string(to_string(s.risk_level))},
            {"lastUpdated", iso_timestamp(s.last_updated)}
        });
    }

    return nlohmann::json{
        {"type", "exposures"},
        {"timestamp", iso_timestamp()},
        {"clients", std::move(client_list)},
        {"symbols", std::move(symbol_list)}
    };
}

nlohmann::json JsonFormatter::format_webhook_payload(const Alert& alert, WallTime sent_at) {
    std::string entity = std::string(to_string(alert.entity_type)) + ": " + alert.entity_id;
    std::string title = std::string(to_string(alert.alert_type)) + " - " +
                        std::string(to_string(alert.severity));

    return nlohmann::json{
        {"attachments", nlohmann::json::array({
            {
                {"color", severity_color(alert.severity)},
                {"title", title},
                {"text", alert.message},
                {"fields", nlohmann::json::array({
                    {{"title", "Entity"}, {"value", entity}, {"short", true}},
                    {{"title", "Threshold"}, {"value", format_money(alert.threshold_value)}, {"short", true}},
                    {{"title", "Current Value"}, {"value", format_money(alert.current_value)}, {"short", true}}
                })},
                {"footer", "Risk Alert System"},
                {"ts", std::chrono::duration_cast<std::chrono::seconds>(
                           sent_at.time_since_epoch()).count()}
            }
        })}
    };
}

const char* JsonFormatter::severity_color(Severity severity) noexcept {
    switch (severity) {
        case Severity::Low:      return "#36a64f";
        case Severity::Medium:   return "#ff9900";
        case Severity::High:     return "#ff6600";
        case Severity::Critical: return "#ff0000";
    }
    return "#808080";
}

std::string JsonFormatter::iso_timestamp(WallTime time) {
    auto time_t_value = std::chrono::system_clock::to_time_t(time);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()
    ) % 1000;

    std::tm tm{};
    gmtime_r(&time_t_value, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::string JsonFormatter::iso_timestamp() {
    return iso_timestamp(std::chrono::system_clock::now());
}

}  // namespace riskwatch::output
