#pragma once

#include "core/records.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace riskwatch::output {

/// Formats engine state as JSON for the WebSocket server and the webhook
class JsonFormatter {
public:
    /// Alert broadcast: {"type":"alert", ...}
    [[nodiscard]] static nlohmann::json format_alert(const Alert& alert);

    /// Metrics snapshot broadcast: {"type":"metrics", ...}
    [[nodiscard]] static nlohmann::json format_metrics(const RiskMetricsSnapshot& snapshot);

    /// Current exposure sets: {"type":"exposures", "clients":[...], "symbols":[...]}
    [[nodiscard]] static nlohmann::json format_exposures(
        const std::vector<ClientExposure>& clients,
        const std::vector<SymbolExposure>& symbols
    );

    /// Chat webhook body with one colour-coded attachment
    [[nodiscard]] static nlohmann::json format_webhook_payload(const Alert& alert, WallTime sent_at);

    /// Compact wire form; invalid UTF-8 in ids or messages becomes U+FFFD
    /// instead of throwing
    [[nodiscard]] static std::string serialize(const nlohmann::json& message);

    /// Attachment colour for a severity
    [[nodiscard]] static const char* severity_color(Severity severity) noexcept;

    /// ISO8601 UTC timestamp with milliseconds
    [[nodiscard]] static std::string iso_timestamp(WallTime time);

    /// Current ISO8601 timestamp string
    [[nodiscard]] static std::string iso_timestamp();
};

}  // namespace riskwatch::output
