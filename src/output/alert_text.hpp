#pragma once

#include "core/records.hpp"
#include <string>

namespace riskwatch::output {

/// "$1,234,567.89": dollar sign, thousands separators, two decimals
[[nodiscard]] std::string format_money(double amount);

/// Local "YYYY-MM-DD HH:MM:SS" rendering of a wall time
[[nodiscard]] std::string format_local_time(WallTime time);

/// Subject line for alert e-mails
[[nodiscard]] std::string format_alert_subject(const Alert& alert);

/// Plain-text body shared by the e-mail channel and the CLI
[[nodiscard]] std::string format_alert_body(const Alert& alert);

}  // namespace riskwatch::output
