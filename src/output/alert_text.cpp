#include "output/alert_text.hpp"
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace riskwatch::output {

std::string format_money(double amount) {
    std::ostringstream fixed;
    fixed << std::fixed << std::setprecision(2) << std::abs(amount);
    std::string digits = fixed.str();

    auto dot = digits.find('.');
    std::string whole = digits.substr(0, dot);
    std::string fraction = digits.substr(dot);

    std::string grouped;
    grouped.reserve(whole.size() + whole.size() / 3);
    for (std::size_t i = 0; i < whole.size(); ++i) {
        if (i != 0 && (whole.size() - i) % 3 == 0) {
            grouped.push_back(',');
        }
        grouped.push_back(whole[i]);
    }

    std::string result = amount < 0.0 && digits != "0.00" ? "-$" : "$";
    return result + grouped + fraction;
}

std::string format_local_time(WallTime time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string format_alert_subject(const Alert& alert) {
    std::ostringstream oss;
    oss << "Risk Alert: " << to_string(alert.alert_type) << " - " << to_string(alert.severity);
    return oss.str();
}

std::string format_alert_body(const Alert& alert) {
    std::ostringstream oss;
    oss << "RISK ALERT - " << to_string(alert.severity) << "\n"
        << "\n"
        << "Type: " << to_string(alert.alert_type) << "\n"
        << "Entity: " << to_string(alert.entity_type) << " - " << alert.entity_id << "\n"
        << "Time: " << format_local_time(alert.timestamp) << "\n"
        << "\n"
        << alert.message << "\n"
        << "\n"
        << "Threshold: " << format_money(alert.threshold_value) << "\n"
        << "Current Value: " << format_money(alert.current_value);
    return oss.str();
}

}  // namespace riskwatch::output
