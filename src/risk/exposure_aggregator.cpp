#include "risk/exposure_aggregator.hpp"

namespace riskwatch {

RiskLevel classify_risk(double exposure, double threshold, const RiskBands& bands) noexcept {
    if (threshold <= 0.0) {
        return RiskLevel::Critical;
    }

    double ratio = exposure / threshold;
    if (ratio >= bands.critical) {
        return RiskLevel::Critical;
    }
    if (ratio >= bands.high) {
        return RiskLevel::High;
    }
    if (ratio >= bands.medium) {
        return RiskLevel::Medium;
    }
    return RiskLevel::Low;
}

ExposureAggregator::ExposureAggregator(const Config::Thresholds& thresholds)
    : thresholds_(thresholds)
    , bands_(RiskBands::from(thresholds))
    , clients_([](const std::string& id) {
        ClientExposure exposure;
        exposure.client_id = id;
        return exposure;
    })
    , symbols_([](const std::string& id) {
        SymbolExposure exposure;
        exposure.symbol = id;
        return exposure;
    })
{}

std::optional<ExposureUpdate> ExposureAggregator::apply(const Transaction& txn) {
    ExposureUpdate update;
    const FeedMarker marker = txn.marker();
    const double client_limit = client_threshold(txn.client_id);

    bool fresh = clients_.with_entry(txn.client_id, [&](ClientExposure& exposure) {
        if (marker <= exposure.last_applied) {
            return false;
        }
        update.client_previous = exposure.risk_level;
        exposure.total_exposure += txn.total_value;
        exposure.position_count += 1;
        exposure.risk_level = classify_risk(exposure.total_exposure, client_limit, bands_);
        exposure.last_updated = txn.timestamp;
        exposure.last_applied = marker;
        update.client = exposure;
        return true;
    });

    if (!fresh) {
        return std::nullopt;
    }

    const double symbol_limit = symbol_threshold(txn.symbol);
    symbols_.with_entry(txn.symbol, [&](SymbolExposure& exposure) {
        update.symbol_previous = exposure.risk_level;
        exposure.total_exposure += txn.total_value;
        exposure.transaction_count += 1;
        exposure.risk_level = classify_risk(exposure.total_exposure, symbol_limit, bands_);
        exposure.last_updated = txn.timestamp;
        update.symbol = exposure;
    });

    return update;
}

std::optional<ClientExposure> ExposureAggregator::client(const ClientId& client_id) const {
    return clients_.find(client_id);
}

std::optional<SymbolExposure> ExposureAggregator::symbol(const Symbol& symbol) const {
    return symbols_.find(symbol);
}

std::vector<ClientExposure> ExposureAggregator::clients() const {
    std::vector<ClientExposure> result;
    result.reserve(clients_.size());
    clients_.for_each([&result](const std::string&, const ClientExposure& exposure) {
        result.push_back(exposure);
    });
    return result;
}

std::vector<SymbolExposure> ExposureAggregator::symbols() const {
    std::vector<SymbolExposure> result;
    result.reserve(symbols_.size());
    symbols_.for_each([&result](const std::string&, const SymbolExposure& exposure) {
        result.push_back(exposure);
    });
    return result;
}

ExposureSummary ExposureAggregator::summary() const {
    ExposureSummary summary;

    clients_.for_each([&summary](const std::string&, const ClientExposure& exposure) {
        summary.total_transactions += exposure.position_count;
        summary.total_exposure += exposure.total_exposure;
        if (exposure.total_exposure > 0.0) {
            ++summary.active_clients;
        }
        if (exposure.risk_level >= RiskLevel::High) {
            ++summary.high_risk_clients;
        }
    });

    symbols_.for_each([&summary](const std::string&, const SymbolExposure& exposure) {
        if (exposure.total_exposure > 0.0) {
            ++summary.active_symbols;
        }
        if (exposure.risk_level >= RiskLevel::High) {
            ++summary.high_risk_symbols;
        }
    });

    return summary;
}

void ExposureAggregator::hydrate(const std::vector<ClientExposure>& clients,
                                 const std::vector<SymbolExposure>& symbols) {
    for (ClientExposure exposure : clients) {
        exposure.risk_level = classify_risk(
            exposure.total_exposure, client_threshold(exposure.client_id), bands_);
        clients_.insert_or_assign(exposure.client_id, exposure);
    }
    for (SymbolExposure exposure : symbols) {
        exposure.risk_level = classify_risk(
            exposure.total_exposure, symbol_threshold(exposure.symbol), bands_);
        symbols_.insert_or_assign(exposure.symbol, exposure);
    }
}

double ExposureAggregator::client_threshold(const ClientId& client_id) const {
    return thresholds_.client_threshold(client_id);
}

double ExposureAggregator::symbol_threshold(const Symbol& symbol) const {
    return thresholds_.symbol_threshold(symbol);
}

}  // namespace riskwatch
