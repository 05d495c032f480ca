#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include "ledger_ngin/core/config_base.hpp"
#include "ledger_ngin/core/types.hpp"

namespace ledger_ngin {
namespace transaction_cost {

/**
 * @brief Configuration for explicit transaction fees
 */
struct FeeConfig : public ConfigBase {
    // Brokerage fee per option contract
    double per_contract_fee{0.75};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["per_contract_fee"] = per_contract_fee;
        j["version"] = version;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("per_contract_fee"))
            per_contract_fee = j.at("per_contract_fee").get<double>();
        if (j.contains("version"))
            version = j.at("version").get<std::string>();
    }
};

/**
 * @brief Maps (asset class, quantity) to an explicit transaction fee
 *
 * Equities, ETFs, REITs, crypto and forex trade commission free. Options
 * pay per contract, and callers pass share-denominated quantities, so the
 * quantity is converted to contracts first:
 *
 *   fee = (quantity / 100) * per_contract_fee
 */
class FeeCalculator {
public:
    explicit FeeCalculator(FeeConfig config = FeeConfig());

    /**
     * @brief Fee for a trade
     * @param asset_class Asset class of the instrument
     * @param quantity Share-denominated quantity (sign ignored)
     * @return Fee in account currency, never negative
     */
    double fee_for(AssetClass asset_class, Quantity quantity) const;

    /**
     * @brief Fees to book for a transaction
     * @return Reported fees when present, otherwise fee_for() of the trade.
     * Dividends and expirations never carry an implied fee.
     */
    double resolve_fees(const Transaction& transaction) const;

    /**
     * @brief Number of option contracts a share quantity represents
     */
    static double contracts_for(Quantity quantity);

    const FeeConfig& config() const {
        return config_;
    }

private:
    FeeConfig config_;
};

}  // namespace transaction_cost
}  // namespace ledger_ngin
