// include/ledger_ngin/engine/engine_config.hpp

#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include "ledger_ngin/analytics/aggregation_cache.hpp"
#include "ledger_ngin/analytics/daily_pnl_aggregator.hpp"
#include "ledger_ngin/core/config_base.hpp"
#include "ledger_ngin/core/error.hpp"
#include "ledger_ngin/core/logger.hpp"
#include "ledger_ngin/portfolio/position_reconciler.hpp"
#include "ledger_ngin/transaction_cost/fee_calculator.hpp"

namespace ledger_ngin {

/**
 * @brief Consolidated engine configuration
 *
 * One JSON document with a section per component:
 * {"logging": ..., "fees": ..., "reconciler": ..., "aggregator": ...,
 *  "cache": ..., "strategy_classifier": "null"}
 */
struct EngineConfig : public ConfigBase {
    LoggerConfig logging;
    transaction_cost::FeeConfig fees;
    ReconcilerConfig reconciler;
    AggregatorConfig aggregator;
    CacheConfig cache;
    std::string strategy_classifier{"null"};

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Loads an EngineConfig from a defaults file plus optional overrides
 *
 * Values in the overrides file replace defaults key by key, recursing into
 * nested objects.
 */
class EngineConfigLoader {
public:
    static Result<EngineConfig> load(const std::filesystem::path& defaults_path,
                                     const std::filesystem::path& overrides_path = {});

    static void merge_json(nlohmann::json& target, const nlohmann::json& source);

private:
    static Result<nlohmann::json> load_json_file(const std::filesystem::path& file_path);
};

}  // namespace ledger_ngin
