// include/ledger_ngin/ledger/asset_streams.hpp
#pragma once

#include <string>
#include <vector>
#include "ledger_ngin/core/date.hpp"
#include "ledger_ngin/core/error.hpp"
#include "ledger_ngin/core/types.hpp"
#include "ledger_ngin/ledger/expiration_synthesizer.hpp"
#include "ledger_ngin/ledger/strategy_classifier.hpp"

namespace ledger_ngin {

/**
 * @brief One asset's transactions in ledger order
 */
struct AssetStream {
    std::string asset_id;
    std::vector<Transaction> transactions;
};

/**
 * @brief Portfolio history split per asset and ready for ledger passes
 */
struct PreparedStreams {
    std::vector<AssetStream> streams;
    std::vector<Transaction> synthesized_expirations;
    std::vector<std::string> warnings;
    size_t classified_count{0};
    size_t transaction_count{0};
};

/**
 * @brief Group by asset in first-appearance order, stable-sorting each
 * stream by occurred_at (same-instant transactions keep caller order)
 */
std::vector<AssetStream> group_by_asset(const std::vector<Transaction>& transactions);

/**
 * @brief Validate, classify, group and (optionally) auto-expire a history
 *
 * @param transactions Raw portfolio history
 * @param classifier Fills untagged strategy tags
 * @param synthesizer When non-null, expired options get an option_expired event
 * @param today Date used to decide whether an option has expired
 * @return Prepared streams, or INVALID_ARGUMENT for the first malformed transaction
 */
Result<PreparedStreams> prepare_asset_streams(const std::vector<Transaction>& transactions,
                                              const StrategyClassifier& classifier,
                                              const ExpirationSynthesizer* synthesizer,
                                              const Date& today);

}  // namespace ledger_ngin
