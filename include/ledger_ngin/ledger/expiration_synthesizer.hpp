// include/ledger_ngin/ledger/expiration_synthesizer.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "ledger_ngin/core/date.hpp"
#include "ledger_ngin/core/error.hpp"
#include "ledger_ngin/core/types.hpp"
#include "ledger_ngin/ledger/cost_basis_ledger.hpp"

namespace ledger_ngin {

/**
 * @brief Result of one synthesis pass over a single asset's stream
 */
struct SynthesisOutcome {
    std::vector<Transaction> stream;         // Input plus any synthesized event
    std::optional<Transaction> synthesized;  // The inserted option_expired event
    std::optional<std::string> warning;      // Configuration problem, if any
};

/**
 * @brief Turns the passage of time into explicit option_expired events
 *
 * For an option whose expiration date is strictly before `today` and which
 * still has contracts open at the end of the stream, an option_expired
 * transaction for the remaining quantity is inserted at the end of the
 * expiration day. The stream is otherwise returned unchanged.
 */
class ExpirationSynthesizer {
public:
    explicit ExpirationSynthesizer(transaction_cost::FeeCalculator fees = transaction_cost::FeeCalculator(),
                                   LedgerConfig config = LedgerConfig());

    /**
     * @param stream One asset's transactions in ledger order
     * @param today Current calendar date (UTC)
     * @return Outcome, or the ledger's error when the stream is malformed
     */
    Result<SynthesisOutcome> synthesize(const std::vector<Transaction>& stream,
                                        const Date& today) const;

    /**
     * @brief Identifier given to a synthesized expiration
     */
    static std::string synthetic_id(const std::string& asset_id, const Date& expiration);

    static bool is_synthetic(const Transaction& transaction);

private:
    transaction_cost::FeeCalculator fees_;
    LedgerConfig config_;
};

}  // namespace ledger_ngin
