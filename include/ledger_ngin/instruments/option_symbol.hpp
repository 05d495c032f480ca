// include/ledger_ngin/instruments/option_symbol.hpp
#pragma once

#include <string>
#include "ledger_ngin/core/date.hpp"
#include "ledger_ngin/core/error.hpp"

namespace ledger_ngin {

enum class OptionType { CALL, PUT };

inline std::string option_type_to_string(OptionType type) {
    return type == OptionType::CALL ? "CALL" : "PUT";
}

/**
 * @brief Contract terms encoded in an option symbol
 */
struct OptionContract {
    std::string underlying;  // Underlying equity symbol
    Date expiration;         // Last trading day
    double strike{0.0};      // Strike price
    OptionType type{OptionType::CALL};

    /**
     * @brief Human readable name, e.g. "AAPL Jan 17 2025 $150 CALL"
     */
    std::string describe() const;

    /**
     * @brief True once the calendar has moved past the expiration date
     */
    bool is_expired_on(const Date& today) const {
        return expiration < today;
    }
};

/**
 * @brief Parse an OCC-style option symbol
 *
 * Format: UNDERLYING (1-6 letters) + YYMMDD + C|P + 8-digit strike in
 * thousandths of a dollar, e.g. AAPL250117C00150000. Two-digit years map
 * to 20YY.
 *
 * @return The decoded contract, or CONFIGURATION_ERROR when the symbol
 * does not follow the format or encodes an impossible date
 */
Result<OptionContract> parse_option_symbol(const std::string& symbol);

/**
 * @brief Encode a contract back into its OCC-style symbol
 */
std::string format_option_symbol(const OptionContract& contract);

}  // namespace ledger_ngin
