// include/ledger_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace ledger_ngin {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Quantity type for lot and position sizes
 * Double to support fractional crypto quantities. Option quantities are
 * share-denominated (one contract = 100 shares).
 */
using Quantity = double;

/**
 * @brief Quantities whose magnitude is below this are treated as zero
 */
constexpr Quantity kQuantityEpsilon = 1e-9;

/**
 * @brief Underlying shares represented by one option contract
 */
constexpr double kSharesPerContract = 100.0;

/**
 * @brief Asset class of a ledger entry
 */
enum class AssetClass { STOCK, ETF, REIT, CRYPTO, FOREX, OPTION, UNKNOWN };

/**
 * @brief Ledger transaction kind
 */
enum class TransactionKind { BUY, SELL, DIVIDEND, OPTION_EXPIRED };

inline std::string asset_class_to_string(AssetClass asset_class) {
    switch (asset_class) {
        case AssetClass::STOCK:
            return "stock";
        case AssetClass::ETF:
            return "etf";
        case AssetClass::REIT:
            return "reit";
        case AssetClass::CRYPTO:
            return "crypto";
        case AssetClass::FOREX:
            return "forex";
        case AssetClass::OPTION:
            return "option";
        default:
            return "unknown";
    }
}

inline AssetClass asset_class_from_string(const std::string& value) {
    if (value == "stock")
        return AssetClass::STOCK;
    if (value == "etf")
        return AssetClass::ETF;
    if (value == "reit")
        return AssetClass::REIT;
    if (value == "crypto")
        return AssetClass::CRYPTO;
    if (value == "forex")
        return AssetClass::FOREX;
    if (value == "option")
        return AssetClass::OPTION;
    return AssetClass::UNKNOWN;
}

inline std::string transaction_kind_to_string(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::BUY:
            return "buy";
        case TransactionKind::SELL:
            return "sell";
        case TransactionKind::DIVIDEND:
            return "dividend";
        case TransactionKind::OPTION_EXPIRED:
            return "option_expired";
        default:
            return "unknown";
    }
}

/**
 * @brief Strategy tag carried by covered-call legs (sell to open and buy to close)
 */
inline const std::string kCoveredCallTag = "covered_call";

/**
 * @brief Immutable ledger record
 */
struct Transaction {
    std::string id;
    std::string portfolio_id;
    std::string asset_id;
    std::string symbol;
    AssetClass asset_class{AssetClass::UNKNOWN};
    TransactionKind kind{TransactionKind::BUY};
    Quantity quantity{0.0};  // Positive magnitude
    Price price{0.0};
    std::optional<double> fees;  // Empty when the source did not report fees
    std::string currency{"USD"};
    Timestamp occurred_at;
    std::optional<std::string> strategy_tag;

    bool is_option() const {
        return asset_class == AssetClass::OPTION;
    }

    bool has_tag(const std::string& tag) const {
        return strategy_tag.has_value() && *strategy_tag == tag;
    }
};

/**
 * @brief Derived holding for one asset in one portfolio
 */
struct Position {
    std::string portfolio_id;
    std::string asset_id;
    std::string symbol;
    AssetClass asset_class{AssetClass::UNKNOWN};
    Quantity quantity{0.0};  // Negative means net short (options only)
    Price average_cost_basis{0.0};
    double total_cost_basis{0.0};
    double realized_pnl{0.0};
    size_t open_lot_count{0};
    bool is_active{false};
    Timestamp last_update;

    bool has_position() const {
        return quantity > kQuantityEpsilon || quantity < -kQuantityEpsilon;
    }

    bool operator==(const Position& other) const {
        return portfolio_id == other.portfolio_id && asset_id == other.asset_id &&
               symbol == other.symbol && asset_class == other.asset_class &&
               quantity == other.quantity && average_cost_basis == other.average_cost_basis &&
               total_cost_basis == other.total_cost_basis &&
               realized_pnl == other.realized_pnl && open_lot_count == other.open_lot_count &&
               is_active == other.is_active && last_update == other.last_update;
    }

    bool operator!=(const Position& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Transaction that could not be matched against known lots
 * Kept for operator diagnostics, excluded from every monetary total.
 */
struct OrphanTransaction {
    std::string transaction_id;
    std::string portfolio_id;
    std::string asset_id;
    std::string symbol;
    TransactionKind kind{TransactionKind::SELL};
    Timestamp occurred_at;
    Quantity requested_quantity{0.0};
    Quantity available_quantity{0.0};
    std::string reason;
};

}  // namespace ledger_ngin
