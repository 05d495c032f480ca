#include "ledger_ngin/transaction_cost/fee_calculator.hpp"

#include <cmath>

namespace ledger_ngin {
namespace transaction_cost {

FeeCalculator::FeeCalculator(FeeConfig config) : config_(std::move(config)) {}

double FeeCalculator::contracts_for(Quantity quantity) {
    return std::abs(quantity) / kSharesPerContract;
}

double FeeCalculator::fee_for(AssetClass asset_class, Quantity quantity) const {
    switch (asset_class) {
        case AssetClass::OPTION:
            return contracts_for(quantity) * config_.per_contract_fee;
        case AssetClass::STOCK:
        case AssetClass::ETF:
        case AssetClass::REIT:
        case AssetClass::CRYPTO:
        case AssetClass::FOREX:
        case AssetClass::UNKNOWN:
        default:
            return 0.0;
    }
}

double FeeCalculator::resolve_fees(const Transaction& transaction) const {
    if (transaction.fees.has_value()) {
        return *transaction.fees;
    }
    switch (transaction.kind) {
        case TransactionKind::BUY:
        case TransactionKind::SELL:
            return fee_for(transaction.asset_class, transaction.quantity);
        case TransactionKind::DIVIDEND:
        case TransactionKind::OPTION_EXPIRED:
        default:
            return 0.0;
    }
}

}  // namespace transaction_cost
}  // namespace ledger_ngin
