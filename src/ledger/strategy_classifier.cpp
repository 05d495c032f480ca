#include "ledger_ngin/ledger/strategy_classifier.hpp"

#include "ledger_ngin/core/date.hpp"
#include "ledger_ngin/core/logger.hpp"
#include "ledger_ngin/instruments/option_symbol.hpp"

namespace ledger_ngin {

namespace {

std::optional<OptionContract> call_contract(const Transaction& transaction) {
    if (!transaction.is_option()) {
        return std::nullopt;
    }
    auto parsed = parse_option_symbol(transaction.symbol);
    if (parsed.is_error() || parsed.value().type != OptionType::CALL) {
        return std::nullopt;
    }
    return parsed.value();
}

}  // namespace

Quantity UnderlyingOwnershipClassifier::shares_held_at_end_of_day(
    const std::string& underlying, const Transaction& transaction,
    const std::vector<Transaction>& history) {
    const Timestamp cutoff = end_of_day(date_from_timestamp(transaction.occurred_at));

    Quantity held = 0.0;
    for (const auto& entry : history) {
        if (entry.is_option() || entry.symbol != underlying || entry.occurred_at > cutoff) {
            continue;
        }
        if (entry.kind == TransactionKind::BUY) {
            held += entry.quantity;
        } else if (entry.kind == TransactionKind::SELL) {
            held -= entry.quantity;
        }
    }
    return held;
}

bool UnderlyingOwnershipClassifier::is_covered_sell(const Transaction& sell,
                                                    const std::vector<Transaction>& history) const {
    if (sell.has_tag(kCoveredCallTag)) {
        return true;
    }
    if (sell.strategy_tag.has_value() || sell.kind != TransactionKind::SELL) {
        return false;
    }
    auto contract = call_contract(sell);
    if (!contract) {
        return false;
    }
    return shares_held_at_end_of_day(contract->underlying, sell, history) + kQuantityEpsilon >=
           sell.quantity;
}

std::optional<std::string> UnderlyingOwnershipClassifier::classify(
    const Transaction& transaction, const std::vector<Transaction>& history) const {
    if (!call_contract(transaction)) {
        return std::nullopt;
    }

    if (transaction.kind == TransactionKind::SELL) {
        if (is_covered_sell(transaction, history)) {
            return kCoveredCallTag;
        }
        return std::nullopt;
    }

    if (transaction.kind == TransactionKind::BUY) {
        for (const auto& entry : history) {
            if (&entry == &transaction || entry.occurred_at > transaction.occurred_at) {
                break;
            }
            if (entry.asset_id == transaction.asset_id && entry.kind == TransactionKind::SELL &&
                is_covered_sell(entry, history)) {
                return kCoveredCallTag;
            }
        }
    }
    return std::nullopt;
}

std::vector<Transaction> apply_strategy_classifier(const StrategyClassifier& classifier,
                                                   const std::vector<Transaction>& history,
                                                   size_t* tagged_count) {
    std::vector<Transaction> classified = history;
    size_t tagged = 0;
    for (size_t i = 0; i < history.size(); ++i) {
        if (history[i].strategy_tag.has_value()) {
            continue;
        }
        auto tag = classifier.classify(history[i], history);
        if (tag) {
            classified[i].strategy_tag = *tag;
            tagged++;
            DEBUG("Classifier " << classifier.name() << " tagged transaction "
                                << history[i].id << " (" << history[i].symbol << ") as "
                                << *tag);
        }
    }
    if (tagged_count != nullptr) {
        *tagged_count = tagged;
    }
    return classified;
}

Result<std::shared_ptr<const StrategyClassifier>> make_strategy_classifier(
    const std::string& name) {
    if (name.empty() || name == "null") {
        return std::shared_ptr<const StrategyClassifier>(
            std::make_shared<NullStrategyClassifier>());
    }
    if (name == "underlying_ownership") {
        return std::shared_ptr<const StrategyClassifier>(
            std::make_shared<UnderlyingOwnershipClassifier>());
    }
    return make_error<std::shared_ptr<const StrategyClassifier>>(
        ErrorCode::CONFIGURATION_ERROR, "Unknown strategy classifier: " + name,
        "StrategyClassifier");
}

}  // namespace ledger_ngin
