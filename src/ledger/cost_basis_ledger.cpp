#include "ledger_ngin/ledger/cost_basis_ledger.hpp"

#include <algorithm>
#include <cmath>
#include "ledger_ngin/core/date.hpp"
#include "ledger_ngin/core/logger.hpp"
#include "ledger_ngin/core/time_utils.hpp"

namespace ledger_ngin {

namespace {

// FIFO consumption of one side of the queue; lots of the other side keep
// their place. Returns the summed unit_cost * matched quantity.
template <typename LotT>
double consume_fifo(std::deque<Lot>& lots, Quantity quantity, double epsilon) {
    double basis = 0.0;
    Quantity remaining = quantity;
    for (auto it = lots.begin(); it != lots.end() && remaining > epsilon;) {
        auto* lot = std::get_if<LotT>(&*it);
        if (lot == nullptr) {
            ++it;
            continue;
        }
        const Quantity matched = std::min(lot->remaining_quantity, remaining);
        basis += matched * lot->unit_cost;
        lot->remaining_quantity -= matched;
        remaining -= matched;

        TRACE("Matched " << matched << " @ " << lot->unit_cost << " against lot from "
                         << lot->originating_transaction_id);

        if (lot->remaining_quantity <= epsilon) {
            it = lots.erase(it);
        } else {
            ++it;
        }
    }
    return basis;
}

template <typename LotT>
Quantity open_quantity(const std::deque<Lot>& lots) {
    Quantity total = 0.0;
    for (const auto& lot : lots) {
        if (const auto* side = std::get_if<LotT>(&lot)) {
            total += side->remaining_quantity;
        }
    }
    return total;
}

}  // namespace

Quantity signed_quantity(const Lot& lot) {
    if (const auto* long_lot = std::get_if<LongLot>(&lot)) {
        return long_lot->remaining_quantity;
    }
    return -std::get<ShortLot>(lot).remaining_quantity;
}

nlohmann::json orphan_to_json(const OrphanTransaction& orphan) {
    nlohmann::json j;
    j["transaction_id"] = orphan.transaction_id;
    j["portfolio_id"] = orphan.portfolio_id;
    j["asset_id"] = orphan.asset_id;
    j["symbol"] = orphan.symbol;
    j["kind"] = transaction_kind_to_string(orphan.kind);
    j["occurred_at"] = core::format_timestamp(orphan.occurred_at, "%Y-%m-%dT%H:%M:%SZ");
    j["requested_quantity"] = orphan.requested_quantity;
    j["available_quantity"] = orphan.available_quantity;
    j["reason"] = orphan.reason;
    return j;
}

CostBasisLedger::CostBasisLedger(transaction_cost::FeeCalculator fees, LedgerConfig config,
                                 std::deque<Lot> seed)
    : fees_(std::move(fees)), config_(std::move(config)), lots_(std::move(seed)) {}

Result<void> CostBasisLedger::validate(const Transaction& transaction) {
    const std::string context = " (transaction " + transaction.id + ")";
    if (transaction.symbol.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Transaction has no symbol" + context,
                                "CostBasisLedger");
    }
    if (transaction.asset_id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Transaction has no asset id" + context, "CostBasisLedger");
    }
    if (transaction.asset_class == AssetClass::UNKNOWN) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Transaction for " + transaction.symbol + " has no asset class" +
                                    context,
                                "CostBasisLedger");
    }
    if (!std::isfinite(transaction.quantity) || transaction.quantity <= 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Quantity must be positive for " + transaction.symbol + context,
                                "CostBasisLedger");
    }
    if (!std::isfinite(transaction.price) || transaction.price < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Price must be finite and non-negative for " +
                                    transaction.symbol + context,
                                "CostBasisLedger");
    }
    if (transaction.fees.has_value() && !std::isfinite(*transaction.fees)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Fees must be finite for " + transaction.symbol + context,
                                "CostBasisLedger");
    }
    return Result<void>();
}

Result<TransactionEffect> CostBasisLedger::apply(const Transaction& transaction) {
    auto valid = validate(transaction);
    if (valid.is_error()) {
        return forward_error<TransactionEffect>(*valid.error());
    }

    if (asset_id_.empty()) {
        asset_id_ = transaction.asset_id;
        symbol_ = transaction.symbol;
        asset_class_ = transaction.asset_class;
    } else if (transaction.asset_id != asset_id_) {
        return make_error<TransactionEffect>(
            ErrorCode::INVALID_ARGUMENT,
            "Transaction " + transaction.id + " for asset " + transaction.asset_id +
                " applied to ledger of asset " + asset_id_,
            "CostBasisLedger");
    }

    const double fees = fees_.resolve_fees(transaction);

    TransactionEffect effect;
    switch (transaction.kind) {
        case TransactionKind::BUY:
            effect = apply_buy(transaction, fees);
            break;
        case TransactionKind::SELL:
            effect = apply_sell(transaction, fees);
            break;
        case TransactionKind::DIVIDEND:
            effect = apply_dividend(transaction, fees);
            break;
        case TransactionKind::OPTION_EXPIRED:
            effect = apply_expiration(transaction, fees);
            break;
    }

    realized_pnl_ += effect.realized_pnl;
    processed_count_++;
    last_activity_ = transaction.occurred_at;
    return Result<TransactionEffect>(effect);
}

Result<void> CostBasisLedger::apply_all(const std::vector<Transaction>& transactions) {
    for (const auto& transaction : transactions) {
        auto result = apply(transaction);
        if (result.is_error()) {
            return forward_error<void>(*result.error());
        }
    }
    return Result<void>();
}

Result<LedgerSnapshot> CostBasisLedger::run(const std::vector<Transaction>& transactions,
                                            transaction_cost::FeeCalculator fees,
                                            std::deque<Lot> seed, LedgerConfig config) {
    CostBasisLedger ledger(std::move(fees), std::move(config), std::move(seed));
    auto applied = ledger.apply_all(transactions);
    if (applied.is_error()) {
        return forward_error<LedgerSnapshot>(*applied.error());
    }
    return Result<LedgerSnapshot>(ledger.snapshot());
}

bool CostBasisLedger::is_short_cover(const Transaction& transaction) const {
    if (!transaction.is_option() || !is_net_short()) {
        return false;
    }
    return transaction.has_tag(kCoveredCallTag) || config_.close_short_on_untagged_buy;
}

TransactionEffect CostBasisLedger::apply_buy(const Transaction& transaction, double fees) {
    TransactionEffect effect;
    effect.fees = fees;
    effect.trade_volume = transaction.quantity * transaction.price;
    effect.cash_flow = -(transaction.quantity * transaction.price + fees);
    effect.realized_pnl = -fees;

    Quantity to_open = transaction.quantity;

    if (is_short_cover(transaction)) {
        const Quantity covered = std::min(transaction.quantity, short_quantity());
        consume_fifo<ShortLot>(lots_, covered, config_.quantity_epsilon);

        // Premium was recognized when the short was opened; the buyback is a loss
        const double payment = covered * transaction.price;
        effect.realized_pnl -= payment;
        to_open = transaction.quantity - covered;

        DEBUG("Buy to close " << symbol_ << ": covered=" << covered << " payment=" << payment
                              << " transaction_id=" << transaction.id);
    }

    if (to_open > config_.quantity_epsilon) {
        lots_.push_back(LongLot{to_open, transaction.price, transaction.id});
    }
    return effect;
}

TransactionEffect CostBasisLedger::apply_sell(const Transaction& transaction, double fees) {
    const Quantity available = long_quantity();
    const Quantity requested = transaction.quantity;
    const bool covered_by_longs = available + config_.quantity_epsilon >= requested;

    if (!covered_by_longs && !transaction.is_option()) {
        return quarantine(transaction, available, "sell exceeds open long quantity");
    }

    TransactionEffect effect;
    effect.fees = fees;
    effect.trade_volume = requested * transaction.price;
    effect.cash_flow = requested * transaction.price - fees;

    const Quantity matched = std::min(requested, available);
    const double basis = consume_fifo<LongLot>(lots_, matched, config_.quantity_epsilon);
    effect.realized_pnl = matched * transaction.price - basis - fees;

    if (!covered_by_longs) {
        // Sell to open: premium is profit now, matched later only by buyback or expiry
        const Quantity written = requested - matched;
        lots_.push_back(ShortLot{written, transaction.price, transaction.id});
        effect.realized_pnl += written * transaction.price;

        DEBUG("Sell to open " << symbol_ << ": written=" << written
                              << " premium=" << written * transaction.price
                              << " transaction_id=" << transaction.id);
    }
    return effect;
}

TransactionEffect CostBasisLedger::apply_dividend(const Transaction& transaction, double fees) {
    TransactionEffect effect;
    const double amount = transaction.quantity * transaction.price;
    effect.dividend_income = amount;
    effect.fees = fees;
    effect.cash_flow = amount - fees;
    effect.realized_pnl = amount - fees;
    return effect;
}

TransactionEffect CostBasisLedger::apply_expiration(const Transaction& transaction, double fees) {
    if (!transaction.is_option()) {
        return quarantine(transaction, net_quantity(), "expiration recorded for a non-option asset");
    }

    const Quantity long_open = long_quantity();
    const Quantity short_open = short_quantity();
    if (long_open <= config_.quantity_epsilon && short_open <= config_.quantity_epsilon) {
        return quarantine(transaction, 0.0, "expiration with no open contracts");
    }

    TransactionEffect effect;
    effect.fees = fees;
    effect.cash_flow = -fees;

    // Long contracts expire worthless: their whole cost is lost
    const double lost_cost = consume_fifo<LongLot>(
        lots_, std::min(transaction.quantity, long_open), config_.quantity_epsilon);
    // Written contracts lapse: premium was already recognized at sale
    consume_fifo<ShortLot>(lots_, std::min(transaction.quantity, short_open),
                           config_.quantity_epsilon);

    effect.realized_pnl = -lost_cost - fees;

    const Quantity open = std::max(long_open, short_open);
    if (transaction.quantity > open + config_.quantity_epsilon) {
        WARN("Expiration quantity exceeds open contracts: symbol="
             << symbol_ << " expected=" << open << " actual=" << transaction.quantity
             << " transaction_id=" << transaction.id);
    }
    return effect;
}

TransactionEffect CostBasisLedger::quarantine(const Transaction& transaction, Quantity available,
                                              const std::string& reason) {
    OrphanTransaction orphan;
    orphan.transaction_id = transaction.id;
    orphan.portfolio_id = transaction.portfolio_id;
    orphan.asset_id = transaction.asset_id;
    orphan.symbol = transaction.symbol;
    orphan.kind = transaction.kind;
    orphan.occurred_at = transaction.occurred_at;
    orphan.requested_quantity = transaction.quantity;
    orphan.available_quantity = available;
    orphan.reason = reason;
    orphans_.push_back(orphan);

    WARN("Orphan transaction quarantined: symbol="
         << transaction.symbol << " kind=" << transaction_kind_to_string(transaction.kind)
         << " requested=" << transaction.quantity << " available=" << available
         << " transaction_id=" << transaction.id
         << " date=" << to_string(date_from_timestamp(transaction.occurred_at))
         << " reason=" << reason);

    TransactionEffect effect;
    effect.orphaned = true;
    return effect;
}

Quantity CostBasisLedger::long_quantity() const {
    return open_quantity<LongLot>(lots_);
}

Quantity CostBasisLedger::short_quantity() const {
    return open_quantity<ShortLot>(lots_);
}

Quantity CostBasisLedger::net_quantity() const {
    Quantity net = 0.0;
    for (const auto& lot : lots_) {
        net += signed_quantity(lot);
    }
    return net;
}

double CostBasisLedger::total_cost_basis() const {
    double total = 0.0;
    for (const auto& lot : lots_) {
        if (const auto* long_lot = std::get_if<LongLot>(&lot)) {
            total += long_lot->remaining_quantity * long_lot->unit_cost;
        } else {
            const auto& short_lot = std::get<ShortLot>(lot);
            total -= short_lot.remaining_quantity * short_lot.unit_cost;
        }
    }
    return total;
}

Price CostBasisLedger::average_cost() const {
    const Quantity net = net_quantity();
    if (std::abs(net) <= config_.quantity_epsilon) {
        return 0.0;
    }
    return total_cost_basis() / net;
}

LedgerSnapshot CostBasisLedger::snapshot() const {
    LedgerSnapshot snapshot;
    snapshot.asset_id = asset_id_;
    snapshot.symbol = symbol_;
    snapshot.asset_class = asset_class_;
    snapshot.open_lots = lots_;
    snapshot.net_quantity = net_quantity();
    snapshot.realized_pnl = realized_pnl_;
    snapshot.total_cost_basis = total_cost_basis();
    snapshot.average_cost = average_cost();
    snapshot.orphans = orphans_;
    snapshot.processed_count = processed_count_;
    snapshot.last_activity = last_activity_;
    return snapshot;
}

}  // namespace ledger_ngin
