#include "ledger_ngin/ledger/expiration_synthesizer.hpp"

#include <algorithm>
#include "ledger_ngin/core/logger.hpp"
#include "ledger_ngin/instruments/option_symbol.hpp"

namespace ledger_ngin {

namespace {
const std::string kSyntheticPrefix = "auto-expire:";
}

ExpirationSynthesizer::ExpirationSynthesizer(transaction_cost::FeeCalculator fees,
                                             LedgerConfig config)
    : fees_(std::move(fees)), config_(std::move(config)) {}

std::string ExpirationSynthesizer::synthetic_id(const std::string& asset_id,
                                                const Date& expiration) {
    return kSyntheticPrefix + asset_id + ":" + to_string(expiration);
}

bool ExpirationSynthesizer::is_synthetic(const Transaction& transaction) {
    return transaction.id.compare(0, kSyntheticPrefix.size(), kSyntheticPrefix) == 0;
}

Result<SynthesisOutcome> ExpirationSynthesizer::synthesize(const std::vector<Transaction>& stream,
                                                           const Date& today) const {
    SynthesisOutcome outcome;
    outcome.stream = stream;

    if (stream.empty() || !stream.front().is_option()) {
        return Result<SynthesisOutcome>(std::move(outcome));
    }

    const Transaction& first = stream.front();
    auto contract = parse_option_symbol(first.symbol);
    if (contract.is_error()) {
        std::string warning = "Cannot parse option symbol " + first.symbol + " for asset " +
                              first.asset_id + ", auto-expiration skipped: " +
                              contract.error()->what();
        WARN(warning);
        outcome.warning = warning;
        return Result<SynthesisOutcome>(std::move(outcome));
    }

    const Date expiration = contract.value().expiration;
    if (!contract.value().is_expired_on(today)) {
        return Result<SynthesisOutcome>(std::move(outcome));
    }

    const Timestamp expires_at = end_of_day(expiration);

    // Dry pass over everything recorded up to the expiration instant
    auto insert_at = std::upper_bound(
        stream.begin(), stream.end(), expires_at,
        [](const Timestamp& ts, const Transaction& txn) { return ts < txn.occurred_at; });
    std::vector<Transaction> before(stream.begin(), insert_at);

    auto dry_run = CostBasisLedger::run(before, fees_, {}, config_);
    if (dry_run.is_error()) {
        return forward_error<SynthesisOutcome>(*dry_run.error());
    }

    Quantity long_open = 0.0;
    Quantity short_open = 0.0;
    for (const auto& lot : dry_run.value().open_lots) {
        const Quantity q = signed_quantity(lot);
        if (q > 0.0) {
            long_open += q;
        } else {
            short_open -= q;
        }
    }
    const Quantity remaining = std::max(long_open, short_open);
    if (remaining <= config_.quantity_epsilon) {
        return Result<SynthesisOutcome>(std::move(outcome));
    }

    Transaction expired;
    expired.id = synthetic_id(first.asset_id, expiration);
    expired.portfolio_id = first.portfolio_id;
    expired.asset_id = first.asset_id;
    expired.symbol = first.symbol;
    expired.asset_class = first.asset_class;
    expired.kind = TransactionKind::OPTION_EXPIRED;
    expired.quantity = remaining;
    expired.price = 0.0;
    expired.fees = 0.0;
    expired.currency = first.currency;
    expired.occurred_at = expires_at;

    INFO("Synthesized expiration for " << first.symbol << " (" << contract.value().describe()
                                       << "): quantity=" << remaining
                                       << " date=" << to_string(expiration));

    const auto offset = std::distance(stream.begin(), insert_at);
    outcome.stream.insert(outcome.stream.begin() + offset, expired);
    outcome.synthesized = std::move(expired);
    return Result<SynthesisOutcome>(std::move(outcome));
}

}  // namespace ledger_ngin
