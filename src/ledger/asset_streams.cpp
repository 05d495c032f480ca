#include "ledger_ngin/ledger/asset_streams.hpp"

#include <algorithm>
#include <unordered_map>
#include "ledger_ngin/ledger/cost_basis_ledger.hpp"

namespace ledger_ngin {

std::vector<AssetStream> group_by_asset(const std::vector<Transaction>& transactions) {
    std::vector<AssetStream> streams;
    std::unordered_map<std::string, size_t> index;

    for (const auto& transaction : transactions) {
        auto it = index.find(transaction.asset_id);
        if (it == index.end()) {
            it = index.emplace(transaction.asset_id, streams.size()).first;
            streams.push_back(AssetStream{transaction.asset_id, {}});
        }
        streams[it->second].transactions.push_back(transaction);
    }

    for (auto& stream : streams) {
        std::stable_sort(stream.transactions.begin(), stream.transactions.end(),
                         [](const Transaction& a, const Transaction& b) {
                             return a.occurred_at < b.occurred_at;
                         });
    }
    return streams;
}

Result<PreparedStreams> prepare_asset_streams(const std::vector<Transaction>& transactions,
                                              const StrategyClassifier& classifier,
                                              const ExpirationSynthesizer* synthesizer,
                                              const Date& today) {
    for (const auto& transaction : transactions) {
        auto valid = CostBasisLedger::validate(transaction);
        if (valid.is_error()) {
            return forward_error<PreparedStreams>(*valid.error());
        }
    }

    PreparedStreams prepared;
    prepared.transaction_count = transactions.size();

    auto classified =
        apply_strategy_classifier(classifier, transactions, &prepared.classified_count);
    prepared.streams = group_by_asset(classified);

    if (synthesizer == nullptr) {
        return Result<PreparedStreams>(std::move(prepared));
    }

    for (auto& stream : prepared.streams) {
        auto outcome = synthesizer->synthesize(stream.transactions, today);
        if (outcome.is_error()) {
            return forward_error<PreparedStreams>(*outcome.error());
        }
        SynthesisOutcome synthesis = outcome.take_value();
        if (synthesis.warning) {
            prepared.warnings.push_back(*synthesis.warning);
        }
        if (synthesis.synthesized) {
            prepared.synthesized_expirations.push_back(*synthesis.synthesized);
        }
        stream.transactions = std::move(synthesis.stream);
    }
    return Result<PreparedStreams>(std::move(prepared));
}

}  // namespace ledger_ngin
