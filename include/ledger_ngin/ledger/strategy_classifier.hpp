// include/ledger_ngin/ledger/strategy_classifier.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "ledger_ngin/core/error.hpp"
#include "ledger_ngin/core/types.hpp"

namespace ledger_ngin {

/**
 * @brief Infers strategy tags for transactions recorded before explicit tagging
 *
 * A classifier is a heuristic, never ground truth: it is only consulted for
 * transactions whose strategy_tag is empty, and an explicit tag always wins.
 */
class StrategyClassifier {
public:
    virtual ~StrategyClassifier() = default;

    /**
     * @brief Suggest a tag for one transaction
     * @param transaction Untagged transaction to classify
     * @param history Every transaction of the same portfolio, in ledger order
     * @return Tag to attach, or nullopt to leave the transaction untagged
     */
    virtual std::optional<std::string> classify(const Transaction& transaction,
                                                const std::vector<Transaction>& history) const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Trusts explicit tags only
 */
class NullStrategyClassifier : public StrategyClassifier {
public:
    std::optional<std::string> classify(const Transaction&,
                                        const std::vector<Transaction>&) const override {
        return std::nullopt;
    }

    std::string name() const override {
        return "null";
    }
};

/**
 * @brief Covered-call detection by same-day ownership of the underlying
 *
 * A call sold while the portfolio holds at least as many underlying shares
 * (bought minus sold up to the end of that day) is tagged covered_call. A
 * call bought after a covered-call sale of the same contract is tagged as
 * its buyback leg.
 */
class UnderlyingOwnershipClassifier : public StrategyClassifier {
public:
    std::optional<std::string> classify(const Transaction& transaction,
                                        const std::vector<Transaction>& history) const override;

    std::string name() const override {
        return "underlying_ownership";
    }

    /**
     * @brief Underlying shares held at the end of the transaction's UTC day
     */
    static Quantity shares_held_at_end_of_day(const std::string& underlying,
                                              const Transaction& transaction,
                                              const std::vector<Transaction>& history);

private:
    bool is_covered_sell(const Transaction& sell, const std::vector<Transaction>& history) const;
};

/**
 * @brief Fill empty strategy tags using a classifier
 * @param classifier Heuristic to consult
 * @param history Portfolio transactions in ledger order
 * @return Copy of the history with inferred tags attached; explicit tags untouched
 */
std::vector<Transaction> apply_strategy_classifier(const StrategyClassifier& classifier,
                                                   const std::vector<Transaction>& history,
                                                   size_t* tagged_count = nullptr);

/**
 * @brief Build a classifier by name ("null" or "underlying_ownership")
 */
Result<std::shared_ptr<const StrategyClassifier>> make_strategy_classifier(
    const std::string& name);

}  // namespace ledger_ngin
