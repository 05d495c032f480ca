// include/ledger_ngin/data/repository_interface.hpp

#pragma once

#include <string>
#include <vector>
#include "ledger_ngin/core/error.hpp"
#include "ledger_ngin/core/types.hpp"

namespace ledger_ngin {

/**
 * @brief Read access to the append-only transaction ledger
 * Implementations live outside the library (database, file, in-memory)
 */
class TransactionRepository {
public:
    virtual ~TransactionRepository() = default;

    /**
     * @brief List every transaction of a portfolio
     * @param portfolio_id Portfolio to read
     * @return Transactions ascending by occurred_at, stable on ties, or an error
     */
    virtual Result<std::vector<Transaction>> list_transactions(
        const std::string& portfolio_id) = 0;
};

/**
 * @brief Storage for derived position rows
 */
class PositionRepository {
public:
    virtual ~PositionRepository() = default;

    /**
     * @brief Insert or replace the row keyed by (portfolio_id, asset_id)
     */
    virtual Result<void> upsert_position(const Position& position) = 0;

    /**
     * @brief Remove the row keyed by (portfolio_id, asset_id); absent rows are not an error
     */
    virtual Result<void> delete_position(const std::string& portfolio_id,
                                         const std::string& asset_id) = 0;

    /**
     * @brief List the stored rows of a portfolio
     */
    virtual Result<std::vector<Position>> list_positions(const std::string& portfolio_id) = 0;
};

}  // namespace ledger_ngin
