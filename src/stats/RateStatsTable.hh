// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef RATESTATSTABLE_HH_
#define RATESTATSTABLE_HH_

#include <stdint.h>

#include <optional>
#include <shared_mutex>
#include <vector>

#include "proto/Events.hh"

/** @brief Accumulated outcomes of one (rate, txpower) pair */
struct RateStats {
    /** @brief Cumulative attempts */
    uint64_t attempts = 0;

    /** @brief Cumulative successes */
    uint64_t successes = 0;

    /** @brief Timestamp of the most recent update [ns] */
    uint64_t timestamp = 0;

    bool operator==(const RateStats &other) const
    {
        return attempts == other.attempts &&
               successes == other.successes &&
               timestamp == other.timestamp;
    }
};

/** @brief Per-station statistics over (rate, txpower) */
/** The table is a dense grid of (n_rates+1) x (n_txpwrs+1) cells. The extra
 * row and column hold outcomes whose rate or power is unknown: the absent
 * sentinel -1 and any value outside the configured bounds are accumulated
 * there. All accessors may be called concurrently with update.
 */
class RateStatsTable {
public:
    /** @brief A non-empty cell */
    struct Entry {
        /** @brief Rate index, or kAbsentRate for the unknown row */
        int rate;

        /** @brief TX power index, or kAbsentTxPower for the unknown column */
        int txpower;

        RateStats stats;
    };

    RateStatsTable();

    RateStatsTable(unsigned n_rates, unsigned n_txpwrs);

    RateStatsTable(const RateStatsTable&) = delete;
    RateStatsTable(RateStatsTable&&) = delete;

    RateStatsTable& operator=(const RateStatsTable&) = delete;
    RateStatsTable& operator=(RateStatsTable&&) = delete;

    /** @brief Number of rates, not counting the unknown rate */
    unsigned getNumRates(void) const;

    /** @brief Number of power levels, not counting the unknown power */
    unsigned getNumTxPowers(void) const;

    /** @brief Re-allocate the table and zero every cell.
     * @throw std::invalid_argument if either dimension would shrink
     */
    void reset(unsigned n_rates, unsigned n_txpwrs);

    /** @brief Zero every cell, keeping the dimensions */
    void clear(void);

    /** @brief Accumulate the stages of a transmission.
     * @param timestamp Event timestamp [ns]
     * @param chain The MRR chain with derived attempts and successes
     * @param accumulate_unknown_txpower If true, stages with a concrete power
     * are also accumulated in the unknown power column of their rate.
     */
    void update(uint64_t timestamp,
                const MrrChain &chain,
                bool accumulate_unknown_txpower = false);

    /** @brief Accumulate outcomes for a single (rate, txpower) pair */
    void update(uint64_t timestamp,
                int rate,
                int txpower,
                uint64_t attempts,
                uint64_t successes);

    /** @brief Get the statistics of a cell.
     * -1 selects the unknown row or column.
     * @return The statistics, or std::nullopt if an index is out of bounds
     */
    std::optional<RateStats> get(int rate, int txpower) const;

    /** @brief Return every cell that has seen at least one attempt */
    std::vector<Entry> entries(void) const;

private:
    /** @brief Mutex protecting the table */
    mutable std::shared_mutex mutex_;

    /** @brief Number of rates */
    unsigned n_rates_;

    /** @brief Number of power levels */
    unsigned n_txpwrs_;

    /** @brief Cells in row-major (rate, txpower) order */
    std::vector<RateStats> cells_;

    /** @brief Map a rate to a row, sending unknown rates to the sentinel row */
    unsigned rateRow(int rate) const
    {
        return rate >= 0 && static_cast<unsigned>(rate) < n_rates_ ? rate : n_rates_;
    }

    /** @brief Map a power to a column, sending unknown powers to the sentinel column */
    unsigned txpowerCol(int txpower) const
    {
        return txpower >= 0 && static_cast<unsigned>(txpower) < n_txpwrs_ ? txpower : n_txpwrs_;
    }

    RateStats &cell(unsigned row, unsigned col)
    {
        return cells_[row*(n_txpwrs_ + 1) + col];
    }

    const RateStats &cell(unsigned row, unsigned col) const
    {
        return cells_[row*(n_txpwrs_ + 1) + col];
    }

    /** @brief Accumulate into a cell. Caller must hold the mutex exclusively. */
    void accumulate(uint64_t timestamp,
                    unsigned row,
                    unsigned col,
                    uint64_t attempts,
                    uint64_t successes);
};

#endif /* RATESTATSTABLE_HH_ */
