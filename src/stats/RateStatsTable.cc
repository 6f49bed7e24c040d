// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <mutex>
#include <stdexcept>

#include "stats/RateStatsTable.hh"
#include "util/ssprintf.hh"

RateStatsTable::RateStatsTable()
  : RateStatsTable(0, 0)
{
}

RateStatsTable::RateStatsTable(unsigned n_rates, unsigned n_txpwrs)
  : n_rates_(n_rates)
  , n_txpwrs_(n_txpwrs)
  , cells_((n_rates + 1)*(n_txpwrs + 1))
{
}

unsigned RateStatsTable::getNumRates(void) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);

    return n_rates_;
}

unsigned RateStatsTable::getNumTxPowers(void) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);

    return n_txpwrs_;
}

void RateStatsTable::reset(unsigned n_rates, unsigned n_txpwrs)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (n_rates < n_rates_ || n_txpwrs < n_txpwrs_)
        throw std::invalid_argument(ssprintf("Cannot shrink rate statistics table from %ux%u to %ux%u",
                                             n_rates_, n_txpwrs_,
                                             n_rates, n_txpwrs));

    std::vector<RateStats> cells((n_rates + 1)*(n_txpwrs + 1));

    cells_.swap(cells);
    n_rates_ = n_rates;
    n_txpwrs_ = n_txpwrs;
}

void RateStatsTable::clear(void)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);

    for (auto &c : cells_)
        c = RateStats{};
}

void RateStatsTable::update(uint64_t timestamp,
                            const MrrChain &chain,
                            bool accumulate_unknown_txpower)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);

    for (const auto &stage : chain.stages) {
        if (!stage.isPresent())
            continue;

        unsigned row = rateRow(stage.rate);
        unsigned col = txpowerCol(stage.txpower);

        accumulate(timestamp, row, col, stage.attempts, stage.successes);

        if (accumulate_unknown_txpower && col != n_txpwrs_)
            accumulate(timestamp, row, n_txpwrs_, stage.attempts, stage.successes);
    }
}

void RateStatsTable::update(uint64_t timestamp,
                            int rate,
                            int txpower,
                            uint64_t attempts,
                            uint64_t successes)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);

    accumulate(timestamp, rateRow(rate), txpowerCol(txpower), attempts, successes);
}

std::optional<RateStats> RateStatsTable::get(int rate, int txpower) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    unsigned                            row;
    unsigned                            col;

    if (rate == kAbsentRate)
        row = n_rates_;
    else if (rate >= 0 && static_cast<unsigned>(rate) < n_rates_)
        row = rate;
    else
        return std::nullopt;

    if (txpower == kAbsentTxPower)
        col = n_txpwrs_;
    else if (txpower >= 0 && static_cast<unsigned>(txpower) < n_txpwrs_)
        col = txpower;
    else
        return std::nullopt;

    return cell(row, col);
}

std::vector<RateStatsTable::Entry> RateStatsTable::entries(void) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Entry>                  result;

    for (unsigned row = 0; row <= n_rates_; ++row) {
        for (unsigned col = 0; col <= n_txpwrs_; ++col) {
            const RateStats &stats = cell(row, col);

            if (stats.attempts != 0)
                result.push_back(Entry{ row == n_rates_ ? kAbsentRate : static_cast<int>(row),
                                        col == n_txpwrs_ ? kAbsentTxPower : static_cast<int>(col),
                                        stats });
        }
    }

    return result;
}

void RateStatsTable::accumulate(uint64_t timestamp,
                                unsigned row,
                                unsigned col,
                                uint64_t attempts,
                                uint64_t successes)
{
    RateStats &c = cell(row, col);

    c.attempts += attempts;
    c.successes += successes;
    c.timestamp = timestamp;
}
