// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <catch2/catch.hpp>
#include <rapidcheck.h>
#include <rapidcheck/catch.h>

#include <algorithm>
#include <vector>

#include "proto/LineDecoder.hh"
#include "stats/RateStatsTable.hh"
#include "util/ssprintf.hh"

/** @brief A generated retry stage: rate and count, with count 0 meaning absent */
struct GenStage {
    unsigned rate;
    unsigned count;
};

static std::string mkTxsLine(unsigned num_frames,
                             unsigned num_acked,
                             const std::vector<GenStage> &stages)
{
    std::string line = ssprintf("phy0;16c4added930f1b4;txs;cc:32:e5:9d:ab:58;%x;%x;0", num_frames, num_acked);

    for (const auto &stage : stages) {
        if (stage.count == 0)
            line += ";ffff;0";
        else
            line += ssprintf(";%x;%x", stage.rate, stage.count);
    }

    return line;
}

TEST_CASE("Properties of retry chain crediting", "[decoder][property]") {
    rc::prop("the last present stage is credited with all acknowledged frames",
        []() {
            const auto num_frames = *rc::gen::inRange<unsigned>(1, 256);
            const auto num_acked = *rc::gen::inRange<unsigned>(0, num_frames + 1);
            std::vector<GenStage> stages;

            for (unsigned i = 0; i < kMaxMrrStages; ++i)
                stages.push_back(GenStage{ *rc::gen::inRange<unsigned>(0, 0x100),
                                           *rc::gen::inRange<unsigned>(0, 4) });

            LineDecoder   decoder;
            TxStatusEvent ev = decoder.decodeTxStatus(mkTxsLine(num_frames, num_acked, stages));

            std::optional<unsigned> last;
            unsigned                npresent = 0;
            uint64_t                successes = 0;

            for (unsigned i = 0; i < kMaxMrrStages; ++i) {
                const MrrStage &stage = ev.mrr.stages[i];

                if (stages[i].count == 0) {
                    RC_ASSERT(!stage.isPresent());
                    RC_ASSERT(stage.attempts == 0u);
                } else {
                    RC_ASSERT(stage.rate == static_cast<int>(stages[i].rate));
                    RC_ASSERT(stage.attempts == static_cast<uint64_t>(num_frames)*stages[i].count);
                    ++npresent;
                    last = i;
                }

                successes += stage.successes;
            }

            RC_ASSERT(ev.mrr.npresent == npresent);

            if (num_acked > 0 && last) {
                RC_ASSERT(ev.mrr.credited == last);
                RC_ASSERT(ev.mrr.stages[*last].successes == num_acked);
            } else
                RC_ASSERT(!ev.mrr.credited);

            RC_ASSERT(successes == (ev.mrr.credited ? num_acked : 0u));
        });
}

TEST_CASE("Properties of timestamps", "[decoder][property]") {
    rc::prop("hexadecimal timestamps decode to the encoded value",
        []() {
            const auto    ts = *rc::gen::arbitrary<uint64_t>();
            LineDecoder   decoder(TimestampFormat::kHex);
            std::string   line = ssprintf("phy0;%016llx;sta;remove;cc:32:e5:9d:ab:58", (unsigned long long) ts);
            Event         ev = decoder.decode(line);

            RC_ASSERT(std::get<StationRemoveEvent>(ev).timestamp == ts);
        });

    rc::prop("second and nanosecond timestamps decode to nanoseconds",
        []() {
            const auto    sec = *rc::gen::inRange<uint64_t>(0, 10000000000ull);
            const auto    nsec = *rc::gen::inRange<uint64_t>(0, 1000000000ull);
            LineDecoder   decoder(TimestampFormat::kSecNsec);
            std::string   line = ssprintf("phy0;%llu;%09llu;sta;remove;cc:32:e5:9d:ab:58",
                                          (unsigned long long) sec,
                                          (unsigned long long) nsec);
            Event         ev = decoder.decode(line);

            RC_ASSERT(std::get<StationRemoveEvent>(ev).timestamp == sec*1000000000ull + nsec);
        });
}

/** @brief A generated statistics update */
struct GenUpdate {
    int rate;
    int txpower;
    unsigned attempts;
    unsigned successes;
};

static rc::Gen<GenUpdate> genUpdate(void)
{
    return rc::gen::apply([](int rate, int txpower, unsigned attempts, unsigned successes) {
            return GenUpdate{ rate, txpower, attempts, std::min(successes, attempts) };
        },
        rc::gen::inRange<int>(-2, 20),
        rc::gen::inRange<int>(-2, 6),
        rc::gen::inRange<unsigned>(0, 100),
        rc::gen::inRange<unsigned>(0, 100));
}

TEST_CASE("Properties of rate statistics", "[stats][property]") {
    rc::prop("splitting updates into batches does not change totals",
        []() {
            const auto xs = *rc::gen::container<std::vector<GenUpdate>>(genUpdate());
            const auto ys = *rc::gen::container<std::vector<GenUpdate>>(genUpdate());

            RateStatsTable all(16, 4);
            RateStatsTable first(16, 4);
            RateStatsTable second(16, 4);

            for (const auto &u : xs) {
                all.update(1, u.rate, u.txpower, u.attempts, u.successes);
                first.update(1, u.rate, u.txpower, u.attempts, u.successes);
            }

            for (const auto &u : ys) {
                all.update(1, u.rate, u.txpower, u.attempts, u.successes);
                second.update(1, u.rate, u.txpower, u.attempts, u.successes);
            }

            for (int rate = -1; rate < 16; ++rate) {
                for (int txpower = -1; txpower < 4; ++txpower) {
                    RC_ASSERT(all.get(rate, txpower)->attempts ==
                              first.get(rate, txpower)->attempts + second.get(rate, txpower)->attempts);
                    RC_ASSERT(all.get(rate, txpower)->successes ==
                              first.get(rate, txpower)->successes + second.get(rate, txpower)->successes);
                }
            }
        });

    rc::prop("updates outside the table land in the sentinel cells",
        []() {
            const auto     u = *genUpdate();
            RateStatsTable table(16, 4);

            table.update(1, u.rate, u.txpower, u.attempts, u.successes);

            int row = u.rate >= 0 && u.rate < 16 ? u.rate : -1;
            int col = u.txpower >= 0 && u.txpower < 4 ? u.txpower : -1;

            RC_ASSERT(table.get(row, col)->attempts == u.attempts);
            RC_ASSERT(table.entries().size() == (u.attempts == 0 ? 0u : 1u));
        });
}
