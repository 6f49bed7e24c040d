// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include "proto/MrrDecoder.hh"

/** @brief Maximum number of sub-fields in a tuple stage */
constexpr size_t kMaxStageSubFields = 3;

static MrrStage absentStage(void)
{
    return MrrStage{};
}

static MrrStage mkStage(std::string_view rate,
                        std::string_view count,
                        std::string_view txpower)
{
    if (rate.empty() || count.empty())
        return absentStage();

    unsigned c = parseHex<uint16_t>(count, "MRR count");

    if (c == 0)
        return absentStage();

    MrrStage stage;

    stage.rate = parseHex<uint16_t>(rate, "MRR rate");
    stage.count = c;

    if (!txpower.empty())
        stage.txpower = parseHex<uint16_t>(txpower, "MRR txpower");

    return stage;
}

MrrStage decodeMrrStage(std::string_view field)
{
    if (field.empty() || field[0] == kSubFieldSep)
        return absentStage();

    FieldCursor sub(field, kSubFieldSep);

    if (sub.nfields() < 2 || sub.nfields() > kMaxStageSubFields)
        throw DecodeError(ErrorCode::kMalformedField,
                          "Illegal MRR stage: " + std::string(field));

    std::string_view rate = sub.next();
    std::string_view count = sub.next();
    std::string_view txpower = sub.atEnd() ? std::string_view() : sub.next();

    return mkStage(rate, count, txpower);
}

MrrStage decodeMrrStage(std::string_view rate, std::string_view count)
{
    return mkStage(rate, count, std::string_view());
}

void creditMrrChain(MrrChain &chain,
                    unsigned num_frames,
                    unsigned num_acked)
{
    chain.npresent = 0;
    chain.credited.reset();

    for (unsigned i = 0; i < kMaxMrrStages; ++i) {
        MrrStage &stage = chain.stages[i];

        if (stage.isPresent()) {
            ++chain.npresent;
            stage.attempts = static_cast<uint64_t>(num_frames) * stage.count;
            if (num_acked > 0)
                chain.credited = i;
        } else {
            stage.attempts = 0;
        }

        stage.successes = 0;
    }

    if (chain.credited)
        chain.stages[*chain.credited].successes = num_acked;
}

MrrChain decodeMrrChain(FieldCursor &cursor,
                        MrrLayout layout,
                        unsigned num_frames,
                        unsigned num_acked)
{
    MrrChain chain;

    for (unsigned i = 0; i < kMaxMrrStages; ++i) {
        if (layout == MrrLayout::kPair) {
            std::string_view rate = cursor.next();
            std::string_view count = cursor.next();

            chain.stages[i] = decodeMrrStage(rate, count);
        } else
            chain.stages[i] = decodeMrrStage(cursor.next());
    }

    creditMrrChain(chain, num_frames, num_acked);

    return chain;
}
