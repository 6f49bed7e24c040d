// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef PROTO_MRRDECODER_HH_
#define PROTO_MRRDECODER_HH_

#include <string_view>

#include "proto/Cursor.hh"
#include "proto/Events.hh"

/** @brief Wire layout of the multi-rate retry stages */
enum class MrrLayout {
    /** @brief Each stage is two fields, rate;count */
    kPair = 0,
    /** @brief Each stage is one field, rate,count[,txpower] */
    kTuple
};

/** @brief Number of fields occupied by the MRR stages of a txs line */
constexpr size_t mrrFieldCount(MrrLayout layout)
{
    return layout == MrrLayout::kPair ? 2*kMaxMrrStages : kMaxMrrStages;
}

/** @brief Decode a single MRR stage in tuple layout.
 * An empty rate or a zero retry count denotes an absent stage.
 */
MrrStage decodeMrrStage(std::string_view field);

/** @brief Decode a single MRR stage in pair layout. */
MrrStage decodeMrrStage(std::string_view rate, std::string_view count);

/** @brief Decode all MRR stages and credit the acknowledged frames.
 * @param cursor Cursor positioned at the first stage
 * @param layout Wire layout of the stages
 * @param num_frames Number of frames sent
 * @param num_acked Number of frames acknowledged
 */
MrrChain decodeMrrChain(FieldCursor &cursor,
                        MrrLayout layout,
                        unsigned num_frames,
                        unsigned num_acked);

/** @brief Derive attempts and successes for each stage of a chain.
 * The credited stage is the last populated stage, and only when at least one
 * frame was acknowledged.
 */
void creditMrrChain(MrrChain &chain,
                    unsigned num_frames,
                    unsigned num_acked);

#endif /* PROTO_MRRDECODER_HH_ */
