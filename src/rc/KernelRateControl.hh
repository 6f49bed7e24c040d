// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef RC_KERNELRATECONTROL_HH_
#define RC_KERNELRATECONTROL_HH_

#include "rc/RateControlAlgorithm.hh"

/** @brief Leave rate and power selection to the device */
/** Configuring hands rate and power control back to the device's own
 * algorithm. Running does nothing until cancelled.
 */
class KernelRateControl : public RateControlAlgorithm {
public:
    /** @brief Name of the kernel algorithm */
    static constexpr const char *kName = "minstrel_ht_kernel_space";

    KernelRateControl() = default;

    virtual ~KernelRateControl() = default;

    std::string getName(void) const override
    {
        return kName;
    }

    std::shared_ptr<AlgorithmContext> configure(const std::shared_ptr<Station> &sta,
                                                const AlgorithmOptions &opts) override;

    void run(const std::shared_ptr<AlgorithmContext> &ctx,
             CancellationToken &token) override;
};

#endif /* RC_KERNELRATECONTROL_HH_ */
