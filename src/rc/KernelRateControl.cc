// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include "Station.hh"
#include "rc/KernelRateControl.hh"

std::shared_ptr<AlgorithmContext> KernelRateControl::configure(const std::shared_ptr<Station> &sta,
                                                               const AlgorithmOptions &)
{
    sta->setManualRcMode(false);
    sta->setManualTpcMode(false);

    return std::make_shared<AlgorithmContext>();
}

void KernelRateControl::run(const std::shared_ptr<AlgorithmContext> &,
                            CancellationToken &token)
{
    token.wait();
}
