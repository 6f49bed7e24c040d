// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include "ControllerConfig.hh"

using namespace std::chrono_literals;

ControllerConfig cfg;

ControllerConfig::ControllerConfig()
  : debug(false)
  , timestamp_format(TimestampFormat::kHex)
  , create_on_first_sight(true)
  , pause_on_disassoc(false)
  , drop_stale_events(true)
  , cancel_timeout(1s)
  , configure_timeout(5s)
  , default_num_rates(0x100)
  , default_num_txpowers(0x20)
{
}
