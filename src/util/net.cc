// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include "Errors.hh"
#include "util/net.hh"
#include "util/ssprintf.hh"

static int hexDigit(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    else if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    else if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    else
        return -1;
}

std::string MacAddr::toString(void) const
{
    return ssprintf("%02x:%02x:%02x:%02x:%02x:%02x",
                    bytes[0], bytes[1], bytes[2],
                    bytes[3], bytes[4], bytes[5]);
}

MacAddr parseMAC(std::string_view s)
{
    MacAddr addr;

    if (s.size() != kMacAddrStrLen)
        throw DecodeError(ErrorCode::kMalformedAddress,
                          ssprintf("Illegally formatted MAC address: %.*s",
                                   static_cast<int>(s.size()), s.data()));

    for (unsigned i = 0; i < 6; ++i) {
        int hi = hexDigit(s[3*i]);
        int lo = hexDigit(s[3*i+1]);

        if (hi < 0 || lo < 0 || (i < 5 && s[3*i+2] != ':'))
            throw DecodeError(ErrorCode::kMalformedAddress,
                              ssprintf("Illegally formatted MAC address: %.*s",
                                       static_cast<int>(s.size()), s.data()));

        addr.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }

    return addr;
}
