// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef UTIL_NET_HH_
#define UTIL_NET_HH_

#include <stdint.h>
#include <string.h>

#include <array>
#include <functional>
#include <string>
#include <string_view>

/** @brief Length of a canonically formatted MAC address */
constexpr size_t kMacAddrStrLen = 17;

/** @brief A 6-byte hardware address */
struct MacAddr {
    MacAddr() : bytes{{0}}
    {
    }

    explicit MacAddr(const std::array<uint8_t, 6> &b) : bytes(b)
    {
    }

    /** @brief Address bytes, most significant first */
    std::array<uint8_t, 6> bytes;

    /** @brief Return canonical lowercase xx:xx:xx:xx:xx:xx form */
    std::string toString(void) const;

    bool operator==(const MacAddr &other) const
    {
        return bytes == other.bytes;
    }

    bool operator!=(const MacAddr &other) const
    {
        return bytes != other.bytes;
    }

    bool operator<(const MacAddr &other) const
    {
        return bytes < other.bytes;
    }
};

/** @brief Determine whether or not an Ethernet address is a broadcast address */
inline bool isEthernetBroadcast(const MacAddr &addr)
{
    return memcmp(addr.bytes.data(), "\xff\xff\xff\xff\xff\xff", 6) == 0;
}

/** @brief Parse a MAC address.
 * The address must be exactly 17 characters of the form xx:xx:xx:xx:xx:xx.
 * @throw DecodeError with code kMalformedAddress
 */
MacAddr parseMAC(std::string_view s);

namespace std {
template<>
struct hash<MacAddr> {
    size_t operator()(const MacAddr &addr) const noexcept
    {
        uint64_t x = 0;

        for (auto b : addr.bytes)
            x = (x << 8) | b;

        return std::hash<uint64_t>{}(x);
    }
};
}

#endif /* UTIL_NET_HH_ */
