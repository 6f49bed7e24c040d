// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include <stdio.h>

#include <memory>

#include "util/ssprintf.hh"

/** @brief Initial formatting buffer size */
constexpr int kInitialBufferSize = 256;

std::string vssprintf(const char *fmt, va_list ap)
{
    int                     n = kInitialBufferSize;
    std::unique_ptr<char[]> buf;

    for (;;) {
        va_list aq;

        buf.reset(new char[n]);

        va_copy(aq, ap);
        int count = vsnprintf(&buf[0], n, fmt, aq);
        va_end(aq);

        if (count < 0)
            return std::string();
        else if (count >= n)
            n = count + 1;
        else
            return std::string(buf.get(), count);
    }
}

std::string ssprintf(const char *fmt, ...)
{
    va_list     ap;
    std::string s;

    va_start(ap, fmt);
    s = vssprintf(fmt, ap);
    va_end(ap);

    return s;
}
