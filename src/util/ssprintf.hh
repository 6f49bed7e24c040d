// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef UTIL_SSPRINTF_HH_
#define UTIL_SSPRINTF_HH_

#include <stdarg.h>

#include <string>

/** @brief sprintf to a std::string. */
std::string ssprintf(const char *fmt, ...)
#if !defined(DOXYGEN)
__attribute__((format(printf, 1, 2)))
#endif
;

/** @brief vsprintf to a std::string. */
/** The caller's va_list is left untouched; it is copied before each
 * formatting attempt.
 */
std::string vssprintf(const char *fmt, va_list ap);

#endif /* UTIL_SSPRINTF_HH_ */
