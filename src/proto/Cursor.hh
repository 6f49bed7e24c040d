// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef PROTO_CURSOR_HH_
#define PROTO_CURSOR_HH_

#include <stdint.h>

#include <charconv>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>

#include "Errors.hh"

/** @brief Field separator */
constexpr char kFieldSep = ';';

/** @brief Sub-field separator */
constexpr char kSubFieldSep = ',';

/** @brief A bounds-checked cursor over the fields of a protocol line */
/** Fields are views into the line, which must outlive the cursor. */
class FieldCursor {
public:
    explicit FieldCursor(std::string_view line, char sep = kFieldSep)
      : line_(line)
      , sep_(sep)
      , pos_(0)
      , nfields_(1)
      , nconsumed_(0)
    {
        for (char c : line_)
            if (c == sep_)
                ++nfields_;
    }

    /** @brief Total number of fields in the line */
    size_t nfields(void) const
    {
        return nfields_;
    }

    /** @brief Number of fields not yet consumed */
    size_t remaining(void) const
    {
        return nfields_ - nconsumed_;
    }

    /** @brief Return true if every field has been consumed */
    bool atEnd(void) const
    {
        return nconsumed_ == nfields_;
    }

    /** @brief Return the next field without consuming it */
    std::string_view peek(void) const
    {
        if (atEnd())
            throw DecodeError(ErrorCode::kFieldCountMismatch, "Unexpected end of line");

        size_t end = line_.find(sep_, pos_);

        if (end == std::string_view::npos)
            return line_.substr(pos_);
        else
            return line_.substr(pos_, end - pos_);
    }

    /** @brief Consume and return the next field */
    std::string_view next(void)
    {
        std::string_view field = peek();

        pos_ += field.size() + 1;
        ++nconsumed_;

        return field;
    }

    /** @brief Consume and return the unparsed remainder of the line */
    std::string_view rest(void)
    {
        if (atEnd())
            return std::string_view();

        std::string_view r = line_.substr(pos_);

        pos_ = line_.size();
        nconsumed_ = nfields_;

        return r;
    }

private:
    std::string_view line_;
    char sep_;
    size_t pos_;
    size_t nfields_;
    size_t nconsumed_;
};

/** @brief Parse an unsigned integer in the given base.
 * The entire field must be consumed and the value must fit in T.
 * @throw DecodeError with the given error code
 */
template <class T>
T parseUnsigned(std::string_view s,
                const char *what,
                int base = 16,
                ErrorCode code = ErrorCode::kMalformedField)
{
    static_assert(std::is_unsigned<T>::value, "parseUnsigned requires an unsigned type");

    T val = 0;

    if (s.empty())
        throw DecodeError(code, std::string("Empty ") + what + " field");

    auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), val, base);

    if (ec != std::errc() || p != s.data() + s.size())
        throw DecodeError(code, std::string("Illegal ") + what + " field: " + std::string(s));

    return val;
}

/** @brief Parse a hexadecimal unsigned integer */
template <class T>
T parseHex(std::string_view s, const char *what)
{
    return parseUnsigned<T>(s, what, 16);
}

/** @brief Parse a 32-bit two's complement hexadecimal integer */
inline int32_t parseS32(std::string_view s, const char *what)
{
    return static_cast<int32_t>(parseHex<uint32_t>(s, what));
}

#endif /* PROTO_CURSOR_HH_ */
