// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#ifndef ERRORS_HH_
#define ERRORS_HH_

#include <stdexcept>
#include <string>

/** @brief Error codes reported by the controller */
enum class ErrorCode {
    /** @brief A field was empty, too long, or not a valid number */
    kMalformedField = 0,
    /** @brief The timestamp had the wrong width or contained bad digits */
    kMalformedTimestamp,
    /** @brief A station address was not of the form xx:xx:xx:xx:xx:xx */
    kMalformedAddress,
    /** @brief The record type token was not the one expected */
    kUnexpectedRecordType,
    /** @brief The line had the wrong number of fields for its record type */
    kFieldCountMismatch,
    /** @brief The rate control algorithm's configure hook failed */
    kAlgorithmConfigureFailed,
    /** @brief The rate control algorithm's run hook returned on its own */
    kAlgorithmRunExited,
    /** @brief No such station */
    kUnknownStation,
    /** @brief No such access point */
    kUnknownAccessPoint,
    /** @brief The device speaks an API version we don't support */
    kUnsupportedApiVersion,
    /** @brief A station command was issued in the wrong mode */
    kStationMode,
    /** @brief A decoded event could not be applied */
    kRoutingFailed
};

/** @brief Return the name of an error code */
const char *errorCode2string(ErrorCode code);

/** @brief Base class for controller errors */
class RatectlError : public std::runtime_error {
public:
    RatectlError(ErrorCode code, const std::string& what)
      : std::runtime_error(what)
      , code_(code)
    {
    }

    /** @brief Error code */
    ErrorCode code(void) const
    {
        return code_;
    }

private:
    ErrorCode code_;
};

/** @brief A protocol line could not be decoded */
class DecodeError : public RatectlError {
public:
    DecodeError(ErrorCode code, const std::string& what)
      : RatectlError(code, what)
    {
    }
};

/** @brief A rate control task failed */
class RateControlError : public RatectlError {
public:
    RateControlError(ErrorCode code, const std::string& what)
      : RatectlError(code, what)
    {
    }
};

/** @brief A station command was issued while the station was in the wrong mode */
class StationModeError : public RatectlError {
public:
    explicit StationModeError(const std::string& what)
      : RatectlError(ErrorCode::kStationMode, what)
    {
    }
};

/** @brief Lookup of a station or access point failed */
class LookupError : public RatectlError {
public:
    LookupError(ErrorCode code, const std::string& what)
      : RatectlError(code, what)
    {
    }
};

#endif /* ERRORS_HH_ */
