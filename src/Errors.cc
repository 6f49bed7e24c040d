// Copyright 2018-2022 Drexel University
// Author: Geoffrey Mainland <mainland@drexel.edu>

#include "Errors.hh"

const char *errorCode2string(ErrorCode code)
{
    switch (code) {
        case ErrorCode::kMalformedField:
            return "MalformedField";

        case ErrorCode::kMalformedTimestamp:
            return "MalformedTimestamp";

        case ErrorCode::kMalformedAddress:
            return "MalformedAddress";

        case ErrorCode::kUnexpectedRecordType:
            return "UnexpectedRecordType";

        case ErrorCode::kFieldCountMismatch:
            return "FieldCountMismatch";

        case ErrorCode::kAlgorithmConfigureFailed:
            return "AlgorithmConfigureFailed";

        case ErrorCode::kAlgorithmRunExited:
            return "AlgorithmRunExited";

        case ErrorCode::kUnknownStation:
            return "UnknownStation";

        case ErrorCode::kUnknownAccessPoint:
            return "UnknownAccessPoint";

        case ErrorCode::kUnsupportedApiVersion:
            return "UnsupportedApiVersion";

        case ErrorCode::kStationMode:
            return "StationMode";

        case ErrorCode::kRoutingFailed:
            return "RoutingFailed";
    }

    return "Unknown";
}
