#include "status.h"

const char* StatusName(int status) {
    switch (status) {
        case kOk:
            return "ok";
        case kInvalidArgument:
            return "invalid argument";
        case kOutOfRange:
            return "out of range";
        case kLapackFailure:
            return "LAPACK failure";
        case kRngFailure:
            return "RNG failure";
        default:
            return "unknown status";
    }
}
