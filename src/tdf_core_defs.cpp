/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#include "tdf_core_defs.h"

_TDF_BEGIN

const char *errorCodeName(Err e)
{
    switch (e) {
    case kNoErr:
        return "kNoErr";
    case kError:
        return "kError";
    case kBadParameterError:
        return "kBadParameterError";
    case kFileOpenError:
        return "kFileOpenError";
    case kSqlError:
        return "kSqlError";
    case kFrameNotFound:
        return "kFrameNotFound";
    case kServiceUnavailable:
        return "kServiceUnavailable";
    case kServiceError:
        return "kServiceError";
    case kFrameTooLarge:
        return "kFrameTooLarge";
    case kAmbiguousPrecursorMatch:
        return "kAmbiguousPrecursorMatch";
    case kUnsupportedFrameType:
        return "kUnsupportedFrameType";
    case kInvalidScanIdentifier:
        return "kInvalidScanIdentifier";
    }
    return "kUnknownError";
}

_TDF_END
