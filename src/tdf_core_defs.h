/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#ifndef TDF_CORE_DEFS_H
#define TDF_CORE_DEFS_H

//! @file tdf_core_defs.h
//! @short Namespace macros and error codes shared by the whole library

#include "tdf_reader_export.h"

#include <QDebug>

#define _TDF_BEGIN namespace tdf {
#define _TDF_END }

_TDF_BEGIN

//! Error codes returned by every fallible call of the library.
//! Do not reorder; values are printed in logs and used as process exit codes by tdf-scan.
enum Err {
    kNoErr = 0,
    kError,
    kBadParameterError,
    kFileOpenError,
    kSqlError,
    kFrameNotFound,
    kServiceUnavailable,
    kServiceError,
    kFrameTooLarge,
    kAmbiguousPrecursorMatch,
    kUnsupportedFrameType,
    kInvalidScanIdentifier
};

TDF_READER_EXPORT const char *errorCodeName(Err e);

inline QDebug operator<<(QDebug dbg, Err e)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace() << errorCodeName(e) << '(' << static_cast<int>(e) << ')';
    return dbg;
}

_TDF_END

//! Log the error code with its location and return it from the current function
#define rrr(code)                                                                                  \
    do {                                                                                           \
        const tdf::Err rrr_code_ = (code);                                                         \
        qWarning() << "error" << rrr_code_ << "at" << __FILE__ << ":" << __LINE__ << Q_FUNC_INFO;  \
        return rrr_code_;                                                                          \
    } while (0)

//! Return the current error e if it is set; e must be a local tdf::Err
#define ree                                                                                        \
    do {                                                                                           \
        if (e != tdf::kNoErr) {                                                                    \
            return e;                                                                              \
        }                                                                                          \
    } while (0)

#endif // TDF_CORE_DEFS_H
