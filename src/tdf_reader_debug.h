/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#ifndef TDF_READER_DEBUG_H
#define TDF_READER_DEBUG_H

//! @file tdf_reader_debug.h
//! @short Module-level debug interfaces

#include <QLoggingCategory>
Q_DECLARE_LOGGING_CATEGORY(TDF_READER)

#define debugTdf(...) qCDebug(TDF_READER, __VA_ARGS__)
#define infoTdf(...) qCInfo(TDF_READER, __VA_ARGS__)
#define warningTdf(...) qCWarning(TDF_READER, __VA_ARGS__)
#define criticalTdf(...) qCCritical(TDF_READER, __VA_ARGS__)

#endif
