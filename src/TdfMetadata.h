/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#ifndef TDF_METADATA_H
#define TDF_METADATA_H

#include "tdf_core_defs.h"

#include <QMap>
#include <QString>

class QSqlDatabase;

_TDF_BEGIN

//! Acquisition level values of the GlobalMetadata table
struct TDF_READER_EXPORT TdfGlobalMetadata
{
    QString acquisitionSoftware;
    QString acquisitionSoftwareVersion;
    QString instrumentFamily;
    QString instrumentRevision;
    QString instrumentSerialNumber;
    QString acquisitionDateTime;
    QString operatorName;
    double mzAcqRangeLower = 0.0;
    double mzAcqRangeUpper = 0.0;

    //! every key/value pair of the table, including the ones above
    QMap<QString, QString> values;

    void clear();
};

TDF_READER_EXPORT Err readGlobalMetadata(const QSqlDatabase &db, TdfGlobalMetadata *metadata);

//! Number of frames per MsMsType label (see msMsTypeLabel()) plus "Total"
TDF_READER_EXPORT Err readFrameCounts(const QSqlDatabase &db, QMap<QString, int> *counts);

_TDF_END

#endif // TDF_METADATA_H
