/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#include "TdfMetadata.h"
#include "TdfFrame.h"
#include "db/QtSqlUtils.h"

#include <QVariant>

_TDF_BEGIN

void TdfGlobalMetadata::clear()
{
    *this = TdfGlobalMetadata();
}

Err readGlobalMetadata(const QSqlDatabase &db, TdfGlobalMetadata *metadata)
{
    Err e = kNoErr;
    TdfGlobalMetadata result;

    QSqlQuery q = makeQuery(db, true);
    e = QEXEC_CMD(q, QStringLiteral("SELECT Key, Value FROM GlobalMetadata;")); ree;
    while (q.next()) {
        const QString key = q.value(0).toString();
        const QString value = q.value(1).toString();
        result.values.insert(key, value);

        if (key == QLatin1String("AcquisitionSoftware")) {
            result.acquisitionSoftware = value;
        } else if (key == QLatin1String("AcquisitionSoftwareVersion")) {
            result.acquisitionSoftwareVersion = value;
        } else if (key == QLatin1String("InstrumentFamily")) {
            result.instrumentFamily = value;
        } else if (key == QLatin1String("InstrumentRevision")) {
            result.instrumentRevision = value;
        } else if (key == QLatin1String("InstrumentSerialNumber")) {
            result.instrumentSerialNumber = value;
        } else if (key == QLatin1String("AcquisitionDateTime")) {
            result.acquisitionDateTime = value;
        } else if (key == QLatin1String("OperatorName")) {
            result.operatorName = value;
        } else if (key == QLatin1String("MzAcqRangeLower")) {
            result.mzAcqRangeLower = value.toDouble();
        } else if (key == QLatin1String("MzAcqRangeUpper")) {
            result.mzAcqRangeUpper = value.toDouble();
        }
    }

    *metadata = result;
    return e;
}

Err readFrameCounts(const QSqlDatabase &db, QMap<QString, int> *counts)
{
    Err e = kNoErr;
    QMap<QString, int> result;

    QSqlQuery q = makeQuery(db, true);
    e = QEXEC_CMD(q, QStringLiteral("SELECT MsMsType, COUNT(*) FROM Frames GROUP BY MsMsType;")); ree;
    int total = 0;
    while (q.next()) {
        const int count = q.value(1).toInt();
        result[msMsTypeLabel(q.value(0).toInt())] += count;
        total += count;
    }
    result.insert(QStringLiteral("Total"), total);

    counts->swap(result);
    return e;
}

_TDF_END
