/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#include "TdfFrame.h"
#include "tdf_reader_debug.h"

_TDF_BEGIN

QString msMsTypeLabel(int msmsType)
{
    switch (msmsType) {
    case MsMsTypeMs1:
        return QStringLiteral("MS1 Scan");
    case MsMsTypeMs2:
        return QStringLiteral("MS2 Scan");
    case MsMsTypePasefMs2:
        return QStringLiteral("PASEF MS2 Scan");
    case MsMsTypeDiaPasef:
        return QStringLiteral("DIA-PASEF");
    default:
        return QStringLiteral("MsMsType %1").arg(msmsType);
    }
}

PasefPrecursorInfo PasefPrecursorInfo::fromRecord(const QVariantMap &row)
{
    PasefPrecursorInfo info;
    info.frameId = row.value(QStringLiteral("Frame")).toLongLong();
    info.startScan = row.value(QStringLiteral("ScanNumBegin")).toInt();
    info.endScan = row.value(QStringLiteral("ScanNumEnd")).toInt();
    info.isolationMz = row.value(QStringLiteral("IsolationMz")).toDouble();
    info.isolationWidth = row.value(QStringLiteral("IsolationWidth")).toDouble();
    info.collisionEnergy = row.value(QStringLiteral("CollisionEnergy")).toDouble();

    const QVariant mono = row.value(QStringLiteral("MonoisotopicMz"));
    info.hasMonoisotopicMz = mono.isValid() && !mono.isNull();
    info.monoisotopicMz = info.hasMonoisotopicMz ? mono.toDouble() : 0.0;

    info.charge = row.value(QStringLiteral("Charge")).toInt();
    info.averageScanNumber = row.value(QStringLiteral("ScanNumber")).toDouble();
    info.intensity = row.value(QStringLiteral("Intensity")).toDouble();
    info.parentFrameId = row.value(QStringLiteral("Parent")).toLongLong();
    return info;
}

bool PasefPrecursorInfo::operator==(const PasefPrecursorInfo &other) const
{
    return frameId == other.frameId && startScan == other.startScan && endScan == other.endScan
        && isolationMz == other.isolationMz && isolationWidth == other.isolationWidth
        && collisionEnergy == other.collisionEnergy && monoisotopicMz == other.monoisotopicMz
        && hasMonoisotopicMz == other.hasMonoisotopicMz && charge == other.charge
        && averageScanNumber == other.averageScanNumber && intensity == other.intensity
        && parentFrameId == other.parentFrameId;
}

int TdfFrame::polarityValue() const
{
    if (polarity == QLatin1String("+")) {
        return 1;
    }
    if (polarity == QLatin1String("-")) {
        return -1;
    }
    return 0;
}

Err TdfFrame::fromRecord(const QVariantMap &row, TdfFrame *frame)
{
    bool okId = false;
    bool okType = false;
    bool okScans = false;
    const qlonglong id = row.value(QStringLiteral("Id")).toLongLong(&okId);
    const int msmsType = row.value(QStringLiteral("MsMsType")).toInt(&okType);
    const int numScans = row.value(QStringLiteral("NumScans")).toInt(&okScans);
    if (!okId || !okType || !okScans) {
        warningTdf() << "Frames row lacks Id, MsMsType or NumScans:" << row;
        return kSqlError;
    }

    TdfFrame result;
    result.id = id;
    result.msmsType = msmsType;
    result.numScans = numScans;
    result.polarity = row.value(QStringLiteral("Polarity")).toString();
    result.scanMode = row.value(QStringLiteral("ScanMode")).toInt();
    result.numPeaks = row.value(QStringLiteral("NumPeaks")).toInt();
    result.mzCalibration = row.value(QStringLiteral("MzCalibration")).toInt();
    result.timsCalibration = row.value(QStringLiteral("TimsCalibration")).toInt();
    result.timsId = row.value(QStringLiteral("TimsId")).toLongLong();
    result.propertyGroup = row.value(QStringLiteral("PropertyGroup")).toInt();
    result.summedIntensities = row.value(QStringLiteral("SummedIntensities")).toDouble();
    result.maxIntensity = row.value(QStringLiteral("MaxIntensity")).toDouble();
    result.time = row.value(QStringLiteral("Time")).toDouble();
    result.t1 = row.value(QStringLiteral("T1")).toDouble();
    result.t2 = row.value(QStringLiteral("T2")).toDouble();
    result.accumulationTime = row.value(QStringLiteral("AccumulationTime")).toDouble();
    result.rampTime = row.value(QStringLiteral("RampTime")).toDouble();

    *frame = result;
    return kNoErr;
}

bool TdfFrame::operator==(const TdfFrame &other) const
{
    return id == other.id && msmsType == other.msmsType && polarity == other.polarity
        && scanMode == other.scanMode && numScans == other.numScans
        && numPeaks == other.numPeaks && mzCalibration == other.mzCalibration
        && timsCalibration == other.timsCalibration && timsId == other.timsId
        && propertyGroup == other.propertyGroup
        && summedIntensities == other.summedIntensities && maxIntensity == other.maxIntensity
        && time == other.time && t1 == other.t1 && t2 == other.t2
        && accumulationTime == other.accumulationTime && rampTime == other.rampTime
        && pasefPrecursors == other.pasefPrecursors;
}

_TDF_END
