/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#ifndef TDF_FRAME_H
#define TDF_FRAME_H

#include "tdf_core_defs.h"

#include <QSharedPointer>
#include <QString>
#include <QVariantMap>

#include <vector>

_TDF_BEGIN

//! Frames.MsMsType values
enum MsMsType {
    MsMsTypeMs1 = 0,
    MsMsTypeMs2 = 2,
    MsMsTypePasefMs2 = 8,
    MsMsTypeDiaPasef = 9
};

//! Label used in frame summaries, e.g. "PASEF MS2 Scan"; unknown codes give "MsMsType <code>"
TDF_READER_EXPORT QString msMsTypeLabel(int msmsType);

/*!
 * \brief One precursor selection window of a PASEF frame
 *
 * Row of PasefFrameMsMsInfo joined with its Precursors row. The mobility scan range
 * [startScan, endScan) is half-open and frame local.
 */
struct TDF_READER_EXPORT PasefPrecursorInfo
{
    qlonglong frameId = 0;
    int startScan = 0;
    int endScan = 0;
    double isolationMz = 0.0;
    double isolationWidth = 0.0;
    double collisionEnergy = 0.0;
    double monoisotopicMz = 0.0;
    bool hasMonoisotopicMz = false; //< Precursors.MonoisotopicMz is NULL for undetermined ions
    int charge = 0; //< 0 if unknown
    double averageScanNumber = 0.0; //< Precursors.ScanNumber, fractional
    double intensity = 0.0;
    qlonglong parentFrameId = 0; //< MS1 frame the precursor was selected from

    bool containsScan(int scan) const { return startScan <= scan && scan < endScan; }

    //! true if [startScan, endScan) and [begin, end) share at least one scan
    bool overlaps(int begin, int end) const { return startScan < end && begin < endScan; }

    static PasefPrecursorInfo fromRecord(const QVariantMap &row);

    bool operator==(const PasefPrecursorInfo &other) const;
};

typedef std::vector<PasefPrecursorInfo> PasefPrecursorList;

/*!
 * \brief One acquisition cycle (row of the Frames table)
 *
 * Frames are immutable once loaded by TdfFrameRepository and shared through TdfFramePtr.
 */
struct TDF_READER_EXPORT TdfFrame
{
    qlonglong id = 0;
    int msmsType = MsMsTypeMs1;
    QString polarity;
    int scanMode = 0;
    int numScans = 0;
    int numPeaks = 0;
    int mzCalibration = 0;
    int timsCalibration = 0;
    qlonglong timsId = 0;
    int propertyGroup = 0;
    double summedIntensities = 0.0;
    double maxIntensity = 0.0;
    double time = 0.0; //< seconds
    double t1 = 0.0;
    double t2 = 0.0;
    double accumulationTime = 0.0;
    double rampTime = 0.0;

    //! ordered by startScan; only filled for MsMsTypePasefMs2 frames
    PasefPrecursorList pasefPrecursors;

    //! MS1 frames are level 1, every fragmentation type is level 2
    int msLevel() const { return msmsType == MsMsTypeMs1 ? 1 : 2; }

    //! +1 for "+", -1 for "-", 0 if not recorded
    int polarityValue() const;

    bool isPasef() const { return msmsType == MsMsTypePasefMs2; }

    //! Fills @a frame from a "SELECT * FROM Frames" row
    static Err fromRecord(const QVariantMap &row, TdfFrame *frame);

    bool operator==(const TdfFrame &other) const;
};

typedef QSharedPointer<const TdfFrame> TdfFramePtr;

_TDF_END

#endif // TDF_FRAME_H
