/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#ifndef TDF_READER_TYPES_H
#define TDF_READER_TYPES_H

#include "tdf_core_defs.h"

#include <QDebug>
#include <QPointF>
#include <QString>

#include <vector>

_TDF_BEGIN

//! (m/z, intensity)
typedef QPointF point2d;
typedef std::vector<point2d> point2dList;

inline bool point2d_less_x(const point2d &p1, const point2d &p2)
{
    return p1.x() < p2.x();
}

//Do not change the order of these values, they are printed by tdf-scan
enum PeakPickingMode
{
    PeakPickingModeUnknown = 0,
    PeakPickingProfile,
    PeakPickingCentroid
};

enum DissociationMethod
{
    DissociationUnknown = 0,
    DissociationCID,
    DissociationInSourceCID
};

TDF_READER_EXPORT QString dissociationMethodName(DissociationMethod method);

/*
 * \brief MobilityData contains the ion mobility (1/K0) of a scan
 */
class TDF_READER_EXPORT MobilityData
{
public:
    MobilityData();

    void setMobilityValue(double mobility) { m_mobility = mobility; }
    double mobilityValue() const { return m_mobility; }

    bool isValid() const;

private:
    double m_mobility;
};

struct TDF_READER_EXPORT ScanInfo
{
    QString nativeId;
    int scanLevel;
    //! +1, -1, or 0 when the frame records no polarity
    int polarity;
    double retTimeSeconds;
    double retTimeMinutes;
    //! position of the first scan of the reference among all mobility scans of the run
    qlonglong scanIndex;
    PeakPickingMode peakMode;
    MobilityData mobility;

    ScanInfo();

    void clear();
};

struct TDF_READER_EXPORT IsolationWindow
{
    double targetMz;
    double lowerOffset;
    double upperOffset;

    IsolationWindow();

    double lowerBound() const { return targetMz - lowerOffset; }
    double upperBound() const { return targetMz + upperOffset; }

    void clear();
};

struct TDF_READER_EXPORT ActivationInfo
{
    DissociationMethod method;
    double collisionEnergy;
    bool hasCollisionEnergy;

    ActivationInfo();

    void clear();
};

struct TDF_READER_EXPORT PrecursorInfo
{
    //! monoisotopic m/z, or the isolation m/z when the monoisotopic peak was not determined
    double dMz;
    double dIsolationMass;
    double dMonoIsoMass;
    double dIntensity;
    long nChargeState;
    double lowerWindowOffset;
    double upperWindowOffset;
    MobilityData mobility;

    /// This refers to the parent native id
    QString nativeId;
    QString productNativeId;

    PrecursorInfo();

    void clear();
    bool isValid() const;
};

inline QDebug operator<<(QDebug dbg, const ScanInfo &c)
{
    dbg.nospace() << "(rt=" << c.retTimeMinutes << ",l=" << c.scanLevel << ",id=" << c.nativeId
                  << ",m=" << c.peakMode << ",idx=" << c.scanIndex << ")";

    return dbg.space();
}

_TDF_END

#endif // TDF_READER_TYPES_H
