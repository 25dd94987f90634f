/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#include "TdfReaderTypes.h"

_TDF_BEGIN

//Hiding this in cpp to avoid using this outside of this file.
const double INVALID_MOBILITY_VALUE = -1.0;

QString dissociationMethodName(DissociationMethod method)
{
    switch (method) {
    case DissociationCID:
        return QStringLiteral("collision-induced dissociation");
    case DissociationInSourceCID:
        return QStringLiteral("in-source collision-induced dissociation");
    default:
        return QStringLiteral("unknown");
    }
}

MobilityData::MobilityData()
    : m_mobility(INVALID_MOBILITY_VALUE)
{
}

bool MobilityData::isValid() const
{
    return m_mobility != INVALID_MOBILITY_VALUE;
}

ScanInfo::ScanInfo()
{
    clear();
}

void ScanInfo::clear()
{
    nativeId.clear();
    scanLevel = 0;
    polarity = 0;
    retTimeSeconds = 0;
    retTimeMinutes = 0;
    scanIndex = -1;
    peakMode = PeakPickingModeUnknown;
    mobility = MobilityData();
}

IsolationWindow::IsolationWindow()
{
    clear();
}

void IsolationWindow::clear()
{
    targetMz = 0;
    lowerOffset = 0;
    upperOffset = 0;
}

ActivationInfo::ActivationInfo()
{
    clear();
}

void ActivationInfo::clear()
{
    method = DissociationUnknown;
    collisionEnergy = 0;
    hasCollisionEnergy = false;
}

PrecursorInfo::PrecursorInfo()
{
    clear();
}

void PrecursorInfo::clear()
{
    dMz = 0;
    dIsolationMass = 0;
    dMonoIsoMass = 0;
    dIntensity = 0;
    nChargeState = 0;
    lowerWindowOffset = 0;
    upperWindowOffset = 0;
    mobility = MobilityData();
    nativeId.clear();
    productNativeId.clear();
}

bool PrecursorInfo::isValid() const
{
    return !nativeId.isEmpty() && dMz > 0;
}

_TDF_END
