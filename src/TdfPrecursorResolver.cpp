/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#include "TdfPrecursorResolver.h"
#include "TdfFrameRepository.h"
#include "tdf_reader_debug.h"
#include "vendor/TimsData.h"

#include "boost/exception/diagnostic_information.hpp"

#include <cmath>
#include <vector>

_TDF_BEGIN

void ResolvedPrecursor::clear()
{
    *this = ResolvedPrecursor();
}

TdfPrecursorResolver::TdfPrecursorResolver(TdfFrameRepository *repository, TimsData *timsData)
    : m_repository(repository)
    , m_timsData(timsData)
{
}

Err TdfPrecursorResolver::locatePrecursor(const TdfScanRef &ref, PasefPrecursorInfo *precursor,
                                          bool *found)
{
    *found = false;
    if (ref.isNull() || !ref.frame()->isPasef()) {
        return kNoErr;
    }
    const PasefPrecursorList &candidates = ref.frame()->pasefPrecursors;

    if (!ref.isCombined()) {
        const int scan = ref.startScan();
        for (const PasefPrecursorInfo &candidate : candidates) {
            if (candidate.containsScan(scan)) {
                *precursor = candidate;
                *found = true;
                return kNoErr;
            }
        }
        return kNoErr;
    }

    const PasefPrecursorInfo *match = nullptr;
    int matches = 0;
    for (const PasefPrecursorInfo &candidate : candidates) {
        if (candidate.overlaps(ref.startScan(), ref.endScan())) {
            if (match == nullptr) {
                match = &candidate;
            }
            ++matches;
        }
    }

    if (matches > 1) {
        warningTdf() << matches << "precursors found for scan interval" << ref.nativeId();
        rrr(kAmbiguousPrecursorMatch);
    }
    if (match) {
        *precursor = *match;
        *found = true;
    }
    return kNoErr;
}

Err TdfPrecursorResolver::resolve(const TdfScanRef &ref, ResolvedPrecursor *resolved,
                                  bool *found) const
{
    Err e = kNoErr;
    PasefPrecursorInfo precursor;
    bool located = false;
    e = locatePrecursor(ref, &precursor, &located); ree;
    if (!located) {
        *found = false;
        return e;
    }

    ResolvedPrecursor result;
    result.precursor = precursor;
    result.isolationTargetMz = precursor.isolationMz;
    result.lowerWindowOffset = precursor.isolationWidth / 2;
    result.upperWindowOffset = precursor.isolationWidth / 2;

    e = inverseMobility(ref, precursor, &result.inverseMobility); ree;

    TdfFramePtr parent;
    e = m_repository->getFrame(precursor.parentFrameId, &parent); ree;
    // the precursor window always keeps its explicit end, even when it is one scan wide
    result.precursorNativeId = QStringLiteral("frame=%1 startScan=%2 endScan=%3")
                                   .arg(parent->id)
                                   .arg(precursor.startScan + 1)
                                   .arg(precursor.endScan + 1);
    result.productNativeId = ref.nativeId();

    *resolved = result;
    *found = true;
    return e;
}

Err TdfPrecursorResolver::inverseMobility(const TdfScanRef &ref,
                                          const PasefPrecursorInfo &precursor,
                                          double *value) const
{
    std::vector<double> scans;
    if (ref.isCombined()) {
        scans.push_back(std::ceil(precursor.averageScanNumber));
    } else {
        scans.push_back(ref.startScan());
    }

    std::vector<double> oneOverK0;
    try {
        m_timsData->scanNumToOneOverK0(ref.frameId(), scans, oneOverK0);
    } catch (const TimsException &ex) {
        warningTdf() << "1/K0 conversion failed for" << ref.nativeId() << ":"
                     << boost::diagnostic_information(ex).c_str();
        rrr(ex.code());
    }

    if (oneOverK0.size() != scans.size()) {
        warningTdf() << "1/K0 conversion returned" << oneOverK0.size() << "values for"
                     << scans.size() << "scans";
        rrr(kServiceError);
    }
    *value = oneOverK0[0];
    return kNoErr;
}

_TDF_END
