/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#include "TdfSpectrumAssembler.h"
#include "tdf_reader_debug.h"
#include "vendor/TimsData.h"

#include "boost/exception/diagnostic_information.hpp"

#include <algorithm>

_TDF_BEGIN

TdfSpectrumAssembler::TdfSpectrumAssembler(TimsData *timsData, const ScanMergingOptions &options)
    : m_timsData(timsData)
    , m_options(options)
{
}

Err TdfSpectrumAssembler::readSpectrum(qlonglong frameId, int scanBegin, int scanEnd,
                                       point2dList *points) const
{
    if (scanBegin < 0 || scanEnd < scanBegin) {
        warningTdf() << "bad scan range [" << scanBegin << "," << scanEnd << ") for frame"
                     << frameId;
        rrr(kBadParameterError);
    }

    point2dList result;
    try {
        FrameProxy frame;
        m_timsData->readScans(frameId, uint32_t(scanBegin), uint32_t(scanEnd), &frame);

        std::vector<double> indices;
        std::vector<double> intensities;
        indices.reserve(frame.getTotalNbrPeaks());
        intensities.reserve(frame.getTotalNbrPeaks());
        for (size_t scan = 0; scan < frame.getNbrScans(); ++scan) {
            if (frame.getNbrPeaks(scan) == 0) {
                continue;
            }
            const auto xAxis = frame.getScanX(scan);
            const auto yAxis = frame.getScanY(scan);
            indices.insert(indices.end(), xAxis.begin(), xAxis.end());
            intensities.insert(intensities.end(), yAxis.begin(), yAxis.end());
        }

        std::vector<double> mzs;
        m_timsData->indexToMz(frameId, indices, mzs);

        result.reserve(mzs.size());
        for (size_t i = 0; i < mzs.size(); ++i) {
            result.push_back(point2d(mzs[i], intensities[i]));
        }
    } catch (const TimsException &ex) {
        warningTdf() << "reading frame" << frameId << "scans [" << scanBegin << "," << scanEnd
                     << ") failed:" << boost::diagnostic_information(ex).c_str();
        rrr(ex.code());
    }

    points->swap(result);
    return kNoErr;
}

Err TdfSpectrumAssembler::getScanData(const TdfScanRef &ref, point2dList *points) const
{
    Err e = kNoErr;
    if (!ref.isCombined()) {
        e = ref.validate(); ree;
        return readSpectrum(ref.frameId(), ref.startScan(), ref.endScan(), points);
    }

    point2dList sorted;
    e = readSortedSpectrum(ref, &sorted); ree;

    const PeakPicker picker(m_options.minIntensity);
    const FittedPeakList peaks = picker.pickPeaks(sorted);
    point2dList profile = PeakPicker::reprofile(peaks, m_options.dx, m_options.fwhm);
    debugTdf() << ref.nativeId() << ":" << sorted.size() << "points," << peaks.size()
               << "centroids," << profile.size() << "profile points";

    points->swap(profile);
    return e;
}

Err TdfSpectrumAssembler::getCentroids(const TdfScanRef &ref, FittedPeakList *peaks) const
{
    Err e = kNoErr;
    point2dList sorted;
    e = readSortedSpectrum(ref, &sorted); ree;

    const PeakPicker picker(m_options.minIntensity);
    *peaks = picker.pickPeaks(sorted);
    return e;
}

Err TdfSpectrumAssembler::readSortedSpectrum(const TdfScanRef &ref, point2dList *points) const
{
    Err e = ref.validate(); ree;
    point2dList result;
    e = readSpectrum(ref.frameId(), ref.startScan(), ref.endScan(), &result); ree;
    std::stable_sort(result.begin(), result.end(), point2d_less_x);

    // mobility scans hitting the same TOF index add up to one point
    point2dList summed;
    summed.reserve(result.size());
    for (const point2d &p : result) {
        if (!summed.empty() && summed.back().x() == p.x()) {
            summed.back().ry() += p.y();
        } else {
            summed.push_back(p);
        }
    }
    points->swap(summed);
    return e;
}

_TDF_END
