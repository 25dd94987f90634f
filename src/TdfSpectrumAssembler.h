/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#ifndef TDF_SPECTRUM_ASSEMBLER_H
#define TDF_SPECTRUM_ASSEMBLER_H

#include "TdfReaderOptions.h"
#include "TdfScanRef.h"
#include "algo/PeakPicker.h"

_TDF_BEGIN

class TimsData;

/*!
 * \brief Turns decoded mobility scans into (m/z, intensity) spectra
 *
 * A single scan is returned as decoded, in buffer order. A combined range is sorted by m/z,
 * summed where several scans share an m/z, centroided and reprofiled with the configured fwhm
 * on a grid of spacing dx.
 *
 * TimsException thrown by the decoder is logged and returned as its Err code.
 */
class TDF_READER_EXPORT TdfSpectrumAssembler
{
public:
    TdfSpectrumAssembler(TimsData *timsData, const ScanMergingOptions &options);

    const ScanMergingOptions &options() const { return m_options; }
    void setOptions(const ScanMergingOptions &options) { m_options = options; }

    //! All peaks of scans [scanBegin, scanEnd) of a frame, concatenated in scan order; indices
    //! are converted to m/z with one conversion call for the whole range
    Err readSpectrum(qlonglong frameId, int scanBegin, int scanEnd, point2dList *points) const;

    //! Profile for combined references, raw decoded peaks otherwise
    Err getScanData(const TdfScanRef &ref, point2dList *points) const;

    //! Sorted, summed at equal m/z and centroided, never reprofiled
    Err getCentroids(const TdfScanRef &ref, FittedPeakList *peaks) const;

private:
    Err readSortedSpectrum(const TdfScanRef &ref, point2dList *points) const;

    TimsData *m_timsData;
    ScanMergingOptions m_options;
};

_TDF_END

#endif // TDF_SPECTRUM_ASSEMBLER_H
