/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#ifndef PEAK_PICKER_H
#define PEAK_PICKER_H

#include "TdfReaderTypes.h"

_TDF_BEGIN

//! One centroided peak
struct TDF_READER_EXPORT FittedPeak
{
    double mz = 0.0;
    double intensity = 0.0; //< apex height
    double fwhm = 0.0;      //< 0 if no half-height crossing was found on either side
    double area = 0.0;      //< summed intensity of the peak region
};

typedef std::vector<FittedPeak> FittedPeakList;

/*!
 * \brief Centroids sorted profile data and renders centroids back into a profile
 *
 * Peaks are local maxima of the intensity. A peak region extends from the apex down both
 * flanks while the intensity keeps decreasing and stays above zero; the centroid m/z is the
 * intensity weighted mean over that region.
 */
class TDF_READER_EXPORT PeakPicker
{
public:
    explicit PeakPicker(double minIntensity = 0.0);

    //! @a sortedPoints must be sorted by m/z; the result is sorted by m/z
    FittedPeakList pickPeaks(const point2dList &sortedPoints) const;

    /*!
     * \brief Sum of one Gaussian per peak, each of full width at half maximum @a fwhm
     *
     * Sampled on the grid k * @a dx within +/-3 sigma of every peak, plus the centroid m/z of
     * every peak, so the output holds at least as many points as @a peaks. Sorted by m/z.
     * Non-positive @a fwhm or @a dx returns the centroids as sticks.
     */
    static point2dList reprofile(const FittedPeakList &peaks, double dx, double fwhm);

    static double gaussianValue(double mean, double sigma, double x);

private:
    double m_minIntensity;
};

_TDF_END

#endif // PEAK_PICKER_H
