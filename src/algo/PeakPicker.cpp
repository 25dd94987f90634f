/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#include "PeakPicker.h"

#include <algorithm>
#include <cmath>

_TDF_BEGIN

// fwhm = 2 * sqrt(2 * ln 2) * sigma
static const double FWHM_TO_SIGMA = 1.0 / 2.3548200450309493;
static const double SIGMA_SPAN = 3.0;

namespace {

double halfHeightCrossing(const point2d &inside, const point2d &outside, double half)
{
    const double dy = inside.y() - outside.y();
    if (dy == 0) {
        return outside.x();
    }
    return outside.x() + (half - outside.y()) / dy * (inside.x() - outside.x());
}

}

PeakPicker::PeakPicker(double minIntensity)
    : m_minIntensity(minIntensity)
{
}

FittedPeakList PeakPicker::pickPeaks(const point2dList &sortedPoints) const
{
    FittedPeakList peaks;
    const int n = static_cast<int>(sortedPoints.size());

    int i = 0;
    while (i < n) {
        const double y = sortedPoints[i].y();
        // a plateau of equal intensities counts as one apex
        int plateauEnd = i;
        while (plateauEnd + 1 < n && sortedPoints[plateauEnd + 1].y() == y) {
            ++plateauEnd;
        }

        const bool risesLeft = i == 0 || sortedPoints[i - 1].y() < y;
        const bool fallsRight = plateauEnd == n - 1 || sortedPoints[plateauEnd + 1].y() < y;
        if (!(y > 0 && y > m_minIntensity && risesLeft && fallsRight)) {
            i = plateauEnd + 1;
            continue;
        }

        int left = i;
        while (left > 0 && sortedPoints[left - 1].y() > 0
               && sortedPoints[left - 1].y() <= sortedPoints[left].y()) {
            --left;
        }
        int right = plateauEnd;
        while (right + 1 < n && sortedPoints[right + 1].y() > 0
               && sortedPoints[right + 1].y() <= sortedPoints[right].y()) {
            ++right;
        }

        FittedPeak peak;
        double weightedMz = 0;
        for (int k = left; k <= right; ++k) {
            weightedMz += sortedPoints[k].x() * sortedPoints[k].y();
            peak.area += sortedPoints[k].y();
        }
        peak.mz = weightedMz / peak.area;
        peak.intensity = y;

        const double half = y / 2;
        int l = i;
        while (l > left && sortedPoints[l - 1].y() > half) {
            --l;
        }
        int r = plateauEnd;
        while (r < right && sortedPoints[r + 1].y() > half) {
            ++r;
        }
        const bool hasLeft = l > 0 && sortedPoints[l - 1].y() <= half;
        const bool hasRight = r < n - 1 && sortedPoints[r + 1].y() <= half;
        if (hasLeft && hasRight) {
            peak.fwhm = halfHeightCrossing(sortedPoints[r], sortedPoints[r + 1], half)
                - halfHeightCrossing(sortedPoints[l], sortedPoints[l - 1], half);
        } else if (hasLeft) {
            peak.fwhm = 2 * (peak.mz - halfHeightCrossing(sortedPoints[l], sortedPoints[l - 1], half));
        } else if (hasRight) {
            peak.fwhm = 2 * (halfHeightCrossing(sortedPoints[r], sortedPoints[r + 1], half) - peak.mz);
        }
        if (peak.fwhm < 0) {
            peak.fwhm = 0;
        }

        peaks.push_back(peak);
        i = plateauEnd + 1;
    }

    return peaks;
}

double PeakPicker::gaussianValue(double mean, double sigma, double x)
{
    if (sigma <= 0) { // dirac delta condition
        return x == mean ? 1 : 0;
    }
    const double term = x - mean;
    return std::exp(-term * term / (2 * sigma * sigma));
}

point2dList PeakPicker::reprofile(const FittedPeakList &peaks, double dx, double fwhm)
{
    point2dList profile;
    if (peaks.empty()) {
        return profile;
    }
    if (!(dx > 0) || !(fwhm > 0)) {
        profile.reserve(peaks.size());
        for (const FittedPeak &peak : peaks) {
            profile.push_back(point2d(peak.mz, peak.intensity));
        }
        std::sort(profile.begin(), profile.end(), point2d_less_x);
        return profile;
    }

    const double sigma = fwhm * FWHM_TO_SIGMA;
    const double span = SIGMA_SPAN * sigma;

    std::vector<double> grid;
    for (const FittedPeak &peak : peaks) {
        const long long first = static_cast<long long>(std::ceil((peak.mz - span) / dx));
        const long long last = static_cast<long long>(std::floor((peak.mz + span) / dx));
        for (long long k = first; k <= last; ++k) {
            grid.push_back(k * dx);
        }
        grid.push_back(peak.mz);
    }
    std::sort(grid.begin(), grid.end());
    grid.erase(std::unique(grid.begin(), grid.end()), grid.end());

    std::vector<double> intensities(grid.size(), 0.0);
    for (const FittedPeak &peak : peaks) {
        auto it = std::lower_bound(grid.begin(), grid.end(), peak.mz - span);
        for (; it != grid.end() && *it <= peak.mz + span; ++it) {
            intensities[it - grid.begin()] += peak.intensity * gaussianValue(peak.mz, sigma, *it);
        }
    }

    profile.reserve(grid.size());
    for (size_t k = 0; k < grid.size(); ++k) {
        profile.push_back(point2d(grid[k], intensities[k]));
    }
    return profile;
}

_TDF_END
