/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#include <algo/PeakPicker.h>

#include <QtTest>

#include <algorithm>
#include <cmath>

_TDF_BEGIN

static void addGaussian(double center, double height, double sigma, point2dList *points)
{
    for (int i = -10; i <= 10; ++i) {
        const double x = center + i * 0.002;
        points->push_back(point2d(x, height * std::exp(-(x - center) * (x - center) / (2 * sigma * sigma))));
    }
}

class PeakPickerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testEmpty();
    void testSingleGaussian();
    void testTwoSeparatedPeaks();
    void testMinIntensity();
    void testPlateauIsOnePeak();
    void testSparseSticks();
    void testReprofileSortedAndDense();
    void testReprofileShape();
    void testReprofileSumsOverlaps();
    void testReprofileWithoutGridReturnsSticks();
};

void PeakPickerTest::testEmpty()
{
    PeakPicker picker;
    QVERIFY(picker.pickPeaks(point2dList()).empty());
    QVERIFY(PeakPicker::reprofile(FittedPeakList(), 0.001, 0.04).empty());
}

void PeakPickerTest::testSingleGaussian()
{
    point2dList points;
    addGaussian(500.0, 1000.0, 0.005, &points);

    const FittedPeakList peaks = PeakPicker().pickPeaks(points);
    QCOMPARE(peaks.size(), size_t(1));
    QVERIFY(std::fabs(peaks[0].mz - 500.0) < 1e-6);
    QCOMPARE(peaks[0].intensity, 1000.0);
    // fwhm of a gaussian is 2.3548 sigma; linear interpolation overestimates a little
    QVERIFY(peaks[0].fwhm > 0.010);
    QVERIFY(peaks[0].fwhm < 0.013);
    QVERIFY(peaks[0].area > 1000.0);
}

void PeakPickerTest::testTwoSeparatedPeaks()
{
    point2dList points;
    addGaussian(400.0, 500.0, 0.005, &points);
    points.push_back(point2d(400.5, 0));
    addGaussian(401.0, 800.0, 0.005, &points);

    const FittedPeakList peaks = PeakPicker().pickPeaks(points);
    QCOMPARE(peaks.size(), size_t(2));
    QVERIFY(std::fabs(peaks[0].mz - 400.0) < 1e-6);
    QVERIFY(std::fabs(peaks[1].mz - 401.0) < 1e-6);
    QCOMPARE(peaks[0].intensity, 500.0);
    QCOMPARE(peaks[1].intensity, 800.0);
}

void PeakPickerTest::testMinIntensity()
{
    point2dList points;
    addGaussian(400.0, 50.0, 0.005, &points);
    points.push_back(point2d(400.5, 0));
    addGaussian(401.0, 800.0, 0.005, &points);

    const FittedPeakList peaks = PeakPicker(100.0).pickPeaks(points);
    QCOMPARE(peaks.size(), size_t(1));
    QCOMPARE(peaks[0].intensity, 800.0);
}

void PeakPickerTest::testPlateauIsOnePeak()
{
    point2dList points;
    points.push_back(point2d(100.00, 0));
    points.push_back(point2d(100.01, 10));
    points.push_back(point2d(100.02, 20));
    points.push_back(point2d(100.03, 20));
    points.push_back(point2d(100.04, 10));
    points.push_back(point2d(100.05, 0));

    const FittedPeakList peaks = PeakPicker().pickPeaks(points);
    QCOMPARE(peaks.size(), size_t(1));
    QVERIFY(std::fabs(peaks[0].mz - 100.025) < 1e-9);
    QCOMPARE(peaks[0].intensity, 20.0);
    QCOMPARE(peaks[0].area, 60.0);
}

void PeakPickerTest::testSparseSticks()
{
    // isolated points, as a single mobility scan delivers them
    point2dList points;
    points.push_back(point2d(200.0, 10));
    points.push_back(point2d(300.0, 30));
    points.push_back(point2d(400.0, 20));

    const FittedPeakList peaks = PeakPicker().pickPeaks(points);
    // 200 and 400 lie on the flanks of 300 and belong to its region
    QCOMPARE(peaks.size(), size_t(1));
    QCOMPARE(peaks[0].intensity, 30.0);
}

void PeakPickerTest::testReprofileSortedAndDense()
{
    FittedPeakList peaks(3);
    peaks[0].mz = 300.0;
    peaks[0].intensity = 100.0;
    peaks[1].mz = 300.01;
    peaks[1].intensity = 50.0;
    peaks[2].mz = 250.0;
    peaks[2].intensity = 10.0;

    const point2dList profile = PeakPicker::reprofile(peaks, 0.001, 0.04);
    QVERIFY(profile.size() >= peaks.size());
    QVERIFY(std::is_sorted(profile.begin(), profile.end(), point2d_less_x));
    for (size_t i = 1; i < profile.size(); ++i) {
        QVERIFY(profile[i - 1].x() < profile[i].x());
    }
}

void PeakPickerTest::testReprofileShape()
{
    FittedPeakList peaks(1);
    peaks[0].mz = 500.0;
    peaks[0].intensity = 200.0;

    const double fwhm = 0.04;
    const double sigma = fwhm / 2.3548200450309493;
    const point2dList profile = PeakPicker::reprofile(peaks, 0.001, fwhm);

    // grid points within 3 sigma plus the centroid itself
    QVERIFY(profile.size() > 100);
    QVERIFY(profile.front().x() >= peaks[0].mz - 3 * sigma - 1e-9);
    QVERIFY(profile.back().x() <= peaks[0].mz + 3 * sigma + 1e-9);

    const auto apex = std::max_element(profile.begin(), profile.end(),
                                       [](const point2d &a, const point2d &b) { return a.y() < b.y(); });
    QCOMPARE(apex->x(), peaks[0].mz);
    QCOMPARE(apex->y(), 200.0);

    // half height one half fwhm away from the center
    int checked = 0;
    for (const point2d &p : profile) {
        if (std::fabs(std::fabs(p.x() - peaks[0].mz) - fwhm / 2) < 1e-9) {
            QVERIFY(std::fabs(p.y() - 100.0) < 1e-6);
            ++checked;
        }
    }
    QCOMPARE(checked, 2);
}

void PeakPickerTest::testReprofileSumsOverlaps()
{
    FittedPeakList peaks(2);
    peaks[0].mz = 600.0;
    peaks[0].intensity = 100.0;
    peaks[1].mz = 600.0;
    peaks[1].intensity = 100.0;

    const point2dList profile = PeakPicker::reprofile(peaks, 0.001, 0.04);
    double maxY = 0;
    for (const point2d &p : profile) {
        maxY = std::max(maxY, p.y());
    }
    QCOMPARE(maxY, 200.0);
}

void PeakPickerTest::testReprofileWithoutGridReturnsSticks()
{
    FittedPeakList peaks(2);
    peaks[0].mz = 700.0;
    peaks[0].intensity = 1.0;
    peaks[1].mz = 650.0;
    peaks[1].intensity = 2.0;

    const point2dList sticks = PeakPicker::reprofile(peaks, 0.0, 0.04);
    QCOMPARE(sticks.size(), size_t(2));
    QCOMPARE(sticks[0], point2d(650.0, 2.0));
    QCOMPARE(sticks[1], point2d(700.0, 1.0));
}

_TDF_END

QTEST_APPLESS_MAIN(tdf::PeakPickerTest)

#include "PeakPickerTest.moc"
