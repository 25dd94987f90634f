/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#include "TdfTestUtils.h"

#include <TdfSpectrumAssembler.h>
#include <vendor/TimsData.h>

#include <QScopedPointer>
#include <QtTest>

#include <algorithm>
#include <cmath>

_TDF_BEGIN

using namespace TdfTestUtils;

static const qint64 FRAME_ID = 3;

class TdfSpectrumAssemblerTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void init();
    void cleanup();

    void testSingleScanKeepsBufferOrder();
    void testEmptyScanSkipsConversion();
    void testRangeIsOneConversionCall();
    void testCombinedScanIsSortedProfile();
    void testCentroids();
    void testCoincidentPointsAreSummed();
    void testMinIntensityDropsCentroids();
    void testBadRange();
    void testServiceErrorPropagates();
    void testConversionErrorPropagates();

private:
    TdfFramePtr makeFrame(qlonglong id) const;

    QSharedPointer<FakeTimsDataApi> m_api;
    QScopedPointer<TimsData> m_data;
};

void TdfSpectrumAssemblerTest::init()
{
    m_api.reset(new FakeTimsDataApi());
    m_api->frames.insert(FRAME_ID, makeScans(FIXTURE_NUM_SCANS));
    m_data.reset(new TimsData(m_api, "/data/sample.d"));
}

void TdfSpectrumAssemblerTest::cleanup()
{
    m_data.reset();
}

TdfFramePtr TdfSpectrumAssemblerTest::makeFrame(qlonglong id) const
{
    TdfFrame *frame = new TdfFrame();
    frame->id = id;
    frame->msmsType = MsMsTypeMs2;
    frame->numScans = FIXTURE_NUM_SCANS;
    return TdfFramePtr(frame);
}

void TdfSpectrumAssemblerTest::testSingleScanKeepsBufferOrder()
{
    TdfSpectrumAssembler assembler(m_data.data(), ScanMergingOptions::defaultValues());

    point2dList points;
    QCOMPARE(assembler.getScanData(TdfScanRef(makeFrame(FRAME_ID), 3), &points), kNoErr);

    // scan 3 holds three peaks at descending indices
    QCOMPARE(points.size(), size_t(3));
    const RawScan &raw = makeScans(FIXTURE_NUM_SCANS)[3];
    for (size_t i = 0; i < points.size(); ++i) {
        QCOMPARE(points[i].x(), FakeTimsDataApi::fakeIndexToMz(raw.indices[i]));
        QCOMPARE(points[i].y(), double(raw.intensities[i]));
    }
    QVERIFY(points[0].x() > points[1].x());
    QVERIFY(points[1].x() > points[2].x());
}

void TdfSpectrumAssemblerTest::testEmptyScanSkipsConversion()
{
    TdfSpectrumAssembler assembler(m_data.data(), ScanMergingOptions::defaultValues());

    point2dList points;
    points.push_back(point2d(1, 1));
    QCOMPARE(assembler.getScanData(TdfScanRef(makeFrame(FRAME_ID), 4), &points), kNoErr);
    QVERIFY(points.empty());
    QCOMPARE(m_api->convertCalls, 0);
}

void TdfSpectrumAssemblerTest::testRangeIsOneConversionCall()
{
    TdfSpectrumAssembler assembler(m_data.data(), ScanMergingOptions::defaultValues());

    point2dList points;
    QCOMPARE(assembler.readSpectrum(FRAME_ID, 0, FIXTURE_NUM_SCANS, &points), kNoErr);

    // 0 + 1 + 2 + 3 + 0 + 1 + 2 + 3 + 0 + 1 peaks
    QCOMPARE(points.size(), size_t(13));
    QCOMPARE(m_api->readCalls, 1);
    QCOMPARE(m_api->convertCalls, 1);
    QCOMPARE(m_api->conversions[0], TimsDataApi::IndexToMz);
    QCOMPARE(m_api->convertedCounts[0], uint32_t(13));

    // concatenated in scan order
    QCOMPARE(points.front().x(), FakeTimsDataApi::fakeIndexToMz(250001));
    QCOMPARE(points.front().y(), 200.0);
    QCOMPARE(points.back().x(), FakeTimsDataApi::fakeIndexToMz(250009));
}

void TdfSpectrumAssemblerTest::testCombinedScanIsSortedProfile()
{
    TdfSpectrumAssembler assembler(m_data.data(), ScanMergingOptions::defaultValues());
    const TdfScanRef ref(makeFrame(FRAME_ID), 0, FIXTURE_NUM_SCANS);
    QVERIFY(ref.isCombined());

    point2dList points;
    QCOMPARE(assembler.getScanData(ref, &points), kNoErr);
    QVERIFY(!points.empty());
    for (size_t i = 1; i < points.size(); ++i) {
        QVERIFY(points[i - 1].x() < points[i].x());
    }

    FittedPeakList peaks;
    QCOMPARE(assembler.getCentroids(ref, &peaks), kNoErr);
    QVERIFY(!peaks.empty());
    QVERIFY(points.size() >= peaks.size());

    // every centroid is a sample of the profile
    for (const FittedPeak &peak : peaks) {
        bool sampled = false;
        for (const point2d &p : points) {
            if (p.x() == peak.mz) {
                sampled = true;
                break;
            }
        }
        QVERIFY(sampled);
    }
}

void TdfSpectrumAssemblerTest::testCentroids()
{
    // one isolated peak per scan, same index, so the range collapses to one centroid
    RawScanList scans;
    for (int s = 0; s < FIXTURE_NUM_SCANS; ++s) {
        RawScan raw;
        raw.indices.push_back(300000);
        raw.intensities.push_back(10);
        scans.push_back(raw);
    }
    m_api->frames.insert(FRAME_ID, scans);
    TdfSpectrumAssembler assembler(m_data.data(), ScanMergingOptions::defaultValues());

    FittedPeakList peaks;
    QCOMPARE(assembler.getCentroids(TdfScanRef(makeFrame(FRAME_ID), 0, FIXTURE_NUM_SCANS),
                                    &peaks),
             kNoErr);
    QCOMPARE(peaks.size(), size_t(1));
    QCOMPARE(peaks[0].mz, FakeTimsDataApi::fakeIndexToMz(300000));
    QCOMPARE(peaks[0].intensity, 100.0);
    QCOMPARE(peaks[0].area, 100.0);
}

void TdfSpectrumAssemblerTest::testCoincidentPointsAreSummed()
{
    // three scans hit index 300000 with different heights, flanked by one point on each side
    const uint32_t indices[] = { 299999, 300000, 300000, 300000, 300001 };
    const uint32_t intensities[] = { 1, 5, 3, 5, 1 };
    RawScanList scans(FIXTURE_NUM_SCANS);
    for (int s = 0; s < 5; ++s) {
        scans[s].indices.push_back(indices[s]);
        scans[s].intensities.push_back(intensities[s]);
    }
    m_api->frames.insert(FRAME_ID, scans);
    TdfSpectrumAssembler assembler(m_data.data(), ScanMergingOptions::defaultValues());
    const TdfScanRef ref(makeFrame(FRAME_ID), 0, FIXTURE_NUM_SCANS);

    FittedPeakList peaks;
    QCOMPARE(assembler.getCentroids(ref, &peaks), kNoErr);
    QCOMPARE(peaks.size(), size_t(1));
    QCOMPARE(peaks[0].intensity, 13.0);
    QCOMPARE(peaks[0].area, 15.0);
    QVERIFY(std::fabs(peaks[0].mz - FakeTimsDataApi::fakeIndexToMz(300000)) < 1e-9);

    // the profile apex carries the summed height
    point2dList points;
    QCOMPARE(assembler.getScanData(ref, &points), kNoErr);
    double apex = 0;
    for (const point2d &p : points) {
        apex = std::max(apex, p.y());
    }
    QVERIFY(std::fabs(apex - 13.0) < 1e-6);
}

void TdfSpectrumAssemblerTest::testMinIntensityDropsCentroids()
{
    ScanMergingOptions options = ScanMergingOptions::defaultValues();
    options.minIntensity = 1e9;
    TdfSpectrumAssembler assembler(m_data.data(), options);
    QCOMPARE(assembler.options().minIntensity, 1e9);

    point2dList points;
    QCOMPARE(assembler.getScanData(TdfScanRef(makeFrame(FRAME_ID), 0, FIXTURE_NUM_SCANS),
                                   &points),
             kNoErr);
    QVERIFY(points.empty());

    assembler.setOptions(ScanMergingOptions::defaultValues());
    QCOMPARE(assembler.getScanData(TdfScanRef(makeFrame(FRAME_ID), 0, FIXTURE_NUM_SCANS),
                                   &points),
             kNoErr);
    QVERIFY(!points.empty());
}

void TdfSpectrumAssemblerTest::testBadRange()
{
    TdfSpectrumAssembler assembler(m_data.data(), ScanMergingOptions::defaultValues());

    point2dList points;
    QCOMPARE(assembler.getScanData(TdfScanRef(makeFrame(FRAME_ID), 5, 20), &points),
             kBadParameterError);
    QCOMPARE(assembler.getScanData(TdfScanRef(makeFrame(FRAME_ID), 10), &points),
             kBadParameterError);
    QCOMPARE(assembler.readSpectrum(FRAME_ID, 5, 2, &points), kBadParameterError);
    QCOMPARE(assembler.readSpectrum(FRAME_ID, -1, 2, &points), kBadParameterError);
    QCOMPARE(m_api->readCalls, 0);
}

void TdfSpectrumAssemblerTest::testServiceErrorPropagates()
{
    TdfSpectrumAssembler assembler(m_data.data(), ScanMergingOptions::defaultValues());

    point2dList points;
    points.push_back(point2d(1, 1));
    QCOMPARE(assembler.getScanData(TdfScanRef(makeFrame(99), 1), &points), kServiceError);
    // output untouched on failure
    QCOMPARE(points.size(), size_t(1));

    FittedPeakList peaks;
    QCOMPARE(assembler.getCentroids(TdfScanRef(makeFrame(99), 0, 5), &peaks), kServiceError);
}

void TdfSpectrumAssemblerTest::testConversionErrorPropagates()
{
    m_api->failConversion = true;
    TdfSpectrumAssembler assembler(m_data.data(), ScanMergingOptions::defaultValues());

    point2dList points;
    QCOMPARE(assembler.getScanData(TdfScanRef(makeFrame(FRAME_ID), 3), &points), kServiceError);
    QVERIFY(points.empty());
}

_TDF_END

QTEST_APPLESS_MAIN(tdf::TdfSpectrumAssemblerTest)

#include "TdfSpectrumAssemblerTest.moc"
