/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#include "TdfScanCommandLineParser.h"

#include "TdfReader.h"
#include "vendor/BrukerTimsDataApi.h"

#include <QCoreApplication>
#include <QDebug>
#include <QTextStream>

using namespace tdf;

static Err printSummary(const TdfReader &reader, QTextStream &out)
{
    Err e = kNoErr;
    const TdfGlobalMetadata &metadata = reader.globalMetadata();
    out << "Source: " << reader.path() << endl;
    out << "Software: " << metadata.acquisitionSoftware << " "
        << metadata.acquisitionSoftwareVersion << endl;
    out << "Instrument: " << metadata.instrumentFamily << " rev " << metadata.instrumentRevision
        << " sn " << metadata.instrumentSerialNumber << endl;
    out << "Acquired: " << metadata.acquisitionDateTime << " by " << metadata.operatorName << endl;
    out << "m/z range: " << metadata.mzAcqRangeLower << " - " << metadata.mzAcqRangeUpper << endl;
    out << "Recalibrated state: " << (reader.hasRecalibratedState() ? "yes" : "no") << endl;

    QMap<QString, int> counts;
    e = reader.getFrameCounts(&counts); ree;
    for (auto it = counts.constBegin(); it != counts.constEnd(); ++it) {
        out << it.key() << ": " << it.value() << endl;
    }
    return e;
}

static Err printFrames(const TdfReader &reader, QTextStream &out)
{
    Err e = kNoErr;
    QList<qlonglong> ids;
    e = reader.getFrameIds(&ids); ree;
    for (qlonglong id : ids) {
        TdfFramePtr frame;
        e = reader.getFrame(id, &frame); ree;
        out << "frame=" << frame->id << "\t" << msMsTypeLabel(frame->msmsType) << "\t"
            << frame->time << "s\t" << frame->numScans << " scans\t"
            << frame->pasefPrecursors.size() << " precursors" << endl;
    }
    return e;
}

static Err printScan(const TdfReader &reader, const QString &nativeId, bool centroid,
                     QTextStream &out)
{
    Err e = kNoErr;
    ScanInfo info;
    e = reader.getScanInfo(nativeId, &info); ree;
    out << "# " << info.nativeId << " level=" << info.scanLevel << " rt=" << info.retTimeMinutes
        << "min index=" << info.scanIndex << " mode=" << info.peakMode;
    if (info.mobility.isValid()) {
        out << " 1/K0=" << info.mobility.mobilityValue();
    }
    out << endl;

    if (info.scanLevel > 1) {
        PrecursorInfo pinfo;
        bool found = false;
        e = reader.getScanPrecursorInfo(nativeId, &pinfo, &found); ree;
        ActivationInfo activation;
        e = reader.getActivation(nativeId, &activation); ree;
        if (found) {
            out << "# precursor " << pinfo.nativeId << " mz=" << pinfo.dMz
                << " z=" << pinfo.nChargeState << " window=[" << pinfo.dIsolationMass - pinfo.lowerWindowOffset
                << ", " << pinfo.dIsolationMass + pinfo.upperWindowOffset << "]";
        } else {
            out << "# no precursor";
        }
        out << " " << dissociationMethodName(activation.method);
        if (activation.hasCollisionEnergy) {
            out << " " << activation.collisionEnergy << "eV";
        }
        out << endl;
    }

    if (centroid) {
        FittedPeakList peaks;
        e = reader.getCentroids(nativeId, &peaks); ree;
        for (const FittedPeak &peak : peaks) {
            out << peak.mz << "\t" << peak.intensity << "\t" << peak.fwhm << endl;
        }
        return e;
    }

    point2dList points;
    e = reader.getScanData(nativeId, &points); ree;
    for (const point2d &p : points) {
        out << p.x() << "\t" << p.y() << endl;
    }
    return e;
}

static Err process(const TdfScanCommandLineParser &parser)
{
    Err e = kNoErr;
    TdfReaderOptions options;
    if (!parser.optionsFile().isEmpty()) {
        e = options.load(parser.optionsFile()); ree;
    }

    TdfReader reader(BrukerTimsDataApi::create());
    e = reader.openFile(parser.sourcePath(), options); ree;

    QTextStream out(stdout);
    out.setRealNumberPrecision(10);
    e = printSummary(reader, out); ree;
    if (parser.showFrames()) {
        e = printFrames(reader, out); ree;
    }
    for (const QString &nativeId : parser.nativeIds()) {
        e = printScan(reader, nativeId, parser.doCentroiding(), out); ree;
    }
    return e;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    TdfScanCommandLineParser parser;

    Err e = kNoErr;
    if (parser.validateAndProcessCommand(app.arguments())) {
        e = process(parser);
        if (kNoErr != e) {
            qWarning() << "Error occured with code" << e;
            return e;
        }
        return 0;
    }

    return kBadParameterError;
}
