/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#include "TdfReader.h"
#include "TdfFrameRepository.h"
#include "TdfPrecursorResolver.h"
#include "TdfSpectrumAssembler.h"
#include "db/QtSqlUtils.h"
#include "db/ScopedQSqlDatabase.h"
#include "tdf_reader_debug.h"

#include "boost/exception/diagnostic_information.hpp"

#include <QAtomicInt>
#include <QDir>
#include <QFileInfo>
#include <QSqlDatabase>

_TDF_BEGIN

static const QString TDF_FILE_NAME = QStringLiteral("analysis.tdf");
static const QString TDF_BIN_FILE_NAME = QStringLiteral("analysis.tdf_bin");

static QString nextConnectionName()
{
    static QAtomicInt counter;
    return QStringLiteral("tdf_reader_%1").arg(counter.fetchAndAddRelaxed(1));
}

struct TdfReader::Private final
{
    explicit Private(const TimsDataApiPtr &api1)
        : api(api1)
    {
    }

    // members that hold a QSqlDatabase handle go before the guard removes the connection
    void reset()
    {
        assembler.reset();
        resolver.reset();
        repository.reset();
        if (dbGuard) {
            dbGuard->close();
        }
        dbGuard.reset();
        if (tdfData) {
            tdfData->close();
        }
        tdfData.reset();
        metadata.clear();
        path.clear();
    }

    TimsDataApiPtr api;
    QString path;
    TdfReaderOptions options;
    TdfGlobalMetadata metadata;

    QSqlDatabase tdfDB;
    QScopedPointer<ScopedQSqlDatabase> dbGuard;
    QScopedPointer<TimsData> tdfData;
    QScopedPointer<TdfFrameRepository> repository;
    QScopedPointer<TdfPrecursorResolver> resolver;
    QScopedPointer<TdfSpectrumAssembler> assembler;

    Q_DISABLE_COPY(Private)
};

TdfReader::TdfReader(const TimsDataApiPtr &api)
    : d(new Private(api))
{
}

TdfReader::~TdfReader()
{
    d->reset();
}

bool TdfReader::canOpen(const QString &path)
{
    const QDir dir(path);
    return QFileInfo(path).isDir() && QFileInfo(dir.filePath(TDF_FILE_NAME)).isFile()
        && QFileInfo(dir.filePath(TDF_BIN_FILE_NAME)).isFile();
}

Err TdfReader::openFile(const QString &path, const TdfReaderOptions &options)
{
    Err e = kNoErr;
    debugTdf() << "Trying to open" << path;
    debugTdf() << "Options: fwhm =" << options.scanMergingOptions().fwhm
               << "dx =" << options.scanMergingOptions().dx
               << "recalibrated =" << options.useRecalibratedState();

    d->reset();

    e = options.validate(); ree;
    if (!canOpen(path)) {
        warningTdf() << "Not a TDF analysis directory:" << path;
        rrr(kFileOpenError);
    }

    const QString tdfFile = QDir(path).filePath(TDF_FILE_NAME);
    d->dbGuard.reset(new ScopedQSqlDatabase(&d->tdfDB, tdfFile, nextConnectionName()));
    e = d->dbGuard->init();
    if (e != kNoErr) {
        warningTdf() << "Could not open file:" << tdfFile;
        d->reset();
        return e;
    }

    if (!containsTable(d->tdfDB, QStringLiteral("Frames"))
        || !containsTable(d->tdfDB, QStringLiteral("GlobalMetadata"))) {
        warningTdf() << tdfFile << "has no Frames or GlobalMetadata table";
        d->reset();
        rrr(kFileOpenError);
    }

    e = readGlobalMetadata(d->tdfDB, &d->metadata);
    if (e != kNoErr) {
        d->reset();
        return e;
    }

    try {
        d->tdfData.reset(new TimsData(d->api, QDir::toNativeSeparators(path).toStdString(),
                                      options.useRecalibratedState(),
                                      options.maxFrameBufferBytes()));
        d->tdfData->setInitialFrameBufferSize(size_t(options.initialFrameBufferSize()));
        debugTdf() << "recalibrated state available:" << d->tdfData->hasRecalibratedState();
    } catch (const TimsException &ex) {
        warningTdf() << "Could not open binary data of" << path << ":"
                     << boost::diagnostic_information(ex).c_str();
        d->reset();
        rrr(ex.code());
    }

    d->options = options;
    d->path = path;
    d->repository.reset(new TdfFrameRepository(d->tdfDB));
    d->resolver.reset(new TdfPrecursorResolver(d->repository.data(), d->tdfData.data()));
    d->assembler.reset(
        new TdfSpectrumAssembler(d->tdfData.data(), options.scanMergingOptions()));

    infoTdf() << "Opened" << path << d->metadata.acquisitionSoftware
              << d->metadata.acquisitionSoftwareVersion << d->metadata.instrumentFamily;
    return e;
}

Err TdfReader::closeFile()
{
    d->reset();
    return kNoErr;
}

bool TdfReader::isOpen() const
{
    return !d->repository.isNull();
}

QString TdfReader::path() const
{
    return d->path;
}

const TdfReaderOptions &TdfReader::options() const
{
    return d->options;
}

void TdfReader::setScanMergingOptions(const ScanMergingOptions &options)
{
    d->options.setScanMergingOptions(options);
    if (d->assembler) {
        d->assembler->setOptions(options);
    }
}

const TdfGlobalMetadata &TdfReader::globalMetadata() const
{
    return d->metadata;
}

bool TdfReader::hasRecalibratedState() const
{
    return d->tdfData && d->tdfData->hasRecalibratedState();
}

Err TdfReader::getFrameCounts(QMap<QString, int> *counts) const
{
    Err e = checkOpen(); ree;
    return readFrameCounts(d->tdfDB, counts);
}

Err TdfReader::getFrameIds(QList<qlonglong> *ids) const
{
    Err e = checkOpen(); ree;
    return d->repository->frameIds(ids);
}

Err TdfReader::getFrame(qlonglong frameId, TdfFramePtr *frame) const
{
    Err e = checkOpen(); ree;
    return d->repository->getFrame(frameId, frame);
}

Err TdfReader::describeFrame(qlonglong frameId, QVariantMap *row) const
{
    Err e = checkOpen(); ree;
    return d->repository->describeFrame(frameId, row);
}

Err TdfReader::getScanRef(const QString &nativeId, TdfScanRef *ref) const
{
    Err e = checkOpen(); ree;

    qlonglong frameId = 0;
    int startScan = 0;
    int endScan = 0;
    e = TdfScanRef::parseNativeId(nativeId, &frameId, &startScan, &endScan); ree;

    TdfFramePtr frame;
    e = d->repository->getFrame(frameId, &frame); ree;

    const TdfScanRef result(frame, startScan, endScan);
    e = result.validate(); ree;
    *ref = result;
    return e;
}

Err TdfReader::getScanInfo(const QString &nativeId, ScanInfo *scanInfo) const
{
    Err e = kNoErr;
    TdfScanRef ref;
    e = getScanRef(nativeId, &ref); ree;
    const TdfFrame &frame = *ref.frame();

    ScanInfo info;
    info.nativeId = ref.nativeId();
    info.scanLevel = frame.msLevel();
    info.polarity = frame.polarityValue();
    info.retTimeSeconds = frame.time;
    info.retTimeMinutes = frame.time / 60.0;
    info.peakMode = ref.isCombined() ? PeakPickingProfile : PeakPickingCentroid;
    e = d->repository->scanIndex(frame.id, ref.startScan(), &info.scanIndex); ree;

    if (!ref.isCombined()) {
        try {
            std::vector<double> scans(1, ref.startScan());
            std::vector<double> oneOverK0;
            d->tdfData->scanNumToOneOverK0(frame.id, scans, oneOverK0);
            info.mobility.setMobilityValue(oneOverK0.at(0));
        } catch (const TimsException &ex) {
            warningTdf() << "1/K0 of" << nativeId << "failed:"
                         << boost::diagnostic_information(ex).c_str();
            rrr(ex.code());
        }
    } else {
        ResolvedPrecursor resolved;
        bool found = false;
        e = d->resolver->resolve(ref, &resolved, &found); ree;
        if (found) {
            info.mobility.setMobilityValue(resolved.inverseMobility);
        }
    }

    *scanInfo = info;
    return e;
}

Err TdfReader::getScanPrecursorInfo(const QString &nativeId, PrecursorInfo *pinfo,
                                    bool *found) const
{
    Err e = kNoErr;
    TdfScanRef ref;
    e = getScanRef(nativeId, &ref); ree;

    ResolvedPrecursor resolved;
    bool located = false;
    e = d->resolver->resolve(ref, &resolved, &located); ree;
    *found = located;
    if (!located) {
        pinfo->clear();
        return e;
    }

    const PasefPrecursorInfo &precursor = resolved.precursor;
    PrecursorInfo info;
    info.dMz = precursor.hasMonoisotopicMz ? precursor.monoisotopicMz : precursor.isolationMz;
    info.dIsolationMass = precursor.isolationMz;
    info.dMonoIsoMass = precursor.monoisotopicMz;
    info.dIntensity = precursor.intensity;
    info.nChargeState = precursor.charge;
    info.lowerWindowOffset = resolved.lowerWindowOffset;
    info.upperWindowOffset = resolved.upperWindowOffset;
    info.mobility.setMobilityValue(resolved.inverseMobility);
    info.nativeId = resolved.precursorNativeId;
    info.productNativeId = resolved.productNativeId;

    *pinfo = info;
    return e;
}

Err TdfReader::getIsolationWindow(const QString &nativeId, IsolationWindow *window,
                                  bool *found) const
{
    Err e = kNoErr;
    TdfScanRef ref;
    e = getScanRef(nativeId, &ref); ree;

    // the window needs no 1/K0 conversion, locating the precursor is enough
    PasefPrecursorInfo precursor;
    bool located = false;
    e = TdfPrecursorResolver::locatePrecursor(ref, &precursor, &located); ree;
    *found = located;
    window->clear();
    if (located) {
        window->targetMz = precursor.isolationMz;
        window->lowerOffset = precursor.isolationWidth / 2;
        window->upperOffset = precursor.isolationWidth / 2;
    }
    return e;
}

Err TdfReader::getActivation(const QString &nativeId, ActivationInfo *activation) const
{
    Err e = kNoErr;
    TdfScanRef ref;
    e = getScanRef(nativeId, &ref); ree;
    const TdfFrame &frame = *ref.frame();

    ActivationInfo info;
    if (frame.msLevel() == 1) {
        *activation = info;
        return e;
    }

    switch (frame.scanMode) {
    case 2:
    case 8:
    case 9:
        info.method = DissociationCID;
        break;
    case 3:
    case 4:
    case 5:
        info.method = DissociationInSourceCID;
        break;
    default:
        warningTdf() << "Unknown ScanMode" << frame.scanMode << "in frame" << frame.id
                     << ", assuming collision-induced dissociation";
        info.method = DissociationCID;
        break;
    }

    PasefPrecursorInfo precursor;
    bool located = false;
    e = TdfPrecursorResolver::locatePrecursor(ref, &precursor, &located); ree;
    if (located) {
        info.collisionEnergy = precursor.collisionEnergy;
        info.hasCollisionEnergy = true;
    }

    *activation = info;
    return e;
}

Err TdfReader::getScanData(const QString &nativeId, point2dList *points) const
{
    Err e = kNoErr;
    TdfScanRef ref;
    e = getScanRef(nativeId, &ref); ree;
    return d->assembler->getScanData(ref, points);
}

Err TdfReader::getCentroids(const QString &nativeId, FittedPeakList *peaks) const
{
    Err e = kNoErr;
    TdfScanRef ref;
    e = getScanRef(nativeId, &ref); ree;
    return d->assembler->getCentroids(ref, peaks);
}

Err TdfReader::readScans(qlonglong frameId, int scanBegin, int scanEnd, RawScanList *scans) const
{
    Err e = kNoErr;
    TdfFramePtr frame;
    e = getFrame(frameId, &frame); ree;
    e = TdfScanRef(frame, scanBegin, scanEnd).validate(); ree;

    try {
        RawScanList result = d->tdfData->readScans(frameId, uint32_t(scanBegin), uint32_t(scanEnd));
        scans->swap(result);
    } catch (const TimsException &ex) {
        warningTdf() << "reading frame" << frameId << "scans [" << scanBegin << "," << scanEnd
                     << ") failed:" << boost::diagnostic_information(ex).c_str();
        rrr(ex.code());
    }
    return e;
}

int TdfReader::liveCachedFrameCount() const
{
    return d->repository ? d->repository->liveCachedFrameCount() : 0;
}

Err TdfReader::checkOpen() const
{
    if (!isOpen()) {
        warningTdf() << "no TDF analysis open";
        rrr(kFileOpenError);
    }
    return kNoErr;
}

_TDF_END
