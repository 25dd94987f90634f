/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#ifndef TDF_READER_H
#define TDF_READER_H

#include "TdfMetadata.h"
#include "TdfReaderOptions.h"
#include "TdfReaderTypes.h"
#include "TdfScanRef.h"
#include "algo/PeakPicker.h"
#include "vendor/TimsData.h"

#include <QList>
#include <QMap>
#include <QScopedPointer>
#include <QVariantMap>

_TDF_BEGIN

/*!
 * \brief Reader session on one timsTOF analysis directory (*.d)
 *
 * openFile() opens analysis.tdf read-only through QtSql and analysis.tdf_bin through the
 * TimsDataApi given to the constructor. Both are released by closeFile() and the destructor.
 *
 * Scans are addressed by native id, see TdfScanRef. Frames are loaded on demand and held in a
 * weak cache for as long as something references them.
 */
class TDF_READER_EXPORT TdfReader
{
public:
    explicit TdfReader(const TimsDataApiPtr &api);
    ~TdfReader();

    //! true if @a path is a directory holding analysis.tdf and analysis.tdf_bin
    static bool canOpen(const QString &path);

    Err openFile(const QString &path, const TdfReaderOptions &options = TdfReaderOptions());
    Err closeFile();
    bool isOpen() const;

    QString path() const;
    const TdfReaderOptions &options() const;

    //! merge parameters may change while open; buffer limits apply from the next openFile()
    void setScanMergingOptions(const ScanMergingOptions &options);

    const TdfGlobalMetadata &globalMetadata() const;
    bool hasRecalibratedState() const;

    Err getFrameCounts(QMap<QString, int> *counts) const;
    Err getFrameIds(QList<qlonglong> *ids) const;
    Err getFrame(qlonglong frameId, TdfFramePtr *frame) const;
    Err describeFrame(qlonglong frameId, QVariantMap *row) const;

    //! Parses @a nativeId, loads its frame and checks the scan range against it
    Err getScanRef(const QString &nativeId, TdfScanRef *ref) const;

    Err getScanInfo(const QString &nativeId, ScanInfo *scanInfo) const;

    //! @a found is false for MS1 frames and for scans that no precursor window covers
    Err getScanPrecursorInfo(const QString &nativeId, PrecursorInfo *pinfo, bool *found) const;
    Err getIsolationWindow(const QString &nativeId, IsolationWindow *window, bool *found) const;

    //! Cleared (DissociationUnknown) for MS1 frames
    Err getActivation(const QString &nativeId, ActivationInfo *activation) const;

    Err getScanData(const QString &nativeId, point2dList *points) const;
    Err getCentroids(const QString &nativeId, FittedPeakList *peaks) const;

    //! Decoded raw scans [scanBegin, scanEnd) of @a frameId, one entry per scan
    Err readScans(qlonglong frameId, int scanBegin, int scanEnd, RawScanList *scans) const;

    //! Number of frames kept alive by outstanding TdfFramePtr handles
    int liveCachedFrameCount() const;

private:
    Err checkOpen() const;

    struct Private;
    QScopedPointer<Private> d;

    Q_DISABLE_COPY(TdfReader)
};

_TDF_END

#endif // TDF_READER_H
