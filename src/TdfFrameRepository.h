/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#ifndef TDF_FRAME_REPOSITORY_H
#define TDF_FRAME_REPOSITORY_H

#include "TdfFrame.h"

#include <QHash>
#include <QList>
#include <QMutex>
#include <QSqlDatabase>
#include <QVariantMap>
#include <QWeakPointer>

_TDF_BEGIN

/*!
 * \brief Loads Frames rows and their PASEF precursor windows from analysis.tdf
 *
 * Frames are cached weakly: a frame stays in the cache only as long as some caller holds the
 * TdfFramePtr returned by getFrame(). A later lookup of an evicted frame loads it again.
 * The cache is guarded by a mutex; two threads missing the same frame at once may both load it,
 * and the first one inserted wins.
 */
class TDF_READER_EXPORT TdfFrameRepository
{
public:
    //! @a db must be open and outlive the repository
    explicit TdfFrameRepository(const QSqlDatabase &db);
    ~TdfFrameRepository();

    /*!
     * \brief Returns the frame @a frameId, from the cache if it is still alive
     *
     * PASEF MS2 frames get their precursor list attached. Other fragmentation types are
     * loaded without precursors and a warning is logged.
     *
     * \return kFrameNotFound if there is no such row, kSqlError on query failures
     */
    Err getFrame(qlonglong frameId, TdfFramePtr *frame);

    //! Raw "SELECT * FROM Frames" row of @a frameId; not cached
    Err describeFrame(qlonglong frameId, QVariantMap *row) const;

    //! All frame ids in ascending order
    Err frameIds(QList<qlonglong> *ids) const;

    //! Number of mobility scans in all frames before @a frameId plus @a startScan
    Err scanIndex(qlonglong frameId, int startScan, qlonglong *index) const;

    //! Number of cache entries whose frame is still referenced somewhere
    int liveCachedFrameCount() const;

    void clearCache();

private:
    Q_DISABLE_COPY(TdfFrameRepository)

    Err loadFrame(qlonglong frameId, TdfFrame *frame) const;
    Err loadPasefPrecursors(qlonglong frameId, PasefPrecursorList *precursors) const;
    void pruneExpired();

    QSqlDatabase m_db;
    mutable QMutex m_cacheMutex;
    QHash<qlonglong, QWeakPointer<const TdfFrame>> m_frameCache;
};

_TDF_END

#endif // TDF_FRAME_REPOSITORY_H
