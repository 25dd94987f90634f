/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#include "TdfFrameRepository.h"
#include "db/QtSqlUtils.h"
#include "tdf_reader_debug.h"

#include <QMutexLocker>

_TDF_BEGIN

static const char *PASEF_PRECURSORS_SQL
    = "SELECT Frame, ScanNumBegin, ScanNumEnd, IsolationMz, IsolationWidth, CollisionEnergy, "
      "MonoisotopicMz, Charge, ScanNumber, Intensity, Parent "
      "FROM PasefFrameMsMsInfo f JOIN Precursors p ON p.Id = f.Precursor "
      "WHERE Frame = ? "
      "ORDER BY ScanNumBegin;";

TdfFrameRepository::TdfFrameRepository(const QSqlDatabase &db)
    : m_db(db)
{
}

TdfFrameRepository::~TdfFrameRepository()
{
}

Err TdfFrameRepository::getFrame(qlonglong frameId, TdfFramePtr *frame)
{
    Err e = kNoErr;
    {
        QMutexLocker locker(&m_cacheMutex);
        const TdfFramePtr cached = m_frameCache.value(frameId).toStrongRef();
        if (cached) {
            *frame = cached;
            return e;
        }
    }

    QSharedPointer<TdfFrame> loaded(new TdfFrame());
    e = loadFrame(frameId, loaded.data()); ree;

    switch (loaded->msmsType) {
    case MsMsTypeMs1:
        break;
    case MsMsTypePasefMs2:
        e = loadPasefPrecursors(frameId, &loaded->pasefPrecursors); ree;
        break;
    default:
        warningTdf() << "No support for MsMsType" << loaded->msmsType << "("
                     << msMsTypeLabel(loaded->msmsType) << ") yet, frame" << frameId
                     << "has no precursor information:" << kUnsupportedFrameType;
        break;
    }

    QMutexLocker locker(&m_cacheMutex);
    // another caller may have loaded the same frame meanwhile; keep the instance already shared
    const TdfFramePtr raced = m_frameCache.value(frameId).toStrongRef();
    if (raced) {
        *frame = raced;
        return e;
    }
    pruneExpired();
    const TdfFramePtr result = loaded;
    m_frameCache.insert(frameId, result.toWeakRef());
    *frame = result;
    return e;
}

Err TdfFrameRepository::describeFrame(qlonglong frameId, QVariantMap *row) const
{
    Err e = kNoErr;
    QSqlQuery q = makeQuery(m_db, true);
    e = QPREPARE(q, QStringLiteral("SELECT * FROM Frames WHERE Id = ?;")); ree;
    q.addBindValue(frameId);
    e = QEXEC_NOARG(q); ree;
    if (!q.next()) {
        warningTdf() << "missing frame=" << frameId;
        return kFrameNotFound;
    }
    *row = recordToMap(q);
    return e;
}

Err TdfFrameRepository::frameIds(QList<qlonglong> *ids) const
{
    Err e = kNoErr;
    QList<qlonglong> result;
    QSqlQuery q = makeQuery(m_db, true);
    e = QEXEC_CMD(q, QStringLiteral("SELECT Id FROM Frames ORDER BY Id;")); ree;
    while (q.next()) {
        result.push_back(q.value(0).toLongLong());
    }
    ids->swap(result);
    return e;
}

Err TdfFrameRepository::scanIndex(qlonglong frameId, int startScan, qlonglong *index) const
{
    Err e = kNoErr;
    QSqlQuery q = makeQuery(m_db, true);
    e = QPREPARE(q, QStringLiteral("SELECT SUM(NumScans) FROM Frames WHERE Id < ?;")); ree;
    q.addBindValue(frameId);
    e = QEXEC_NOARG(q); ree;

    qlonglong preceding = 0;
    // SUM() over no rows is NULL
    if (q.next() && !q.value(0).isNull()) {
        preceding = q.value(0).toLongLong();
    }
    *index = preceding + startScan;
    return e;
}

int TdfFrameRepository::liveCachedFrameCount() const
{
    QMutexLocker locker(&m_cacheMutex);
    int count = 0;
    for (auto it = m_frameCache.constBegin(); it != m_frameCache.constEnd(); ++it) {
        if (!it.value().isNull()) {
            ++count;
        }
    }
    return count;
}

void TdfFrameRepository::clearCache()
{
    QMutexLocker locker(&m_cacheMutex);
    m_frameCache.clear();
}

Err TdfFrameRepository::loadFrame(qlonglong frameId, TdfFrame *frame) const
{
    Err e = kNoErr;
    QVariantMap row;
    e = describeFrame(frameId, &row); ree;
    e = TdfFrame::fromRecord(row, frame); ree;
    debugTdf() << "loaded frame" << frameId << "type" << frame->msmsType << "scans"
               << frame->numScans;
    return e;
}

Err TdfFrameRepository::loadPasefPrecursors(qlonglong frameId,
                                            PasefPrecursorList *precursors) const
{
    Err e = kNoErr;
    PasefPrecursorList result;

    QSqlQuery q = makeQuery(m_db, true);
    e = QPREPARE(q, QString::fromLatin1(PASEF_PRECURSORS_SQL)); ree;
    q.addBindValue(frameId);
    e = QEXEC_NOARG(q); ree;
    while (q.next()) {
        result.push_back(PasefPrecursorInfo::fromRecord(recordToMap(q)));
    }

    precursors->swap(result);
    return e;
}

void TdfFrameRepository::pruneExpired()
{
    for (auto it = m_frameCache.begin(); it != m_frameCache.end();) {
        if (it.value().isNull()) {
            it = m_frameCache.erase(it);
        } else {
            ++it;
        }
    }
}

_TDF_END
