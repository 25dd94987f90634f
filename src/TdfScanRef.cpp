/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#include "TdfScanRef.h"
#include "tdf_reader_debug.h"

#include <QRegularExpression>
#include <QRegularExpressionMatch>

_TDF_BEGIN

TdfScanRef::TdfScanRef()
    : m_startScan(0)
    , m_endScan(0)
{
}

TdfScanRef::TdfScanRef(const TdfFramePtr &frame, int scan)
    : m_frame(frame)
    , m_startScan(scan)
    , m_endScan(scan + 1)
{
}

TdfScanRef::TdfScanRef(const TdfFramePtr &frame, int startScan, int endScan)
    : m_frame(frame)
    , m_startScan(startScan)
    , m_endScan(endScan)
{
}

qlonglong TdfScanRef::frameId() const
{
    return m_frame ? m_frame->id : 0;
}

Err TdfScanRef::validate() const
{
    if (!m_frame) {
        warningTdf() << "scan reference without frame";
        rrr(kBadParameterError);
    }
    if (m_startScan < 0 || m_endScan <= m_startScan || m_endScan > m_frame->numScans) {
        warningTdf() << "scan range [" << m_startScan << "," << m_endScan << ") outside frame"
                     << m_frame->id << "with" << m_frame->numScans << "scans";
        rrr(kBadParameterError);
    }
    return kNoErr;
}

QString TdfScanRef::nativeId() const
{
    return formatNativeId(frameId(), m_startScan, m_endScan);
}

QString TdfScanRef::formatNativeId(qlonglong frameId, int startScan, int endScan)
{
    if (endScan - startScan > 1) {
        return QStringLiteral("frame=%1 startScan=%2 endScan=%3")
            .arg(frameId)
            .arg(startScan + 1)
            .arg(endScan + 1);
    }
    return QStringLiteral("frame=%1 scan=%2").arg(frameId).arg(startScan + 1);
}

Err TdfScanRef::parseNativeId(const QString &nativeId, qlonglong *frameId, int *startScan,
                              int *endScan)
{
    static const QRegularExpression singleRx(
        QStringLiteral("^frame=(\\d+) scan=(\\d+)\\z"));
    static const QRegularExpression rangeRx(
        QStringLiteral("^frame=(\\d+) startScan=(\\d+) endScan=(\\d+)\\z"));

    bool okFrame = false;
    bool okStart = false;
    bool okEnd = true;
    qlonglong frame = 0;
    int start = 0;
    int end = 0;

    QRegularExpressionMatch m = singleRx.match(nativeId);
    if (m.hasMatch()) {
        frame = m.captured(1).toLongLong(&okFrame);
        start = m.captured(2).toInt(&okStart) - 1;
        end = start + 1;
    } else {
        m = rangeRx.match(nativeId);
        if (!m.hasMatch()) {
            warningTdf() << "not a TDF scan identifier:" << nativeId;
            rrr(kInvalidScanIdentifier);
        }
        frame = m.captured(1).toLongLong(&okFrame);
        start = m.captured(2).toInt(&okStart) - 1;
        end = m.captured(3).toInt(&okEnd) - 1;
    }

    // scan numbers in identifiers are 1-based
    if (!okFrame || !okStart || !okEnd || start < 0 || end <= start) {
        warningTdf() << "bad scan numbers in identifier:" << nativeId;
        rrr(kInvalidScanIdentifier);
    }

    *frameId = frame;
    *startScan = start;
    *endScan = end;
    return kNoErr;
}

_TDF_END
