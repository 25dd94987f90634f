/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#ifndef TDF_SCAN_REF_H
#define TDF_SCAN_REF_H

#include "TdfFrame.h"

#include <QString>

_TDF_BEGIN

/*!
 * \brief Address of one mobility scan, or of a range of mobility scans, inside one frame
 *
 * Scan numbers are 0-based and frame local, the range [startScan, endScan) is half-open.
 * A reference whose range holds more than one scan is "combined" and is read as a merged
 * profile spectrum.
 *
 * Native id strings are 1-based:
 *   "frame=<id> scan=<n>"
 *   "frame=<id> startScan=<n> endScan=<m>"
 */
class TDF_READER_EXPORT TdfScanRef
{
public:
    TdfScanRef();

    //! Single scan @a scan of @a frame
    TdfScanRef(const TdfFramePtr &frame, int scan);

    //! Range [@a startScan, @a endScan) of @a frame
    TdfScanRef(const TdfFramePtr &frame, int startScan, int endScan);

    bool isNull() const { return m_frame.isNull(); }

    const TdfFramePtr &frame() const { return m_frame; }
    qlonglong frameId() const;

    int startScan() const { return m_startScan; }
    int endScan() const { return m_endScan; }
    int scanCount() const { return m_endScan - m_startScan; }

    bool isCombined() const { return m_endScan - m_startScan > 1; }

    //! Checks 0 <= startScan < endScan <= frame's NumScans
    Err validate() const;

    QString nativeId() const;

    static QString formatNativeId(qlonglong frameId, int startScan, int endScan);

    /*!
     * \brief Parses a native id into a frame id and a 0-based half-open scan range
     * \return kInvalidScanIdentifier if @a nativeId matches neither form
     */
    static Err parseNativeId(const QString &nativeId, qlonglong *frameId, int *startScan,
                             int *endScan);

private:
    TdfFramePtr m_frame;
    int m_startScan;
    int m_endScan;
};

_TDF_END

#endif // TDF_SCAN_REF_H
