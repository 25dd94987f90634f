/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#ifndef TDF_READER_OPTIONS_H
#define TDF_READER_OPTIONS_H

#include "tdf_core_defs.h"

#include <QString>

_TDF_BEGIN

//! Parameters used to turn a range of mobility scans into one profile spectrum
struct TDF_READER_EXPORT ScanMergingOptions
{
    double fwhm;
    double dx;
    //! centroids at or below this intensity are dropped before reprofiling
    double minIntensity;

    ScanMergingOptions();

    static ScanMergingOptions defaultValues();
};

/*!
 * \brief The TdfReaderOptions is the holder of TdfReader options.
 *
 * Stored in INI files:
 * \code
 * [TimsData]
 * UseRecalibratedState=false
 * InitialFrameBufferSize=128
 * MaxFrameBufferBytes=16777216
 * [ScanMerging]
 * Fwhm=0.04
 * Dx=0.001
 * [PeakPicking]
 * MinIntensity=0
 * \endcode
 * Keys that are absent keep their default value.
 */
class TDF_READER_EXPORT TdfReaderOptions
{
public:
    TdfReaderOptions();

    bool useRecalibratedState() const { return m_useRecalibratedState; }
    void setUseRecalibratedState(bool use) { m_useRecalibratedState = use; }

    int initialFrameBufferSize() const { return m_initialFrameBufferSize; }
    void setInitialFrameBufferSize(int elements) { m_initialFrameBufferSize = elements; }

    uint maxFrameBufferBytes() const { return m_maxFrameBufferBytes; }
    void setMaxFrameBufferBytes(uint bytes) { m_maxFrameBufferBytes = bytes; }

    const ScanMergingOptions &scanMergingOptions() const { return m_scanMergingOptions; }
    void setScanMergingOptions(const ScanMergingOptions &options);

    /*!
     * \return kFileOpenError if @a filename exists but cannot be parsed, kBadParameterError for
     * non-positive buffer sizes or merge parameters
     */
    Err load(const QString &filename);
    Err save(const QString &filename) const;

    Err validate() const;

private:
    bool m_useRecalibratedState;
    int m_initialFrameBufferSize;
    uint m_maxFrameBufferBytes;
    ScanMergingOptions m_scanMergingOptions;
};

_TDF_END

#endif // TDF_READER_OPTIONS_H
