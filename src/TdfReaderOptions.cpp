/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#include "TdfReaderOptions.h"
#include "tdf_reader_debug.h"
#include "vendor/TimsData.h"

#include <QFileInfo>
#include <QSettings>

#include <limits>

_TDF_BEGIN

static const QString kTimsDataGroup = QStringLiteral("TimsData");
static const QString kUseRecalibratedState = QStringLiteral("UseRecalibratedState");
static const QString kInitialFrameBufferSize = QStringLiteral("InitialFrameBufferSize");
static const QString kMaxFrameBufferBytes = QStringLiteral("MaxFrameBufferBytes");
static const QString kScanMergingGroup = QStringLiteral("ScanMerging");
static const QString kFwhm = QStringLiteral("Fwhm");
static const QString kDx = QStringLiteral("Dx");
static const QString kPeakPickingGroup = QStringLiteral("PeakPicking");
static const QString kMinIntensity = QStringLiteral("MinIntensity");

ScanMergingOptions::ScanMergingOptions()
    : fwhm(0.04)
    , dx(0.001)
    , minIntensity(0.0)
{
}

ScanMergingOptions ScanMergingOptions::defaultValues()
{
    return ScanMergingOptions();
}

TdfReaderOptions::TdfReaderOptions()
    : m_useRecalibratedState(false)
    , m_initialFrameBufferSize(int(TimsData::DEFAULT_INITIAL_FRAME_BUFFER_SIZE))
    , m_maxFrameBufferBytes(TimsData::DEFAULT_MAX_FRAME_BUFFER_BYTES)
{
}

void TdfReaderOptions::setScanMergingOptions(const ScanMergingOptions &options)
{
    m_scanMergingOptions = options;
}

Err TdfReaderOptions::load(const QString &filename)
{
    if (!QFileInfo(filename).isFile()) {
        warningTdf() << "options file" << filename << "not found, keeping defaults";
        rrr(kFileOpenError);
    }

    QSettings settings(filename, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        warningTdf() << "cannot parse options file" << filename << settings.status();
        rrr(kFileOpenError);
    }

    TdfReaderOptions loaded(*this);

    settings.beginGroup(kTimsDataGroup);
    loaded.m_useRecalibratedState
        = settings.value(kUseRecalibratedState, m_useRecalibratedState).toBool();
    loaded.m_initialFrameBufferSize
        = settings.value(kInitialFrameBufferSize, m_initialFrameBufferSize).toInt();
    loaded.m_maxFrameBufferBytes
        = settings.value(kMaxFrameBufferBytes, m_maxFrameBufferBytes).toUInt();
    settings.endGroup();

    settings.beginGroup(kScanMergingGroup);
    loaded.m_scanMergingOptions.fwhm = settings.value(kFwhm, m_scanMergingOptions.fwhm).toDouble();
    loaded.m_scanMergingOptions.dx = settings.value(kDx, m_scanMergingOptions.dx).toDouble();
    settings.endGroup();

    settings.beginGroup(kPeakPickingGroup);
    loaded.m_scanMergingOptions.minIntensity
        = settings.value(kMinIntensity, m_scanMergingOptions.minIntensity).toDouble();
    settings.endGroup();

    Err e = loaded.validate(); ree;

    debugTdf() << "options loaded from" << filename << "fwhm=" << loaded.m_scanMergingOptions.fwhm
               << "dx=" << loaded.m_scanMergingOptions.dx;
    *this = loaded;
    return e;
}

Err TdfReaderOptions::save(const QString &filename) const
{
    QSettings settings(filename, QSettings::IniFormat);

    settings.beginGroup(kTimsDataGroup);
    settings.setValue(kUseRecalibratedState, m_useRecalibratedState);
    settings.setValue(kInitialFrameBufferSize, m_initialFrameBufferSize);
    settings.setValue(kMaxFrameBufferBytes, m_maxFrameBufferBytes);
    settings.endGroup();

    settings.beginGroup(kScanMergingGroup);
    settings.setValue(kFwhm, m_scanMergingOptions.fwhm);
    settings.setValue(kDx, m_scanMergingOptions.dx);
    settings.endGroup();

    settings.beginGroup(kPeakPickingGroup);
    settings.setValue(kMinIntensity, m_scanMergingOptions.minIntensity);
    settings.endGroup();

    settings.sync();
    if (settings.status() != QSettings::NoError) {
        warningTdf() << "cannot write options file" << filename;
        rrr(kFileOpenError);
    }
    return kNoErr;
}

Err TdfReaderOptions::validate() const
{
    // the buffer size in bytes is passed to the SDK as uint32_t
    const uint maxBytes = std::numeric_limits<uint32_t>::max() - 4;
    if (m_initialFrameBufferSize <= 0 || m_maxFrameBufferBytes < 4
        || m_maxFrameBufferBytes > maxBytes) {
        warningTdf() << "invalid frame buffer limits" << m_initialFrameBufferSize
                     << m_maxFrameBufferBytes;
        rrr(kBadParameterError);
    }
    if (!(m_scanMergingOptions.fwhm > 0) || !(m_scanMergingOptions.dx > 0)) {
        warningTdf() << "invalid scan merging parameters fwhm=" << m_scanMergingOptions.fwhm
                     << "dx=" << m_scanMergingOptions.dx;
        rrr(kBadParameterError);
    }
    return kNoErr;
}

_TDF_END
