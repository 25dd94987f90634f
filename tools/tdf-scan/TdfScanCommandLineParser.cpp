/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#include "TdfScanCommandLineParser.h"

#include <QDebug>
#include <QFileInfo>

static const QString APPLICATION_DESCRIPTION
    = QStringLiteral("tdf-scan - Inspect timsTOF analysis directories (*.d)");

const char *TdfScanCommandLineParser::SOURCE_STRING = "source";
const char *TdfScanCommandLineParser::SCAN_STRING = "scan";
const char *TdfScanCommandLineParser::CENTROID_STRING = "centroid";
const char *TdfScanCommandLineParser::OPTIONS_STRING = "options";
const char *TdfScanCommandLineParser::FRAMES_STRING = "frames";

const char TdfScanCommandLineParser::SCAN_CHAR = 's';
const char TdfScanCommandLineParser::CENTROID_CHAR = 'c';
const char TdfScanCommandLineParser::OPTIONS_CHAR = 'p';
const char TdfScanCommandLineParser::FRAMES_CHAR = 'f';

TdfScanCommandLineParser::TdfScanCommandLineParser()
    : m_doCentroid(false)
    , m_showFrames(false)
{
    setApplicationDescription(APPLICATION_DESCRIPTION);
    addHelpOption();
    addPositionalArgument(SOURCE_STRING, tr("Analysis directory"));

    addOption(QCommandLineOption(QStringList() << QString(SCAN_CHAR) << SCAN_STRING,
                                 tr("Print the spectrum of a scan, e.g. \"frame=7 scan=3\" or "
                                    "\"frame=7 startScan=3 endScan=5\". May be repeated."),
                                 "nativeId"));
    addOption(QCommandLineOption(QStringList() << QString(CENTROID_CHAR) << CENTROID_STRING,
                                 tr("Print centroids instead of the spectrum")));
    addOption(QCommandLineOption(QStringList() << QString(OPTIONS_CHAR) << OPTIONS_STRING,
                                 tr("Reader options INI file"), "file"));
    addOption(QCommandLineOption(QStringList() << QString(FRAMES_CHAR) << FRAMES_STRING,
                                 tr("List every frame")));
}

QString TdfScanCommandLineParser::sourcePath() const
{
    return m_sourcePath;
}

QStringList TdfScanCommandLineParser::nativeIds() const
{
    return m_nativeIds;
}

QString TdfScanCommandLineParser::optionsFile() const
{
    return m_optionsFile;
}

bool TdfScanCommandLineParser::doCentroiding() const
{
    return m_doCentroid;
}

bool TdfScanCommandLineParser::showFrames() const
{
    return m_showFrames;
}

bool TdfScanCommandLineParser::validateAndProcessCommand(const QStringList &arguments)
{
    if (!parse(arguments)) {
        qWarning() << errorText();
        return false;
    }
    if (isSet(QStringLiteral("help"))) {
        showHelp(0);
    }

    const QStringList positional = positionalArguments();
    if (positional.size() != 1) {
        qWarning() << "Source directory is not specified or invalid number of sources";
        return false;
    }
    m_sourcePath = positional[0];

    m_optionsFile = value(OPTIONS_STRING);
    if (!m_optionsFile.isEmpty() && !QFileInfo(m_optionsFile).isFile()) {
        qWarning() << "Options file not found:" << m_optionsFile;
        return false;
    }

    m_nativeIds = values(SCAN_STRING);
    m_doCentroid = isSet(CENTROID_STRING);
    m_showFrames = isSet(FRAMES_STRING);
    return true;
}
