/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#ifndef TDFSCANCOMMANDLINEPARSER_H
#define TDFSCANCOMMANDLINEPARSER_H

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QStringList>

class TdfScanCommandLineParser : public QCommandLineParser
{
    Q_DECLARE_TR_FUNCTIONS(TdfScanCommandLineParser)
public:
    TdfScanCommandLineParser();

    QString sourcePath() const;
    QStringList nativeIds() const;
    QString optionsFile() const;
    bool doCentroiding() const;
    bool showFrames() const;

    bool validateAndProcessCommand(const QStringList &arguments);

private:
    static const char *SOURCE_STRING;
    static const char *SCAN_STRING;
    static const char *CENTROID_STRING;
    static const char *OPTIONS_STRING;
    static const char *FRAMES_STRING;

    static const char SCAN_CHAR;
    static const char CENTROID_CHAR;
    static const char OPTIONS_CHAR;
    static const char FRAMES_CHAR;

    QString m_sourcePath;
    QStringList m_nativeIds;
    QString m_optionsFile;
    bool m_doCentroid;
    bool m_showFrames;
};

#endif // TDFSCANCOMMANDLINEPARSER_H
