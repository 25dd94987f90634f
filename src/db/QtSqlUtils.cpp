/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#include "QtSqlUtils.h"
#include "tdf_reader_debug.h"

#include <QFileInfo>
#include <QSqlError>
#include <QSqlRecord>
#include <QStringList>

_TDF_BEGIN

QSqlQuery makeQuery(const QSqlDatabase &db, bool forwardOnly)
{
    QSqlQuery q(db);
    q.setForwardOnly(forwardOnly);
    return q;
}

Err qexecCommand(QSqlQuery &q, const QString &sql, const char *file, int line)
{
    if (!q.exec(sql)) {
        warningTdf() << "SQL error at" << file << ":" << line << q.lastError().text();
        warningTdf() << "query:" << sql;
        return kSqlError;
    }
    return kNoErr;
}

Err qprepare(QSqlQuery &q, const QString &sql, const char *file, int line)
{
    if (!q.prepare(sql)) {
        warningTdf() << "SQL prepare error at" << file << ":" << line << q.lastError().text();
        warningTdf() << "query:" << sql;
        return kSqlError;
    }
    return kNoErr;
}

Err qexecPrepared(QSqlQuery &q, const char *file, int line)
{
    if (!q.exec()) {
        warningTdf() << "SQL error at" << file << ":" << line << q.lastError().text();
        warningTdf() << "query:" << q.lastQuery() << q.boundValues();
        return kSqlError;
    }
    return kNoErr;
}

Err addDatabaseAndOpen(const QString &connectionName, const QString &filePath, QSqlDatabase &db)
{
    if (!QFileInfo(filePath).isFile()) {
        warningTdf() << "Database file does not exist:" << filePath;
        return kFileOpenError;
    }

    db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), connectionName);
    db.setDatabaseName(filePath);
    db.setConnectOptions(QStringLiteral("QSQLITE_OPEN_READONLY"));
    if (!db.open()) {
        warningTdf() << "Could not open file:" << filePath;
        warningTdf() << db.lastError().text();
        return kFileOpenError;
    }
    return kNoErr;
}

bool containsTable(const QSqlDatabase &db, const QString &tableName)
{
    return db.tables().contains(tableName, Qt::CaseInsensitive);
}

QVariantMap recordToMap(const QSqlQuery &q)
{
    QVariantMap row;
    const QSqlRecord rec = q.record();
    for (int i = 0; i < rec.count(); ++i) {
        row.insert(rec.fieldName(i), q.value(i));
    }
    return row;
}

_TDF_END
