/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#ifndef TDF_QT_SQL_UTILS_H
#define TDF_QT_SQL_UTILS_H

#include "tdf_core_defs.h"

#include <QSqlDatabase>
#include <QSqlQuery>
#include <QString>
#include <QVariantMap>

_TDF_BEGIN

//! Creates a query bound to @a db; forward-only queries are cheaper for the read-only passes
//! done over the TDF tables.
TDF_READER_EXPORT QSqlQuery makeQuery(const QSqlDatabase &db, bool forwardOnly);

//! Executes @a sql on @a q, logs the driver message together with the call site on failure.
TDF_READER_EXPORT Err qexecCommand(QSqlQuery &q, const QString &sql, const char *file, int line);

//! Prepares @a sql on @a q for later bindValue()/QEXEC_NOARG().
TDF_READER_EXPORT Err qprepare(QSqlQuery &q, const QString &sql, const char *file, int line);

//! Executes the previously prepared statement of @a q.
TDF_READER_EXPORT Err qexecPrepared(QSqlQuery &q, const char *file, int line);

//! Adds an SQLite connection named @a connectionName for @a filePath and opens it read-only.
TDF_READER_EXPORT Err addDatabaseAndOpen(const QString &connectionName, const QString &filePath,
                                         QSqlDatabase &db);

TDF_READER_EXPORT bool containsTable(const QSqlDatabase &db, const QString &tableName);

//! Copies the current record of @a q into a column name to value map.
TDF_READER_EXPORT QVariantMap recordToMap(const QSqlQuery &q);

_TDF_END

#define QEXEC_CMD(q, sql) tdf::qexecCommand((q), (sql), __FILE__, __LINE__)
#define QPREPARE(q, sql) tdf::qprepare((q), (sql), __FILE__, __LINE__)
#define QEXEC_NOARG(q) tdf::qexecPrepared((q), __FILE__, __LINE__)

#endif // TDF_QT_SQL_UTILS_H
