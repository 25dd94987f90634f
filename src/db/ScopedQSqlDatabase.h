/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#ifndef TDF_SCOPED_QSQLDATABASE_H
#define TDF_SCOPED_QSQLDATABASE_H

#include "tdf_core_defs.h"

#include <QString>

class QSqlDatabase;

_TDF_BEGIN

//!\brief This class implements simple RAII for QSqlDatabase open/close action
//!
//! The connection opened by init() is closed and removed from the connection registry in the
//! destructor, so any return point of an ree chain leaves no dangling named connection behind.
//!
class TDF_READER_EXPORT ScopedQSqlDatabase
{
public:
    //!\brief Constructs the scoped guard: pointer ownership of db is not transfered
    // Caller is responsible to keep @a db alive for the lifetime of the guard
    ScopedQSqlDatabase(QSqlDatabase *db, const QString &sqliteFilePath,
                       const QString &connectionName);

    ~ScopedQSqlDatabase();

    //! init() call opens the database read-only; it is closed in destructor if it was opened.
    Err init();

    //! Closes and unregisters the connection now instead of in the destructor
    void close();

private:
    Q_DISABLE_COPY(ScopedQSqlDatabase)

    QSqlDatabase *m_db;
    QString m_fileName;
    QString m_connectionName;
    bool m_registered = false;
};

_TDF_END

#endif // TDF_SCOPED_QSQLDATABASE_H
