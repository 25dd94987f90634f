/*
 * Copyright (C) 2018 Protein Metrics Inc. - All Rights Reserved.
 * Unauthorized copying or distribution of this file, via any medium is strictly prohibited.
 * Confidential.
 */

#include "ScopedQSqlDatabase.h"
#include "QtSqlUtils.h"

#include <QSqlDatabase>

_TDF_BEGIN

ScopedQSqlDatabase::ScopedQSqlDatabase(QSqlDatabase *db, const QString &sqliteFilePath,
                                       const QString &connectionName)
    : m_db(db)
    , m_fileName(sqliteFilePath)
    , m_connectionName(connectionName)
{
}

ScopedQSqlDatabase::~ScopedQSqlDatabase()
{
    close();
}

Err ScopedQSqlDatabase::init()
{
    Err e = kNoErr;
    m_registered = true;
    e = addDatabaseAndOpen(m_connectionName, m_fileName, *m_db); ree;
    return e;
}

void ScopedQSqlDatabase::close()
{
    if (!m_registered) {
        return;
    }
    if (m_db->isOpen()) {
        m_db->close();
    }
    // the registry refuses to drop a connection that still has live handles
    *m_db = QSqlDatabase();
    QSqlDatabase::removeDatabase(m_connectionName);
    m_registered = false;
}

_TDF_END
