/*
 * Copyright (C) 2016 Red Hat, Inc.
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; If not, see <http://www.gnu.org/licenses/>.
 */

#include "zvm_db.hpp"
#include "zvm_ipc.hpp"

#include <syslog.h>

namespace ZVM {

static const char *schema_sql =
    "CREATE TABLE IF NOT EXISTS " _DB_TABLE_META " ("
    "key TEXT PRIMARY KEY, "
    "value TEXT NOT NULL);"

    "CREATE TABLE IF NOT EXISTS " _DB_TABLE_VOLS " ("
    "id TEXT PRIMARY KEY, "
    "size_bytes INTEGER NOT NULL, "
    "backing_path TEXT NOT NULL, "
    "state TEXT NOT NULL, "
    "created_at INTEGER NOT NULL, "
    "origin_snapshot TEXT NOT NULL DEFAULT '', "
    "serial TEXT NOT NULL DEFAULT '');"

    "CREATE TABLE IF NOT EXISTS " _DB_TABLE_SNAPS " ("
    "id TEXT PRIMARY KEY, "
    "volume_id TEXT NOT NULL, "
    "backing_path TEXT NOT NULL, "
    "size_bytes INTEGER NOT NULL, "
    "created_at INTEGER NOT NULL);"

    "CREATE TABLE IF NOT EXISTS " _DB_TABLE_EXPS " ("
    "volume_id TEXT PRIMARY KEY, "
    "target_iqn TEXT NOT NULL, "
    "tid INTEGER NOT NULL, "
    "lun INTEGER NOT NULL, "
    "portal TEXT NOT NULL);"

    "CREATE TABLE IF NOT EXISTS " _DB_TABLE_EXP_INITS " ("
    "volume_id TEXT NOT NULL, "
    "initiator TEXT NOT NULL, "
    "PRIMARY KEY (volume_id, initiator));";

static int _db_sql_exec_cb(void *data, int argc, char **argv,
                           char **col_name) {
    std::vector<DbRow> *rows = (std::vector<DbRow> *)data;
    DbRow row;

    for (int i = 0; i < argc; ++i) {
        row[col_name[i]] = (argv[i] != NULL) ? argv[i] : "";
    }
    rows->push_back(row);
    return 0;
}

Db::Db(const std::string &db_file, uint32_t timeout) : db(NULL), path(db_file) {
    int rc = sqlite3_open_v2(db_file.c_str(), &db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                 SQLITE_OPEN_FULLMUTEX,
                             NULL);
    if (rc != SQLITE_OK) {
        std::string em = (db != NULL) ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        db = NULL;
        throw ZvmException(ZVM_ERR_REGISTRY_IO,
                           "Failed to open registry database " + db_file, em);
    }

    sqlite3_busy_timeout(db, (int)timeout);

    try {
        schemaInit();
    } catch (const ZvmException &) {
        sqlite3_close(db);
        db = NULL;
        throw;
    }
}

Db::~Db() {
    if (db != NULL) {
        sqlite3_close(db);
        db = NULL;
    }
}

void Db::schemaInit(void) {
    DbTransaction trans(*this);

    exec(schema_sql);

    std::vector<DbRow> rows =
        query("SELECT value FROM " _DB_TABLE_META " WHERE key = 'version';");
    if (rows.empty()) {
        exec("INSERT INTO " _DB_TABLE_META
             " (key, value) VALUES ('version', '" _DB_VERSION "');");
    } else if (rows[0]["value"] != _DB_VERSION) {
        throw ZvmException(ZVM_ERR_REGISTRY_IO,
                           "Registry database " + path +
                               " has unsupported version " + rows[0]["value"],
                           "expected version " _DB_VERSION);
    }

    trans.commit();
}

void Db::exec(const std::string &cmd) {
    char *err_msg = NULL;

    if (sqlite3_exec(db, cmd.c_str(), NULL, NULL, &err_msg) != SQLITE_OK) {
        std::string em = (err_msg != NULL) ? err_msg : sqlite3_errmsg(db);
        sqlite3_free(err_msg);
        throw ZvmException(ZVM_ERR_REGISTRY_IO, "Registry update failed",
                           em + ": " + cmd);
    }
}

std::vector<DbRow> Db::query(const std::string &cmd) {
    std::vector<DbRow> rows;
    char *err_msg = NULL;

    if (sqlite3_exec(db, cmd.c_str(), _db_sql_exec_cb, &rows, &err_msg) !=
        SQLITE_OK) {
        std::string em = (err_msg != NULL) ? err_msg : sqlite3_errmsg(db);
        sqlite3_free(err_msg);
        throw ZvmException(ZVM_ERR_REGISTRY_IO, "Registry query failed",
                           em + ": " + cmd);
    }
    return rows;
}

void Db::transBegin(void) { exec("BEGIN IMMEDIATE TRANSACTION;"); }

void Db::transCommit(void) { exec("COMMIT TRANSACTION;"); }

void Db::transRollback(void) {
    char *err_msg = NULL;

    if (sqlite3_exec(db, "ROLLBACK TRANSACTION;", NULL, NULL, &err_msg) !=
        SQLITE_OK) {
        syslog(LOG_USER | LOG_ERR, "registry rollback failed: %s",
               (err_msg != NULL) ? err_msg : sqlite3_errmsg(db));
        sqlite3_free(err_msg);
    }
}

std::string Db::quote(const std::string &s) {
    char *q = sqlite3_mprintf("%Q", s.c_str());
    if (q == NULL) {
        throw ZvmException(ZVM_ERR_REGISTRY_IO, "Out of memory quoting value");
    }
    std::string rc(q);
    sqlite3_free(q);
    return rc;
}

DbTransaction::DbTransaction(Db &db) : db(db), done(false) {
    db.transBegin();
}

DbTransaction::~DbTransaction() {
    if (!done) {
        db.transRollback();
    }
}

void DbTransaction::commit(void) {
    db.transCommit();
    done = true;
}

} // namespace ZVM
