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

#ifndef _ZVM_DB_HPP_
#define _ZVM_DB_HPP_

#include "libzvolmgmt/libzvolmgmt_common.h"

#include <map>
#include <sqlite3.h>
#include <stdint.h>
#include <string>
#include <vector>

namespace ZVM {

#define _DB_VERSION "1.0"

#define _DB_TABLE_META      "meta"
#define _DB_TABLE_VOLS      "volumes"
#define _DB_TABLE_SNAPS     "snapshots"
#define _DB_TABLE_EXPS      "exports"
#define _DB_TABLE_EXP_INITS "export_initiators"

#define _DB_MEMORY ":memory:"

/*
 * One result row, column name to text value.  NULL columns map to "".
 */
typedef std::map<std::string, std::string> DbRow;

/*
 * Thin wrapper around a sqlite3 handle holding the registry schema.
 * Every failure raises ZvmException with ZVM_ERR_REGISTRY_IO.
 * Not thread safe, callers serialize access.
 */
class ZVM_DLL_LOCAL Db {
  public:
    /*
     * Open or create db_file and make sure the schema exists.  A database
     * holding another schema version is rejected.
     * db_file:     Path or _DB_MEMORY
     * timeout:     Busy time out in ms
     */
    Db(const std::string &db_file, uint32_t timeout);

    ~Db();

    /*
     * Run statements which return no rows.
     */
    void exec(const std::string &cmd);

    /*
     * Run a query and collect all rows.
     */
    std::vector<DbRow> query(const std::string &cmd);

    void transBegin(void);
    void transCommit(void);
    /*
     * Never raises, failures are logged.
     */
    void transRollback(void);

    /*
     * SQL literal for s, quotes doubled and wrapped in single quotes.
     */
    static std::string quote(const std::string &s);

  private:
    Db(const Db &) = delete;
    Db &operator=(const Db &) = delete;

    void schemaInit(void);

    sqlite3 *db;
    std::string path;
};

/*
 * Scoped transaction, rolled back unless commit() was reached.
 */
class ZVM_DLL_LOCAL DbTransaction {
  public:
    explicit DbTransaction(Db &db);
    ~DbTransaction();

    void commit(void);

  private:
    DbTransaction(const DbTransaction &) = delete;
    DbTransaction &operator=(const DbTransaction &) = delete;

    Db &db;
    bool done;
};

} // namespace ZVM

#endif /* End of _ZVM_DB_HPP_ */
