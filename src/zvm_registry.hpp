/*
 * Copyright (C) 2011-2014 Red Hat, Inc.
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

#ifndef ZVM_REGISTRY_HPP
#define ZVM_REGISTRY_HPP

#include "zvm_datatypes.hpp"
#include "zvm_db.hpp"
#include "zvm_ipc.hpp"

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace ZVM {

class VolumeRegistry;

/**
 * Exclusive claim on a volume id, released when the object goes out of
 * scope.  Move only.
 */
class ZVM_DLL_LOCAL Lease {
  public:
    Lease();
    Lease(VolumeRegistry *reg, const std::string &id);
    Lease(Lease &&o);
    Lease &operator=(Lease &&o);
    ~Lease();

    /**
     * Give the lease back early.
     */
    void release();

    bool held() const { return reg != NULL; }
    const std::string &id() const { return vol_id; }

  private:
    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;

    VolumeRegistry *reg;
    std::string vol_id;
};

/**
 * Marks an export as being created for a volume.  While held, further
 * claims on the same volume fail with ZVM_ERR_ALREADY_EXPORTED.
 */
class ZVM_DLL_LOCAL ExportClaim {
  public:
    ExportClaim(VolumeRegistry *reg, const std::string &id);
    ExportClaim(ExportClaim &&o);
    ~ExportClaim();

  private:
    ExportClaim(const ExportClaim &) = delete;
    ExportClaim &operator=(const ExportClaim &) = delete;

    VolumeRegistry *reg;
    std::string vol_id;
};

/**
 * Source of truth for volume, snapshot and export records.
 *
 * Records are cached in memory and written through to sqlite before the
 * cache is touched, so a failed write leaves both unchanged.  All methods
 * are thread safe.
 */
class ZVM_DLL_LOCAL VolumeRegistry {
  public:
    /**
     * Class ctor, loads every record from the database.
     * @param db_file   sqlite database path or ":memory:"
     * @param timeout   Busy time out in ms
     */
    VolumeRegistry(const std::string &db_file, uint32_t timeout);

    /**
     * Take the lease on a volume id.  The id does not need to exist.
     * @param id    Volume id
     * @return Lease, raises ZVM_ERR_ALREADY_LOCKED if it is outstanding.
     */
    Lease reserve(const std::string &id);

    /**
     * Give back the lease on id, no-op if not held.
     * @param id    Volume id
     */
    void release(const std::string &id);

    /**
     * true if a lease on id is outstanding.
     */
    bool isReserved(const std::string &id) const;

    /**
     * Move a volume to a new state.
     * @param id        Volume id
     * @param new_state New state
     * Raises ZVM_ERR_NOT_FOUND_VOLUME if the volume is unknown.
     */
    void commit(const std::string &id, zvm_volume_state new_state);

    /**
     * Look up a volume.
     * @param id        Volume id
     * @param[out] vol  Record
     * @return true if found
     */
    bool get(const std::string &id, Volume &vol) const;

    /**
     * All volumes ordered by id.
     */
    std::vector<Volume> list() const;

    /**
     * Insert or replace a volume record.
     */
    void volumePut(const Volume &vol);

    /**
     * Remove a volume record, no-op if missing.
     */
    void volumeRemove(const std::string &id);

    /**
     * Volumes cloned from snap_id.
     */
    std::vector<std::string> clonesOf(const std::string &snap_id) const;

    /**
     * Insert a snapshot record.
     * Raises ZVM_ERR_SNAPSHOT_NAME_CONFLICT if the id is taken.
     */
    void snapshotAdd(const Snapshot &snap);

    bool snapshotGet(const std::string &id, Snapshot &snap) const;
    void snapshotRemove(const std::string &id);
    std::vector<Snapshot> snapshotList() const;

    /**
     * Snapshots whose parent is volume_id.
     */
    std::vector<Snapshot> snapshotsOf(const std::string &volume_id) const;

    /**
     * Insert or replace the export of exp.volume_id, initiators included.
     */
    void exportPut(const Export &exp);

    bool exportGet(const std::string &volume_id, Export &exp) const;
    void exportRemove(const std::string &volume_id);
    std::vector<Export> exportList() const;

    /**
     * Claim the right to export a volume.
     * @param volume_id     Volume id
     * @return Claim, raises ZVM_ERR_ALREADY_EXPORTED if the volume has an
     *         export or another claim is outstanding.
     */
    ExportClaim exportClaim(const std::string &volume_id);

  private:
    friend class ExportClaim;

    VolumeRegistry(const VolumeRegistry &) = delete;
    VolumeRegistry &operator=(const VolumeRegistry &) = delete;

    void load(void);
    void volumeWrite(const Volume &vol);
    void exportUnclaim(const std::string &volume_id);

    mutable std::mutex lock;
    Db db;
    std::map<std::string, Volume> volumes;
    std::map<std::string, Snapshot> snapshots;
    std::map<std::string, Export> exports;
    std::set<std::string> leases;
    std::set<std::string> export_claims;
};

} // namespace ZVM

#endif
