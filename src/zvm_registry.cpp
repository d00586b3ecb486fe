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

#include "zvm_registry.hpp"
#include "zvm_ipc.hpp"

#include <stdlib.h>
#include <syslog.h>

namespace ZVM {

static uint64_t row_u64(DbRow &row, const char *key) {
    return strtoull(row[key].c_str(), NULL, 10);
}

Lease::Lease() : reg(NULL) {}

Lease::Lease(VolumeRegistry *reg, const std::string &id)
    : reg(reg), vol_id(id) {}

Lease::Lease(Lease &&o) : reg(o.reg), vol_id(o.vol_id) { o.reg = NULL; }

Lease &Lease::operator=(Lease &&o) {
    if (this != &o) {
        release();
        reg = o.reg;
        vol_id = o.vol_id;
        o.reg = NULL;
    }
    return *this;
}

Lease::~Lease() { release(); }

void Lease::release() {
    if (reg != NULL) {
        reg->release(vol_id);
        reg = NULL;
    }
}

ExportClaim::ExportClaim(VolumeRegistry *reg, const std::string &id)
    : reg(reg), vol_id(id) {}

ExportClaim::ExportClaim(ExportClaim &&o) : reg(o.reg), vol_id(o.vol_id) {
    o.reg = NULL;
}

ExportClaim::~ExportClaim() {
    if (reg != NULL) {
        reg->exportUnclaim(vol_id);
    }
}

VolumeRegistry::VolumeRegistry(const std::string &db_file, uint32_t timeout)
    : db(db_file, timeout) {
    load();
}

void VolumeRegistry::load(void) {
    std::vector<DbRow> rows = db.query("SELECT * FROM " _DB_TABLE_VOLS ";");
    for (size_t i = 0; i < rows.size(); ++i) {
        Volume v;
        v.id = rows[i]["id"];
        v.size_bytes = row_u64(rows[i], "size_bytes");
        v.backing_path = rows[i]["backing_path"];
        v.state = volume_state_from_str(rows[i]["state"]);
        v.created_at = row_u64(rows[i], "created_at");
        v.origin_snapshot = rows[i]["origin_snapshot"];
        v.serial = rows[i]["serial"];
        if (v.state == ZVM_VOLUME_STATE_UNKNOWN) {
            syslog(LOG_USER | LOG_WARNING,
                   "registry: volume %s has unknown state '%s', "
                   "treating it as error",
                   v.id.c_str(), rows[i]["state"].c_str());
            v.state = ZVM_VOLUME_STATE_ERROR;
        }
        volumes[v.id] = v;
    }

    rows = db.query("SELECT * FROM " _DB_TABLE_SNAPS ";");
    for (size_t i = 0; i < rows.size(); ++i) {
        Snapshot s;
        s.id = rows[i]["id"];
        s.volume_id = rows[i]["volume_id"];
        s.backing_path = rows[i]["backing_path"];
        s.size_bytes = row_u64(rows[i], "size_bytes");
        s.created_at = row_u64(rows[i], "created_at");
        snapshots[s.id] = s;
    }

    rows = db.query("SELECT * FROM " _DB_TABLE_EXPS ";");
    for (size_t i = 0; i < rows.size(); ++i) {
        Export e;
        e.volume_id = rows[i]["volume_id"];
        e.target_iqn = rows[i]["target_iqn"];
        e.tid = (uint32_t)row_u64(rows[i], "tid");
        e.lun = (uint32_t)row_u64(rows[i], "lun");
        e.portal = rows[i]["portal"];
        exports[e.volume_id] = e;
    }

    rows = db.query("SELECT * FROM " _DB_TABLE_EXP_INITS ";");
    for (size_t i = 0; i < rows.size(); ++i) {
        std::map<std::string, Export>::iterator it =
            exports.find(rows[i]["volume_id"]);
        if (it != exports.end()) {
            it->second.initiators.insert(rows[i]["initiator"]);
        }
    }

    syslog(LOG_USER | LOG_INFO,
           "registry: loaded %zu volume(s), %zu snapshot(s), %zu export(s)",
           volumes.size(), snapshots.size(), exports.size());
}

Lease VolumeRegistry::reserve(const std::string &id) {
    std::lock_guard<std::mutex> guard(lock);

    if (!leases.insert(id).second) {
        throw ZvmException(ZVM_ERR_ALREADY_LOCKED,
                           "Volume " + id +
                               " is locked by another operation");
    }
    return Lease(this, id);
}

void VolumeRegistry::release(const std::string &id) {
    std::lock_guard<std::mutex> guard(lock);
    leases.erase(id);
}

bool VolumeRegistry::isReserved(const std::string &id) const {
    std::lock_guard<std::mutex> guard(lock);
    return leases.find(id) != leases.end();
}

void VolumeRegistry::volumeWrite(const Volume &v) {
    db.exec("INSERT OR REPLACE INTO " _DB_TABLE_VOLS
            " (id, size_bytes, backing_path, state, created_at, "
            "origin_snapshot, serial) VALUES (" +
            Db::quote(v.id) + ", " + ZVM::to_string(v.size_bytes) + ", " +
            Db::quote(v.backing_path) + ", " +
            Db::quote(volume_state_str(v.state)) + ", " +
            ZVM::to_string(v.created_at) + ", " +
            Db::quote(v.origin_snapshot) + ", " + Db::quote(v.serial) + ");");
}

void VolumeRegistry::commit(const std::string &id,
                            zvm_volume_state new_state) {
    std::lock_guard<std::mutex> guard(lock);

    std::map<std::string, Volume>::iterator it = volumes.find(id);
    if (it == volumes.end()) {
        throw ZvmException(ZVM_ERR_NOT_FOUND_VOLUME,
                           "Volume " + id + " not found");
    }

    Volume v = it->second;
    zvm_volume_state old_state = v.state;
    v.state = new_state;
    volumeWrite(v);
    it->second = v;

    syslog(LOG_USER | LOG_INFO, "volume %s: %s -> %s", id.c_str(),
           volume_state_str(old_state), volume_state_str(new_state));
}

bool VolumeRegistry::get(const std::string &id, Volume &vol) const {
    std::lock_guard<std::mutex> guard(lock);

    std::map<std::string, Volume>::const_iterator it = volumes.find(id);
    if (it == volumes.end()) {
        return false;
    }
    vol = it->second;
    return true;
}

std::vector<Volume> VolumeRegistry::list() const {
    std::lock_guard<std::mutex> guard(lock);
    std::vector<Volume> rc;

    for (std::map<std::string, Volume>::const_iterator it = volumes.begin();
         it != volumes.end(); ++it) {
        rc.push_back(it->second);
    }
    return rc;
}

void VolumeRegistry::volumePut(const Volume &vol) {
    std::lock_guard<std::mutex> guard(lock);

    volumeWrite(vol);
    volumes[vol.id] = vol;
}

void VolumeRegistry::volumeRemove(const std::string &id) {
    std::lock_guard<std::mutex> guard(lock);

    db.exec("DELETE FROM " _DB_TABLE_VOLS " WHERE id = " + Db::quote(id) +
            ";");
    volumes.erase(id);
}

std::vector<std::string>
VolumeRegistry::clonesOf(const std::string &snap_id) const {
    std::lock_guard<std::mutex> guard(lock);
    std::vector<std::string> rc;

    for (std::map<std::string, Volume>::const_iterator it = volumes.begin();
         it != volumes.end(); ++it) {
        if (it->second.origin_snapshot == snap_id) {
            rc.push_back(it->first);
        }
    }
    return rc;
}

void VolumeRegistry::snapshotAdd(const Snapshot &snap) {
    std::lock_guard<std::mutex> guard(lock);

    if (snapshots.find(snap.id) != snapshots.end()) {
        throw ZvmException(ZVM_ERR_SNAPSHOT_NAME_CONFLICT,
                           "Snapshot " + snap.id + " already exists");
    }

    db.exec("INSERT INTO " _DB_TABLE_SNAPS
            " (id, volume_id, backing_path, size_bytes, created_at) "
            "VALUES (" +
            Db::quote(snap.id) + ", " + Db::quote(snap.volume_id) + ", " +
            Db::quote(snap.backing_path) + ", " +
            ZVM::to_string(snap.size_bytes) + ", " +
            ZVM::to_string(snap.created_at) + ");");
    snapshots[snap.id] = snap;
}

bool VolumeRegistry::snapshotGet(const std::string &id, Snapshot &snap) const {
    std::lock_guard<std::mutex> guard(lock);

    std::map<std::string, Snapshot>::const_iterator it = snapshots.find(id);
    if (it == snapshots.end()) {
        return false;
    }
    snap = it->second;
    return true;
}

void VolumeRegistry::snapshotRemove(const std::string &id) {
    std::lock_guard<std::mutex> guard(lock);

    db.exec("DELETE FROM " _DB_TABLE_SNAPS " WHERE id = " + Db::quote(id) +
            ";");
    snapshots.erase(id);
}

std::vector<Snapshot> VolumeRegistry::snapshotList() const {
    std::lock_guard<std::mutex> guard(lock);
    std::vector<Snapshot> rc;

    for (std::map<std::string, Snapshot>::const_iterator it =
             snapshots.begin();
         it != snapshots.end(); ++it) {
        rc.push_back(it->second);
    }
    return rc;
}

std::vector<Snapshot>
VolumeRegistry::snapshotsOf(const std::string &volume_id) const {
    std::lock_guard<std::mutex> guard(lock);
    std::vector<Snapshot> rc;

    for (std::map<std::string, Snapshot>::const_iterator it =
             snapshots.begin();
         it != snapshots.end(); ++it) {
        if (it->second.volume_id == volume_id) {
            rc.push_back(it->second);
        }
    }
    return rc;
}

void VolumeRegistry::exportPut(const Export &exp) {
    std::lock_guard<std::mutex> guard(lock);
    std::string vid = Db::quote(exp.volume_id);

    DbTransaction trans(db);

    db.exec("INSERT OR REPLACE INTO " _DB_TABLE_EXPS
            " (volume_id, target_iqn, tid, lun, portal) VALUES (" +
            vid + ", " + Db::quote(exp.target_iqn) + ", " +
            ZVM::to_string(exp.tid) + ", " + ZVM::to_string(exp.lun) + ", " +
            Db::quote(exp.portal) + ");");
    db.exec("DELETE FROM " _DB_TABLE_EXP_INITS " WHERE volume_id = " + vid +
            ";");
    for (std::set<std::string>::const_iterator it = exp.initiators.begin();
         it != exp.initiators.end(); ++it) {
        db.exec("INSERT INTO " _DB_TABLE_EXP_INITS
                " (volume_id, initiator) VALUES (" +
                vid + ", " + Db::quote(*it) + ");");
    }

    trans.commit();
    exports[exp.volume_id] = exp;
}

bool VolumeRegistry::exportGet(const std::string &volume_id,
                               Export &exp) const {
    std::lock_guard<std::mutex> guard(lock);

    std::map<std::string, Export>::const_iterator it = exports.find(volume_id);
    if (it == exports.end()) {
        return false;
    }
    exp = it->second;
    return true;
}

void VolumeRegistry::exportRemove(const std::string &volume_id) {
    std::lock_guard<std::mutex> guard(lock);
    std::string vid = Db::quote(volume_id);

    DbTransaction trans(db);
    db.exec("DELETE FROM " _DB_TABLE_EXP_INITS " WHERE volume_id = " + vid +
            ";");
    db.exec("DELETE FROM " _DB_TABLE_EXPS " WHERE volume_id = " + vid + ";");
    trans.commit();

    exports.erase(volume_id);
}

std::vector<Export> VolumeRegistry::exportList() const {
    std::lock_guard<std::mutex> guard(lock);
    std::vector<Export> rc;

    for (std::map<std::string, Export>::const_iterator it = exports.begin();
         it != exports.end(); ++it) {
        rc.push_back(it->second);
    }
    return rc;
}

ExportClaim VolumeRegistry::exportClaim(const std::string &volume_id) {
    std::lock_guard<std::mutex> guard(lock);

    if (exports.find(volume_id) != exports.end()) {
        throw ZvmException(ZVM_ERR_ALREADY_EXPORTED,
                           "Volume " + volume_id + " is already exported");
    }
    if (!export_claims.insert(volume_id).second) {
        throw ZvmException(ZVM_ERR_ALREADY_EXPORTED,
                           "Volume " + volume_id +
                               " is being exported by another request");
    }
    return ExportClaim(this, volume_id);
}

void VolumeRegistry::exportUnclaim(const std::string &volume_id) {
    std::lock_guard<std::mutex> guard(lock);
    export_claims.erase(volume_id);
}

} // namespace ZVM
