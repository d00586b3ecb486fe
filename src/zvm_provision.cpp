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

#include "zvm_provision.hpp"
#include "zvm_ipc.hpp"
#include "zvm_utils.hpp"

#include <syslog.h>

namespace ZVM {

static ZvmException api_error(const ZvmException &e, const char *op,
                              const std::string &id) {
    ZvmException rc(e, op, id);
    syslog(LOG_USER | LOG_ERR, "%s", rc.what());
    return rc;
}

static void id_check(const std::string &id, const char *what) {
    if (id_validate(id) != ZVM_ERR_OK) {
        throw ZvmException(ZVM_ERR_INVALID_ARGUMENT,
                           std::string("Invalid ") + what + " id '" + id +
                               "'");
    }
}

static void initiator_check(const std::string &initiator) {
    if (iqn_validate(initiator) != ZVM_ERR_OK) {
        throw ZvmException(ZVM_ERR_INVALID_ARGUMENT,
                           "Invalid initiator iqn '" + initiator + "'");
    }
}

/* Volume must be settled and usable */
static void ready_check(const Volume &v) {
    if (v.state != ZVM_VOLUME_STATE_AVAILABLE &&
        v.state != ZVM_VOLUME_STATE_IN_USE) {
        throw ZvmException(ZVM_ERR_VOLUME_NOT_READY,
                           "Volume " + v.id + " is " +
                               volume_state_str(v.state));
    }
}

ProvisioningApi::ProvisioningApi(VolumeRegistry &reg, StorageBackend &backend,
                                 ExportManager &exports, uint64_t block_size)
    : reg(reg), backend(backend), exports(exports), block_size(block_size) {}

uint64_t ProvisioningApi::sizeRound(uint64_t size_bytes) const {
    uint64_t rc = _blk_size_rounding(size_bytes, block_size);

    if (size_bytes == 0 || rc == 0) {
        throw ZvmException(ZVM_ERR_INVALID_ARGUMENT,
                           "Invalid size " + ZVM::to_string(size_bytes));
    }
    return rc;
}

Volume ProvisioningApi::volumeLookup(const std::string &id) const {
    Volume v;

    if (!reg.get(id, v)) {
        throw ZvmException(ZVM_ERR_NOT_FOUND_VOLUME,
                           "Volume " + id + " not found");
    }
    return v;
}

Volume ProvisioningApi::createVolume(const std::string &id,
                                     uint64_t size_bytes) {
    try {
        id_check(id, "volume");
        uint64_t size = sizeRound(size_bytes);

        Lease lease = reg.reserve(id);
        Volume v;

        if (reg.get(id, v)) {
            throw ZvmException(ZVM_ERR_NAME_CONFLICT,
                               "Volume " + id + " already exists");
        }

        v.id = id;
        v.size_bytes = size;
        v.backing_path = backend.backingPath(id);
        v.state = ZVM_VOLUME_STATE_CREATING;
        v.created_at = _time_now();
        v.serial = _volume_serial(id);
        reg.volumePut(v);

        try {
            v.backing_path = backend.createVolume(id, size);
        } catch (const ZvmException &) {
            reg.volumeRemove(id);
            throw;
        }

        reg.commit(id, ZVM_VOLUME_STATE_AVAILABLE);
        v.state = ZVM_VOLUME_STATE_AVAILABLE;
        return v;
    } catch (const ZvmException &e) {
        throw api_error(e, "create_volume", id);
    }
}

void ProvisioningApi::deleteVolume(const std::string &id) {
    try {
        id_check(id, "volume");

        Lease lease = reg.reserve(id);
        Volume v;
        Export exp;

        if (!reg.get(id, v)) {
            syslog(LOG_USER | LOG_DEBUG, "delete_volume: %s does not exist",
                   id.c_str());
            return;
        }

        if (v.state == ZVM_VOLUME_STATE_IN_USE || reg.exportGet(id, exp)) {
            throw ZvmException(ZVM_ERR_VOLUME_BUSY,
                               "Volume " + id + " is exported");
        }
        if (v.state == ZVM_VOLUME_STATE_CREATING ||
            v.state == ZVM_VOLUME_STATE_DELETING) {
            throw ZvmException(ZVM_ERR_VOLUME_NOT_READY,
                               "Volume " + id + " is " +
                                   volume_state_str(v.state));
        }
        if (!reg.snapshotsOf(id).empty()) {
            throw ZvmException(ZVM_ERR_HAS_CHILD_DEPENDENCY,
                               "Volume " + id + " has snapshots");
        }

        reg.commit(id, ZVM_VOLUME_STATE_DELETING);
        try {
            backend.deleteVolume(v.backing_path);
        } catch (const ZvmException &) {
            reg.commit(id, ZVM_VOLUME_STATE_ERROR);
            throw;
        }
        reg.volumeRemove(id);
        syslog(LOG_USER | LOG_INFO, "volume %s: removed", id.c_str());
    } catch (const ZvmException &e) {
        throw api_error(e, "delete_volume", id);
    }
}

Export ProvisioningApi::createExport(const std::string &id,
                                     const std::string &initiator) {
    try {
        id_check(id, "volume");
        initiator_check(initiator);

        // Claim first so racing exports of one volume see ALREADY_EXPORTED
        ExportClaim claim = reg.exportClaim(id);
        Lease lease = reg.reserve(id);
        Volume v = volumeLookup(id);

        if (v.state == ZVM_VOLUME_STATE_IN_USE) {
            throw ZvmException(ZVM_ERR_ALREADY_EXPORTED,
                               "Volume " + id + " is already exported");
        }
        if (v.state != ZVM_VOLUME_STATE_AVAILABLE) {
            throw ZvmException(ZVM_ERR_VOLUME_NOT_READY,
                               "Volume " + id + " is " +
                                   volume_state_str(v.state));
        }

        std::set<std::string> initiators;
        initiators.insert(initiator);

        Export exp;
        try {
            exp = exports.createExport(id, backend.devicePath(v.backing_path),
                                       v.serial, initiators);
        } catch (const ZvmException &e) {
            if (e.error_code == ZVM_ERR_RECONCILIATION_MISMATCH) {
                reg.commit(id, ZVM_VOLUME_STATE_ERROR);
            }
            throw;
        }

        reg.commit(id, ZVM_VOLUME_STATE_IN_USE);
        return exp;
    } catch (const ZvmException &e) {
        throw api_error(e, "create_export", id);
    }
}

void ProvisioningApi::removeExport(const std::string &id) {
    try {
        Lease lease = reg.reserve(id);
        Volume v;
        bool known = reg.get(id, v);

        exports.removeExport(id);
        if (known && v.state == ZVM_VOLUME_STATE_IN_USE) {
            reg.commit(id, ZVM_VOLUME_STATE_AVAILABLE);
        }
    } catch (const ZvmException &e) {
        throw api_error(e, "remove_export", id);
    }
}

Snapshot ProvisioningApi::createSnapshot(const std::string &id,
                                         const std::string &snap_id) {
    try {
        id_check(snap_id, "snapshot");

        Lease lease = reg.reserve(id);
        Volume v = volumeLookup(id);
        Snapshot s;

        ready_check(v);
        if (reg.snapshotGet(snap_id, s)) {
            throw ZvmException(ZVM_ERR_SNAPSHOT_NAME_CONFLICT,
                               "Snapshot " + snap_id + " already exists");
        }

        s.id = snap_id;
        s.volume_id = id;
        s.size_bytes = v.size_bytes;
        s.created_at = _time_now();
        s.backing_path = backend.createSnapshot(v.backing_path, snap_id);

        try {
            reg.snapshotAdd(s);
        } catch (const ZvmException &e) {
            // Same snapshot id taken on another volume meanwhile
            try {
                backend.deleteSnapshot(s.backing_path);
            } catch (const ZvmException &de) {
                throw ZvmException(ZVM_ERR_RECONCILIATION_MISMATCH,
                                   "Snapshot " + s.backing_path +
                                       " left behind: " + de.what(),
                                   std::string(e.what()) + "\n" + de.debug);
            }
            throw;
        }
        return s;
    } catch (const ZvmException &e) {
        throw api_error(e, "create_snapshot", id);
    }
}

void ProvisioningApi::deleteSnapshot(const std::string &snap_id) {
    try {
        Snapshot s;

        if (!reg.snapshotGet(snap_id, s)) {
            syslog(LOG_USER | LOG_DEBUG, "delete_snapshot: %s does not exist",
                   snap_id.c_str());
            return;
        }

        Lease lease = reg.reserve(s.volume_id);

        if (!reg.snapshotGet(snap_id, s)) {
            return;
        }
        if (!reg.clonesOf(snap_id).empty()) {
            throw ZvmException(ZVM_ERR_HAS_CHILD_DEPENDENCY,
                               "Snapshot " + snap_id +
                                   " has volumes cloned from it");
        }

        backend.deleteSnapshot(s.backing_path);
        reg.snapshotRemove(snap_id);
    } catch (const ZvmException &e) {
        throw api_error(e, "delete_snapshot", snap_id);
    }
}

Volume ProvisioningApi::createVolumeFromSnapshot(const std::string &snap_id,
                                                 const std::string &new_id) {
    try {
        id_check(new_id, "volume");

        Snapshot s;
        Volume v;

        if (!reg.snapshotGet(snap_id, s)) {
            throw ZvmException(ZVM_ERR_NOT_FOUND_SNAPSHOT,
                               "Snapshot " + snap_id + " not found");
        }

        Lease lease = reg.reserve(new_id);
        if (reg.get(new_id, v)) {
            throw ZvmException(ZVM_ERR_NAME_CONFLICT,
                               "Volume " + new_id + " already exists");
        }

        Lease parent_lease = reg.reserve(s.volume_id);
        if (!reg.snapshotGet(snap_id, s)) {
            throw ZvmException(ZVM_ERR_NOT_FOUND_SNAPSHOT,
                               "Snapshot " + snap_id + " not found");
        }
        volumeLookup(s.volume_id);

        v.id = new_id;
        v.size_bytes = s.size_bytes;
        v.backing_path = backend.backingPath(new_id);
        v.state = ZVM_VOLUME_STATE_CREATING;
        v.created_at = _time_now();
        v.origin_snapshot = snap_id;
        v.serial = _volume_serial(new_id);
        reg.volumePut(v);

        try {
            v.backing_path = backend.cloneFromSnapshot(s.backing_path, new_id);
        } catch (const ZvmException &) {
            reg.volumeRemove(new_id);
            throw;
        }

        reg.commit(new_id, ZVM_VOLUME_STATE_AVAILABLE);
        v.state = ZVM_VOLUME_STATE_AVAILABLE;
        return v;
    } catch (const ZvmException &e) {
        throw api_error(e, "create_volume_from_snapshot", new_id);
    }
}

Volume ProvisioningApi::extendVolume(const std::string &id,
                                     uint64_t new_size) {
    try {
        Lease lease = reg.reserve(id);
        Volume v = volumeLookup(id);

        ready_check(v);
        if (new_size < v.size_bytes) {
            throw ZvmException(ZVM_ERR_NO_SUPPORT_SHRINK,
                               "Volume " + id + " is " +
                                   ZVM::to_string(v.size_bytes) +
                                   " bytes, cannot shrink to " +
                                   ZVM::to_string(new_size));
        }

        uint64_t size = sizeRound(new_size);
        backend.resizeVolume(v.backing_path, size);

        v.size_bytes = size;
        reg.volumePut(v);
        syslog(LOG_USER | LOG_INFO, "volume %s: size %llu", id.c_str(),
               (unsigned long long)size);
        return v;
    } catch (const ZvmException &e) {
        throw api_error(e, "extend_volume", id);
    }
}

Export ProvisioningApi::authorizeInitiator(const std::string &id,
                                           const std::string &initiator) {
    try {
        initiator_check(initiator);

        Lease lease = reg.reserve(id);
        volumeLookup(id);
        return exports.authorizeInitiator(id, initiator);
    } catch (const ZvmException &e) {
        throw api_error(e, "authorize_initiator", id);
    }
}

Export ProvisioningApi::revokeInitiator(const std::string &id,
                                        const std::string &initiator) {
    try {
        initiator_check(initiator);

        Lease lease = reg.reserve(id);
        volumeLookup(id);
        return exports.revokeInitiator(id, initiator);
    } catch (const ZvmException &e) {
        throw api_error(e, "revoke_initiator", id);
    }
}

Export ProvisioningApi::checkForExport(const std::string &id) {
    try {
        Export exp;

        if (!reg.exportGet(id, exp)) {
            throw ZvmException(ZVM_ERR_NOT_FOUND_EXPORT,
                               "Volume " + id + " is not exported");
        }
        if (!exports.exportExists(id)) {
            throw ZvmException(ZVM_ERR_RECONCILIATION_MISMATCH,
                               "Target " + exp.target_iqn +
                                   " is not configured");
        }

        Volume v = volumeLookup(id);
        if (!backend.volumeExists(v.backing_path)) {
            throw ZvmException(ZVM_ERR_RECONCILIATION_MISMATCH,
                               "Target " + exp.target_iqn + " exports " +
                                   v.backing_path + " which does not exist");
        }
        return exp;
    } catch (const ZvmException &e) {
        throw api_error(e, "check_for_export", id);
    }
}

std::string ProvisioningApi::localPath(const std::string &id) {
    try {
        return backend.devicePath(volumeLookup(id).backing_path);
    } catch (const ZvmException &e) {
        throw api_error(e, "local_path", id);
    }
}

Volume ProvisioningApi::volumeGet(const std::string &id) {
    try {
        return volumeLookup(id);
    } catch (const ZvmException &e) {
        throw ZvmException(e, "volume_get", id);
    }
}

std::vector<Volume> ProvisioningApi::volumeList() { return reg.list(); }

std::vector<Snapshot> ProvisioningApi::snapshotList() {
    return reg.snapshotList();
}

std::vector<Export> ProvisioningApi::exportList() { return reg.exportList(); }

/*
 * Returns why v no longer matches the backend, empty if it does.  A
 * creating volume found on the backend is committed as available.
 */
std::string ProvisioningApi::reconcileVolume(
    const Volume &v, const std::set<std::string> &vols,
    const std::set<std::string> &snaps, const std::set<std::string> &tgts) {
    Export exp;
    bool exported = reg.exportGet(v.id, exp);
    zvm_volume_state state = v.state;

    if (vols.find(v.backing_path) == vols.end()) {
        return "backing dataset " + v.backing_path + " is missing";
    }

    if (state == ZVM_VOLUME_STATE_CREATING) {
        reg.commit(v.id, ZVM_VOLUME_STATE_AVAILABLE);
        state = ZVM_VOLUME_STATE_AVAILABLE;
    } else if (state == ZVM_VOLUME_STATE_DELETING) {
        return "delete was interrupted";
    }

    if (exported && tgts.find(exp.target_iqn) == tgts.end()) {
        return "target " + exp.target_iqn + " is missing";
    }
    if (state == ZVM_VOLUME_STATE_IN_USE && !exported) {
        return "in-use without an export";
    }
    if (state == ZVM_VOLUME_STATE_AVAILABLE && exported) {
        return "exported while available";
    }

    std::vector<Snapshot> ss = reg.snapshotsOf(v.id);
    for (size_t i = 0; i < ss.size(); ++i) {
        if (snaps.find(ss[i].backing_path) == snaps.end()) {
            return "snapshot " + ss[i].backing_path + " is missing";
        }
    }
    return "";
}

ReconcileReport ProvisioningApi::reconcile(void) {
    try {
        ReconcileReport r;
        std::vector<std::string> l;
        std::set<std::string> known;

        l = backend.listVolumes();
        std::set<std::string> vols(l.begin(), l.end());
        l = backend.listSnapshots();
        std::set<std::string> snaps(l.begin(), l.end());
        l = exports.targets();
        std::set<std::string> tgts(l.begin(), l.end());

        std::vector<Volume> all = reg.list();
        for (size_t i = 0; i < all.size(); ++i) {
            Lease lease;
            Volume v;

            known.insert(all[i].backing_path);

            try {
                lease = reg.reserve(all[i].id);
            } catch (const ZvmException &e) {
                if (e.error_code != ZVM_ERR_ALREADY_LOCKED) {
                    throw;
                }
                r.skipped.push_back(all[i].id);
                continue;
            }

            if (!reg.get(all[i].id, v)) {
                continue;
            }
            r.checked.push_back(v.id);

            std::string why = reconcileVolume(v, vols, snaps, tgts);
            if (why.empty()) {
                continue;
            }

            syslog(LOG_USER | LOG_WARNING, "reconcile: volume %s: %s",
                   v.id.c_str(), why.c_str());
            if (v.state != ZVM_VOLUME_STATE_ERROR) {
                reg.commit(v.id, ZVM_VOLUME_STATE_ERROR);
                r.marked_error.push_back(v.id);
            }
        }

        std::set<std::string>::const_iterator it;
        for (it = vols.begin(); it != vols.end(); ++it) {
            if (known.find(*it) == known.end()) {
                syslog(LOG_USER | LOG_WARNING,
                       "reconcile: %s is not in the registry", it->c_str());
                r.orphans.push_back(*it);
            }
        }

        syslog(LOG_USER | LOG_INFO,
               "reconcile: %zu checked, %zu marked error, %zu orphans, "
               "%zu skipped",
               r.checked.size(), r.marked_error.size(), r.orphans.size(),
               r.skipped.size());
        return r;
    } catch (const ZvmException &e) {
        throw api_error(e, "reconcile", "");
    }
}

} // namespace ZVM
