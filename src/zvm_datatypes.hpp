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

#ifndef ZVM_DATATYPES_HPP
#define ZVM_DATATYPES_HPP

#include "libzvolmgmt/libzvolmgmt_common.h"
#include "libzvolmgmt/libzvolmgmt_error.h"
#include "libzvolmgmt/libzvolmgmt_types.h"

#include <set>
#include <stdint.h>
#include <string>
#include <vector>

namespace ZVM {

#define ZVM_ID_MAX_LEN 200

/**
 * A ZFS backed block volume as known to the registry.
 */
struct ZVM_DLL_LOCAL Volume {
    Volume();

    std::string id;
    uint64_t size_bytes;
    std::string backing_path;
    zvm_volume_state state;
    uint64_t created_at; /* Seconds since epoch */
    std::string origin_snapshot; /* Snapshot id this volume was cloned from */
    std::string serial; /* SCSI unit serial number */
};

/**
 * Point in time copy of a volume, id is unique across all volumes.
 */
struct ZVM_DLL_LOCAL Snapshot {
    Snapshot();

    std::string id;
    std::string volume_id;
    std::string backing_path;
    uint64_t size_bytes; /* Size of the volume when the snapshot was taken */
    uint64_t created_at;
};

/**
 * iSCSI target exporting one volume.
 */
struct ZVM_DLL_LOCAL Export {
    Export();

    std::string volume_id;
    std::string target_iqn;
    uint32_t tid; /* Target number, only meaningful for tgtadm */
    uint32_t lun;
    std::string portal;
    std::set<std::string> initiators;
};

/**
 * Outcome of comparing the registry with the backend.
 */
struct ZVM_DLL_LOCAL ReconcileReport {
    std::vector<std::string> checked;
    std::vector<std::string> marked_error;
    std::vector<std::string> orphans;
    std::vector<std::string> skipped; /* Lease held by a running operation */
};

/**
 * String form of a volume state, as stored and sent over IPC.
 * @param state     State to convert
 * @return "creating", "available", "in-use", "deleting", "error" or
 *         "unknown"
 */
ZVM_DLL_LOCAL const char *volume_state_str(zvm_volume_state state);

/**
 * Parse the string form of a volume state.
 * @param s     String to parse
 * @return Enumerated state, ZVM_VOLUME_STATE_UNKNOWN if not recognized.
 */
ZVM_DLL_LOCAL zvm_volume_state volume_state_from_str(const std::string &s);

/**
 * Check a volume or snapshot identifier.  Identifiers end up in zfs dataset
 * names and target IQNs, so only [A-Za-z0-9_.:-] is accepted and the first
 * character cannot be '-' or '.'.
 * @param id    Identifier to check
 * @return ZVM_ERR_OK or ZVM_ERR_INVALID_ARGUMENT
 */
ZVM_DLL_LOCAL int id_validate(const std::string &id);

/**
 * Validates an iSCSI iqn
 * @param iqn       iSCSI iqn string to validate
 * @return ZVM_ERR_OK on success, else ZVM_ERR_INVALID_ARGUMENT
 */
ZVM_DLL_LOCAL int iqn_validate(const std::string &iqn);

} // namespace ZVM

#endif
