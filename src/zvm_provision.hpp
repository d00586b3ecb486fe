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

#ifndef ZVM_PROVISION_HPP
#define ZVM_PROVISION_HPP

#include "zvm_backend.hpp"
#include "zvm_export.hpp"
#include "zvm_registry.hpp"

#include <string>
#include <vector>

namespace ZVM {

#define ZVM_BLOCK_SIZE_DEFAULT 8192

/**
 * Entry point for every provisioning request.
 *
 * Mutating calls hold the lease of the volume they work on for their whole
 * duration.  Errors are raised as ZvmException with op and volume_id set to
 * the failed call.
 */
class ZVM_DLL_LOCAL ProvisioningApi {
  public:
    /**
     * Class ctor
     * @param reg           Volume registry
     * @param backend       Storage backend
     * @param exports       Export manager
     * @param block_size    Volume sizes are rounded up to this
     */
    ProvisioningApi(VolumeRegistry &reg, StorageBackend &backend,
                    ExportManager &exports,
                    uint64_t block_size = ZVM_BLOCK_SIZE_DEFAULT);

    /**
     * Create a volume.
     * @param id            New volume id
     * @param size_bytes    Requested size, rounded up to the block size
     * @return Volume in state available
     */
    Volume createVolume(const std::string &id, uint64_t size_bytes);

    /**
     * Delete a volume.  Success if the volume does not exist.
     * Raises ZVM_ERR_VOLUME_BUSY while exported and
     * ZVM_ERR_HAS_CHILD_DEPENDENCY while it has snapshots.
     */
    void deleteVolume(const std::string &id);

    /**
     * Export a volume over iSCSI to one initiator.
     * @param id            Volume id
     * @param initiator     Initiator iqn
     * @return Export, the volume is in-use afterwards.
     */
    Export createExport(const std::string &id, const std::string &initiator);

    /**
     * Remove the export of a volume.  Success if it is not exported.
     */
    void removeExport(const std::string &id);

    /**
     * Snapshot a volume.
     * @param id        Volume id
     * @param snap_id   Snapshot id, unique across all volumes
     * @return Snapshot
     */
    Snapshot createSnapshot(const std::string &id, const std::string &snap_id);

    /**
     * Delete a snapshot.  Success if the snapshot does not exist.
     */
    void deleteSnapshot(const std::string &snap_id);

    /**
     * Create a volume from a snapshot, same size as the snapshot's parent.
     * @param snap_id   Snapshot to clone
     * @param new_id    New volume id
     * @return Volume in state available
     */
    Volume createVolumeFromSnapshot(const std::string &snap_id,
                                    const std::string &new_id);

    /**
     * Grow a volume.
     * @param id        Volume id
     * @param new_size  New size in bytes, not smaller than the current one
     * @return Updated volume
     */
    Volume extendVolume(const std::string &id, uint64_t new_size);

    Export authorizeInitiator(const std::string &id,
                              const std::string &initiator);
    Export revokeInitiator(const std::string &id,
                           const std::string &initiator);

    /**
     * Check the export of a volume is present on the target helper.
     * Raises ZVM_ERR_NOT_FOUND_EXPORT if there is no export record and
     * ZVM_ERR_RECONCILIATION_MISMATCH if the target is missing.
     */
    Export checkForExport(const std::string &id);

    /**
     * Block device of a volume on this host.
     */
    std::string localPath(const std::string &id);

    Volume volumeGet(const std::string &id);
    std::vector<Volume> volumeList();
    std::vector<Snapshot> snapshotList();
    std::vector<Export> exportList();

    /**
     * Compare the registry against the backend and the target helper.
     * Volumes which do not match are marked error, nothing is deleted.
     * Volumes with an outstanding lease are skipped.
     */
    ReconcileReport reconcile(void);

  private:
    ProvisioningApi(const ProvisioningApi &) = delete;
    ProvisioningApi &operator=(const ProvisioningApi &) = delete;

    uint64_t sizeRound(uint64_t size_bytes) const;
    Volume volumeLookup(const std::string &id) const;
    std::string reconcileVolume(const Volume &v,
                                const std::set<std::string> &vols,
                                const std::set<std::string> &snaps,
                                const std::set<std::string> &tgts);

    VolumeRegistry &reg;
    StorageBackend &backend;
    ExportManager &exports;
    uint64_t block_size;
};

} // namespace ZVM

#endif
