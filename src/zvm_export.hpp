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

#ifndef ZVM_EXPORT_HPP
#define ZVM_EXPORT_HPP

#include "zvm_ipc.hpp"
#include "zvm_registry.hpp"
#include "zvm_target.hpp"

#include <mutex>
#include <set>
#include <string>

namespace ZVM {

#define ZVM_TARGET_PREFIX_DEFAULT "iqn.2010-10.org.openstack:"

/**
 * Manages the iSCSI target bound to a volume.  Callers hold the volume
 * lease, the manager only guards its own target id allocation.
 */
class ZVM_DLL_LOCAL ExportManager {
  public:
    /**
     * Class ctor
     * @param reg           Registry export records are kept in
     * @param admin         Target helper
     * @param target_prefix Prefix of every target iqn
     * @param portal        "ip:port" reported with each export
     */
    ExportManager(VolumeRegistry &reg, TargetAdmin &admin,
                  const std::string &target_prefix,
                  const std::string &portal);

    /**
     * Target name for a volume.
     */
    std::string targetIqn(const std::string &volume_id) const;

    /**
     * Export a volume.  Phase one creates the target and LUN, phase two
     * binds the initiators.  A failure in either phase removes the target
     * again and the original error is raised.  If that removal fails too,
     * ZVM_ERR_RECONCILIATION_MISMATCH is raised with both causes.
     * @param volume_id     Volume to export
     * @param device        Block device of the volume
     * @param serial        SCSI serial of the volume
     * @param initiators    Initiators allowed to log in
     * @return Export, already recorded in the registry.
     */
    Export createExport(const std::string &volume_id, const std::string &device,
                        const std::string &serial,
                        const std::set<std::string> &initiators);

    /**
     * Remove the export of a volume, no-op if there is none.
     */
    void removeExport(const std::string &volume_id);

    /**
     * Add an initiator to the ACL of an existing export.
     * Raises ZVM_ERR_NOT_FOUND_EXPORT if the volume is not exported.
     */
    Export authorizeInitiator(const std::string &volume_id,
                              const std::string &initiator);

    /**
     * Remove an initiator from the ACL of an existing export.
     * Raises ZVM_ERR_NOT_FOUND_EXPORT if the volume is not exported.
     */
    Export revokeInitiator(const std::string &volume_id,
                           const std::string &initiator);

    /**
     * true if the target recorded for volume_id is configured on the
     * target helper.
     * Raises ZVM_ERR_NOT_FOUND_EXPORT if there is no record.
     */
    bool exportExists(const std::string &volume_id);

    /**
     * Target names configured on the target helper.
     */
    std::vector<std::string> targets();

  private:
    ExportManager(const ExportManager &) = delete;
    ExportManager &operator=(const ExportManager &) = delete;

    uint32_t tidAllocate(void);
    void tidFree(uint32_t tid);
    void rollback(const Export &exp, const ZvmException &cause);

    VolumeRegistry &reg;
    TargetAdmin &admin;
    std::string prefix;
    std::string portal;

    std::mutex tid_lock;
    std::set<uint32_t> tid_pending;
};

} // namespace ZVM

#endif
