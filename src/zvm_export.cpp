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

#include "zvm_export.hpp"
#include "zvm_ipc.hpp"

#include <algorithm>
#include <syslog.h>

namespace ZVM {

ExportManager::ExportManager(VolumeRegistry &reg, TargetAdmin &admin,
                             const std::string &target_prefix,
                             const std::string &portal)
    : reg(reg), admin(admin), prefix(target_prefix), portal(portal) {}

std::string ExportManager::targetIqn(const std::string &volume_id) const {
    return prefix + volume_id;
}

uint32_t ExportManager::tidAllocate(void) {
    std::lock_guard<std::mutex> guard(tid_lock);
    std::set<uint32_t> used(tid_pending);
    std::set<uint32_t> live = admin.listTids();
    std::vector<Export> exps = reg.exportList();

    used.insert(live.begin(), live.end());

    for (size_t i = 0; i < exps.size(); ++i) {
        used.insert(exps[i].tid);
    }

    uint32_t tid = 1;
    while (used.find(tid) != used.end()) {
        ++tid;
    }
    tid_pending.insert(tid);
    return tid;
}

void ExportManager::tidFree(uint32_t tid) {
    std::lock_guard<std::mutex> guard(tid_lock);
    tid_pending.erase(tid);
}

void ExportManager::rollback(const Export &exp, const ZvmException &cause) {
    syslog(LOG_USER | LOG_NOTICE, "Export of %s failed, removing target %s: %s",
           exp.volume_id.c_str(), exp.target_iqn.c_str(), cause.what());
    try {
        admin.removeTarget(exp.volume_id, exp.target_iqn, exp.tid);
    } catch (const ZvmException &re) {
        throw rollback_failed(exp.target_iqn, cause, re);
    }
}

Export ExportManager::createExport(const std::string &volume_id,
                                   const std::string &device,
                                   const std::string &serial,
                                   const std::set<std::string> &initiators) {
    Export exp;

    if (reg.exportGet(volume_id, exp)) {
        throw ZvmException(ZVM_ERR_ALREADY_EXPORTED,
                           "Volume " + volume_id + " is already exported as " +
                               exp.target_iqn);
    }

    exp.volume_id = volume_id;
    exp.target_iqn = targetIqn(volume_id);
    exp.portal = portal;
    exp.initiators = initiators;
    if (admin.usesTid()) {
        exp.tid = tidAllocate();
    }

    try {
        exp.lun = admin.createTarget(volume_id, exp.target_iqn, exp.tid,
                                     device, serial, portal);
    } catch (const ZvmException &e) {
        if (e.error_code != ZVM_ERR_RECONCILIATION_MISMATCH) {
            tidFree(exp.tid);
        }
        throw;
    }

    try {
        std::set<std::string>::const_iterator i;
        for (i = initiators.begin(); i != initiators.end(); ++i) {
            admin.bindInitiator(exp.target_iqn, exp.tid, *i);
        }

        reg.exportPut(exp);
    } catch (const ZvmException &e) {
        // A target left behind by a failed rollback keeps its tid reserved
        rollback(exp, e);
        tidFree(exp.tid);
        throw;
    }

    tidFree(exp.tid);
    return exp;
}

void ExportManager::removeExport(const std::string &volume_id) {
    Export exp;

    if (!reg.exportGet(volume_id, exp)) {
        syslog(LOG_USER | LOG_DEBUG, "Volume %s has no export",
               volume_id.c_str());
        return;
    }

    admin.removeTarget(volume_id, exp.target_iqn, exp.tid);
    reg.exportRemove(volume_id);
}

Export ExportManager::authorizeInitiator(const std::string &volume_id,
                                         const std::string &initiator) {
    Export exp;

    if (!reg.exportGet(volume_id, exp)) {
        throw ZvmException(ZVM_ERR_NOT_FOUND_EXPORT,
                           "Volume " + volume_id + " is not exported");
    }

    if (exp.initiators.find(initiator) != exp.initiators.end()) {
        return exp;
    }

    admin.bindInitiator(exp.target_iqn, exp.tid, initiator);
    exp.initiators.insert(initiator);
    reg.exportPut(exp);
    return exp;
}

Export ExportManager::revokeInitiator(const std::string &volume_id,
                                      const std::string &initiator) {
    Export exp;

    if (!reg.exportGet(volume_id, exp)) {
        throw ZvmException(ZVM_ERR_NOT_FOUND_EXPORT,
                           "Volume " + volume_id + " is not exported");
    }

    if (exp.initiators.find(initiator) == exp.initiators.end()) {
        return exp;
    }

    admin.unbindInitiator(exp.target_iqn, exp.tid, initiator);
    exp.initiators.erase(initiator);
    reg.exportPut(exp);
    return exp;
}

bool ExportManager::exportExists(const std::string &volume_id) {
    Export exp;

    if (!reg.exportGet(volume_id, exp)) {
        throw ZvmException(ZVM_ERR_NOT_FOUND_EXPORT,
                           "Volume " + volume_id + " is not exported");
    }

    std::vector<std::string> t = admin.listTargets();
    return std::find(t.begin(), t.end(), exp.target_iqn) != t.end();
}

std::vector<std::string> ExportManager::targets() {
    return admin.listTargets();
}

} // namespace ZVM
