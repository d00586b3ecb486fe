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

#ifndef ZVM_TARGET_HPP
#define ZVM_TARGET_HPP

#include "zvm_exec.hpp"
#include "zvm_ipc.hpp"

#include <set>
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

namespace ZVM {

#define ZVM_TGTADM_CMD    "tgtadm"
#define ZVM_TARGETCLI_CMD "targetcli"

/**
 * iSCSI target administration.  Removal of something already absent is
 * success.  Failures are raised as ZvmException.
 */
class ZVM_DLL_LOCAL TargetAdmin {
  public:
    virtual ~TargetAdmin() {}

    /**
     * true if targets are addressed by a caller allocated number.
     */
    virtual bool usesTid() const = 0;

    /**
     * Creates a target with one LUN backed by a block device.  On failure
     * only the steps this call completed are undone, objects which were
     * already there are never touched.  If undoing fails the error is
     * ZVM_ERR_RECONCILIATION_MISMATCH.
     * @param volume_id     Volume id, used to name backing objects
     * @param iqn           Target name
     * @param tid           Target number when usesTid()
     * @param device        Block device
     * @param serial        SCSI unit serial number
     * @param portal        "ip:port" the target listens on
     * @return LUN number of the data LUN
     */
    virtual uint32_t createTarget(const std::string &volume_id,
                                  const std::string &iqn, uint32_t tid,
                                  const std::string &device,
                                  const std::string &serial,
                                  const std::string &portal) = 0;

    /**
     * Removes a target and everything createTarget made for it.
     * @param volume_id     Volume id
     * @param iqn           Target name
     * @param tid           Target number when usesTid()
     */
    virtual void removeTarget(const std::string &volume_id,
                              const std::string &iqn, uint32_t tid) = 0;

    /**
     * Allow an initiator to log in to a target.
     * @param iqn           Target name
     * @param tid           Target number when usesTid()
     * @param initiator     Initiator iqn
     */
    virtual void bindInitiator(const std::string &iqn, uint32_t tid,
                               const std::string &initiator) = 0;

    /**
     * Revoke an initiator's access to a target.
     * @param iqn           Target name
     * @param tid           Target number when usesTid()
     * @param initiator     Initiator iqn
     */
    virtual void unbindInitiator(const std::string &iqn, uint32_t tid,
                                 const std::string &initiator) = 0;

    /**
     * Names of every target currently configured.
     */
    virtual std::vector<std::string> listTargets() = 0;

    /**
     * Target numbers in use on the helper, including targets not created
     * by us.  Empty when !usesTid().
     */
    virtual std::set<uint32_t> listTids() = 0;
};

/**
 * scsi-target-utils.  LUN 0 is the controller so data lives on LUN 1.
 */
class ZVM_DLL_LOCAL TgtAdm : public TargetAdmin {
  public:
    TgtAdm(Executor &exec, uint32_t timeout,
           const std::string &tgtadm_cmd = ZVM_TGTADM_CMD);

    bool usesTid() const { return true; }
    uint32_t createTarget(const std::string &volume_id, const std::string &iqn,
                          uint32_t tid, const std::string &device,
                          const std::string &serial,
                          const std::string &portal);
    void removeTarget(const std::string &volume_id, const std::string &iqn,
                      uint32_t tid);
    void bindInitiator(const std::string &iqn, uint32_t tid,
                       const std::string &initiator);
    void unbindInitiator(const std::string &iqn, uint32_t tid,
                         const std::string &initiator);
    std::vector<std::string> listTargets();
    std::set<uint32_t> listTids();

  private:
    CommandResult tgtadm(const std::vector<std::string> &args);
    std::vector<std::pair<uint32_t, std::string> > show();

    Executor &exec;
    uint32_t tmo;
    std::string cmd;
};

/**
 * LIO configured through targetcli.  The block backstore is named after
 * the volume id and the data LUN is 0.
 */
class ZVM_DLL_LOCAL LioAdm : public TargetAdmin {
  public:
    LioAdm(Executor &exec, uint32_t timeout,
           const std::string &targetcli_cmd = ZVM_TARGETCLI_CMD);

    bool usesTid() const { return false; }
    uint32_t createTarget(const std::string &volume_id, const std::string &iqn,
                          uint32_t tid, const std::string &device,
                          const std::string &serial,
                          const std::string &portal);
    void removeTarget(const std::string &volume_id, const std::string &iqn,
                      uint32_t tid);
    void bindInitiator(const std::string &iqn, uint32_t tid,
                       const std::string &initiator);
    void unbindInitiator(const std::string &iqn, uint32_t tid,
                         const std::string &initiator);
    std::vector<std::string> listTargets();
    std::set<uint32_t> listTids() { return std::set<uint32_t>(); }

  private:
    CommandResult targetcli(const std::vector<std::string> &args);
    void createUndo(const ZvmException &cause, const std::string &volume_id,
                    const std::string &iqn, bool target_created);

    Executor &exec;
    uint32_t tmo;
    std::string cmd;
};

/**
 * Error for a target which could not be removed after a failed create.
 * @param iqn           Target name
 * @param cause         Why the create failed
 * @param undo          Why the removal failed
 */
ZVM_DLL_LOCAL ZvmException rollback_failed(const std::string &iqn,
                                           const ZvmException &cause,
                                           const ZvmException &undo);

/**
 * Split "ip:port".  A missing port yields 3260.
 * @return false if the port is not a number in 1..65535
 */
ZVM_DLL_LOCAL bool portal_split(const std::string &portal, std::string &ip,
                                std::string &port);

} // namespace ZVM

#endif
