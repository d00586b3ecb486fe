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

#include "zvm_target.hpp"
#include "zvm_datatypes.hpp"
#include "zvm_ipc.hpp"
#include "zvm_utils.hpp"

#include <stdlib.h>
#include <syslog.h>

namespace ZVM {

#define TGT_DATA_LUN 1
#define LIO_DATA_LUN 0
#define LIO_ANY_IP   "0.0.0.0"
#define ISCSI_PORT   "3260"

/* Messages tgtadm and targetcli print for objects which are not there */
static const char *absent_msgs[] = {"can't find", "no such",
                                    "does not exist", "not found",
                                    "no storage object"};

static bool is_absent(const ZvmException &e) {
    if (e.error_code != ZVM_ERR_EXEC_FAILURE) {
        return false;
    }
    for (size_t i = 0; i < sizeof(absent_msgs) / sizeof(absent_msgs[0]); ++i) {
        if (_str_icontains(e.debug, absent_msgs[i]) ||
            _str_icontains(e.debug_data, absent_msgs[i])) {
            return true;
        }
    }
    return false;
}

ZvmException rollback_failed(const std::string &iqn,
                             const ZvmException &cause,
                             const ZvmException &undo) {
    syslog(LOG_USER | LOG_ERR, "Failed to remove target %s: %s", iqn.c_str(),
           undo.what());

    ZvmException rc(ZVM_ERR_RECONCILIATION_MISMATCH,
                    "Target " + iqn + " left behind after failed export: " +
                        undo.what(),
                    std::string("export: ") + cause.what() + " " +
                        cause.debug + "\nrollback: " + undo.debug);
    rc.exit_code = undo.exit_code;
    return rc;
}

bool portal_split(const std::string &portal, std::string &ip,
                  std::string &port) {
    size_t colon = portal.rfind(':');
    size_t bracket = portal.rfind(']');

    if (colon == std::string::npos ||
        (bracket != std::string::npos && colon < bracket)) {
        ip = portal;
        port = ISCSI_PORT;
    } else {
        ip = portal.substr(0, colon);
        port = portal.substr(colon + 1);
    }

    if (ip.size() >= 2 && ip[0] == '[' && ip[ip.size() - 1] == ']') {
        ip = ip.substr(1, ip.size() - 2);
    }

    char *end = NULL;
    long p = strtol(port.c_str(), &end, 10);
    return !ip.empty() && !port.empty() && *end == '\0' && p > 0 && p < 65536;
}

TgtAdm::TgtAdm(Executor &exec, uint32_t timeout,
               const std::string &tgtadm_cmd)
    : exec(exec), tmo(timeout), cmd(tgtadm_cmd) {}

CommandResult TgtAdm::tgtadm(const std::vector<std::string> &args) {
    std::vector<std::string> a;
    a.push_back("--lld");
    a.push_back("iscsi");
    a.insert(a.end(), args.begin(), args.end());
    return exec.run(cmd, a, tmo);
}

uint32_t TgtAdm::createTarget(const std::string &volume_id,
                              const std::string &iqn, uint32_t tid,
                              const std::string &device,
                              const std::string &serial,
                              const std::string &portal) {
    std::string t = ZVM::to_string(tid);
    std::string lun = ZVM::to_string(TGT_DATA_LUN);
    std::vector<std::string> args;

    // A tid taken by someone else fails here with nothing to undo
    args.push_back("--op");
    args.push_back("new");
    args.push_back("--mode");
    args.push_back("target");
    args.push_back("--tid");
    args.push_back(t);
    args.push_back("-T");
    args.push_back(iqn);
    tgtadm(args);

    try {
        args.clear();
        args.push_back("--op");
        args.push_back("new");
        args.push_back("--mode");
        args.push_back("logicalunit");
        args.push_back("--tid");
        args.push_back(t);
        args.push_back("--lun");
        args.push_back(lun);
        args.push_back("-b");
        args.push_back(device);
        tgtadm(args);

        args.clear();
        args.push_back("--op");
        args.push_back("update");
        args.push_back("--mode");
        args.push_back("logicalunit");
        args.push_back("--tid");
        args.push_back(t);
        args.push_back("--lun");
        args.push_back(lun);
        args.push_back("--params");
        args.push_back("scsi_sn=" + serial);
        tgtadm(args);
    } catch (const ZvmException &e) {
        syslog(LOG_USER | LOG_NOTICE, "tgtadm: target %s (tid %u) failed: %s",
               iqn.c_str(), tid, e.what());
        try {
            removeTarget(volume_id, iqn, tid);
        } catch (const ZvmException &re) {
            throw rollback_failed(iqn, e, re);
        }
        throw;
    }

    syslog(LOG_USER | LOG_INFO, "tgtadm: target %s (tid %u) for %s on %s",
           iqn.c_str(), tid, volume_id.c_str(), portal.c_str());
    return TGT_DATA_LUN;
}

void TgtAdm::removeTarget(const std::string &volume_id,
                          const std::string &iqn, uint32_t tid) {
    std::vector<std::string> args;

    args.push_back("--op");
    args.push_back("delete");
    args.push_back("--force");
    args.push_back("--mode");
    args.push_back("target");
    args.push_back("--tid");
    args.push_back(ZVM::to_string(tid));

    try {
        tgtadm(args);
    } catch (const ZvmException &e) {
        if (!is_absent(e)) {
            throw;
        }
        syslog(LOG_USER | LOG_DEBUG, "tgtadm: tid %u for %s already gone",
               tid, volume_id.c_str());
        return;
    }
    syslog(LOG_USER | LOG_INFO, "tgtadm: removed target %s (tid %u)",
           iqn.c_str(), tid);
}

void TgtAdm::bindInitiator(const std::string &iqn, uint32_t tid,
                           const std::string &initiator) {
    std::vector<std::string> args;

    args.push_back("--op");
    args.push_back("bind");
    args.push_back("--mode");
    args.push_back("target");
    args.push_back("--tid");
    args.push_back(ZVM::to_string(tid));
    args.push_back("--initiator-name");
    args.push_back(initiator);
    tgtadm(args);

    syslog(LOG_USER | LOG_INFO, "tgtadm: %s may log in to %s",
           initiator.c_str(), iqn.c_str());
}

void TgtAdm::unbindInitiator(const std::string &iqn, uint32_t tid,
                             const std::string &initiator) {
    std::vector<std::string> args;

    args.push_back("--op");
    args.push_back("unbind");
    args.push_back("--mode");
    args.push_back("target");
    args.push_back("--tid");
    args.push_back(ZVM::to_string(tid));
    args.push_back("--initiator-name");
    args.push_back(initiator);

    try {
        tgtadm(args);
    } catch (const ZvmException &e) {
        if (!is_absent(e)) {
            throw;
        }
    }
    syslog(LOG_USER | LOG_INFO, "tgtadm: %s no longer bound to %s",
           initiator.c_str(), iqn.c_str());
}

std::vector<std::pair<uint32_t, std::string> > TgtAdm::show() {
    std::vector<std::string> args;
    std::vector<std::pair<uint32_t, std::string> > rc;

    args.push_back("--op");
    args.push_back("show");
    args.push_back("--mode");
    args.push_back("target");

    CommandResult r = tgtadm(args);

    // "Target 1: iqn.2010-10.org.openstack:v1"
    std::vector<std::string> lines = _split_lines(r.out);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].compare(0, 7, "Target ") != 0) {
            continue;
        }
        size_t colon = lines[i].find(':');
        if (colon == std::string::npos) {
            continue;
        }

        char *end = NULL;
        std::string num = lines[i].substr(7, colon - 7);
        unsigned long tid = strtoul(num.c_str(), &end, 10);
        if (num.empty() || *end != '\0') {
            continue;
        }
        rc.push_back(std::make_pair((uint32_t)tid,
                                    _trim_spaces(lines[i].substr(colon + 1))));
    }
    return rc;
}

std::vector<std::string> TgtAdm::listTargets() {
    std::vector<std::pair<uint32_t, std::string> > t = show();
    std::vector<std::string> rc;

    for (size_t i = 0; i < t.size(); ++i) {
        rc.push_back(t[i].second);
    }
    return rc;
}

std::set<uint32_t> TgtAdm::listTids() {
    std::vector<std::pair<uint32_t, std::string> > t = show();
    std::set<uint32_t> rc;

    for (size_t i = 0; i < t.size(); ++i) {
        rc.insert(t[i].first);
    }
    return rc;
}

LioAdm::LioAdm(Executor &exec, uint32_t timeout,
               const std::string &targetcli_cmd)
    : exec(exec), tmo(timeout), cmd(targetcli_cmd) {}

CommandResult LioAdm::targetcli(const std::vector<std::string> &args) {
    return exec.run(cmd, args, tmo);
}

void LioAdm::createUndo(const ZvmException &cause,
                        const std::string &volume_id, const std::string &iqn,
                        bool target_created) {
    std::vector<std::string> args;

    syslog(LOG_USER | LOG_NOTICE, "targetcli: target %s failed: %s",
           iqn.c_str(), cause.what());
    try {
        if (target_created) {
            args.push_back("/iscsi");
            args.push_back("delete");
            args.push_back(iqn);
            targetcli(args);
        }

        args.clear();
        args.push_back("/backstores/block");
        args.push_back("delete");
        args.push_back(volume_id);
        targetcli(args);
    } catch (const ZvmException &re) {
        throw rollback_failed(iqn, cause, re);
    }
}

uint32_t LioAdm::createTarget(const std::string &volume_id,
                              const std::string &iqn, uint32_t tid,
                              const std::string &device,
                              const std::string &serial,
                              const std::string &portal) {
    std::string tpg = "/iscsi/" + iqn + "/tpg1";
    std::string ip;
    std::string port;
    std::vector<std::string> args;

    // An existing backstore of that name fails here with nothing to undo
    args.push_back("/backstores/block");
    args.push_back("create");
    args.push_back("name=" + volume_id);
    args.push_back("dev=" + device);
    args.push_back("wwn=" + serial);
    targetcli(args);

    try {
        args.clear();
        args.push_back("/iscsi");
        args.push_back("create");
        args.push_back(iqn);
        targetcli(args);
    } catch (const ZvmException &e) {
        createUndo(e, volume_id, iqn, false);
        throw;
    }

    try {
        args.clear();
        args.push_back(tpg + "/luns");
        args.push_back("create");
        args.push_back("/backstores/block/" + volume_id);
        targetcli(args);

        // targetcli listens on every address unless told otherwise
        if (portal_split(portal, ip, port) && ip != LIO_ANY_IP) {
            args.clear();
            args.push_back(tpg + "/portals");
            args.push_back("delete");
            args.push_back(LIO_ANY_IP);
            args.push_back(ISCSI_PORT);
            try {
                targetcli(args);
            } catch (const ZvmException &e) {
                if (!is_absent(e)) {
                    throw;
                }
            }

            args.clear();
            args.push_back(tpg + "/portals");
            args.push_back("create");
            args.push_back(ip);
            args.push_back(port);
            targetcli(args);
        }
    } catch (const ZvmException &e) {
        createUndo(e, volume_id, iqn, true);
        throw;
    }

    syslog(LOG_USER | LOG_INFO, "targetcli: target %s for %s on %s",
           iqn.c_str(), volume_id.c_str(), portal.c_str());
    return LIO_DATA_LUN;
}

void LioAdm::removeTarget(const std::string &volume_id,
                          const std::string &iqn, uint32_t tid) {
    std::vector<std::string> args;

    args.push_back("/iscsi");
    args.push_back("delete");
    args.push_back(iqn);
    try {
        targetcli(args);
    } catch (const ZvmException &e) {
        if (!is_absent(e)) {
            throw;
        }
    }

    args.clear();
    args.push_back("/backstores/block");
    args.push_back("delete");
    args.push_back(volume_id);
    try {
        targetcli(args);
    } catch (const ZvmException &e) {
        if (!is_absent(e)) {
            throw;
        }
    }

    syslog(LOG_USER | LOG_INFO, "targetcli: removed target %s",
           iqn.c_str());
}

void LioAdm::bindInitiator(const std::string &iqn, uint32_t tid,
                           const std::string &initiator) {
    std::vector<std::string> args;

    args.push_back("/iscsi/" + iqn + "/tpg1/acls");
    args.push_back("create");
    args.push_back(initiator);
    targetcli(args);

    syslog(LOG_USER | LOG_INFO, "targetcli: %s may log in to %s",
           initiator.c_str(), iqn.c_str());
}

void LioAdm::unbindInitiator(const std::string &iqn, uint32_t tid,
                             const std::string &initiator) {
    std::vector<std::string> args;

    args.push_back("/iscsi/" + iqn + "/tpg1/acls");
    args.push_back("delete");
    args.push_back(initiator);

    try {
        targetcli(args);
    } catch (const ZvmException &e) {
        if (!is_absent(e)) {
            throw;
        }
    }
    syslog(LOG_USER | LOG_INFO, "targetcli: %s no longer bound to %s",
           initiator.c_str(), iqn.c_str());
}

std::vector<std::string> LioAdm::listTargets() {
    std::vector<std::string> args;
    std::vector<std::string> rc;

    args.push_back("/iscsi");
    args.push_back("ls");

    CommandResult r = targetcli(args);

    // "  o- iqn.2010-10.org.openstack:v1 .......... [TPGs: 1]"
    std::vector<std::string> lines = _split_lines(r.out);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].compare(0, 3, "o- ") != 0) {
            continue;
        }
        std::string rest = lines[i].substr(3);
        std::string name = rest.substr(0, rest.find(' '));
        if (iqn_validate(name) == ZVM_ERR_OK) {
            rc.push_back(name);
        }
    }
    return rc;
}

} // namespace ZVM
