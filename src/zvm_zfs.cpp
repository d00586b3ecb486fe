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

#include "zvm_zfs.hpp"
#include "zvm_ipc.hpp"
#include "zvm_utils.hpp"

#include <syslog.h>

namespace ZVM {

/* Fragments of zfs(8) error output */
#define ZFS_ERR_NOT_EXIST    "does not exist"
#define ZFS_ERR_NO_SPACE     "out of space"
#define ZFS_ERR_EXISTS       "already exists"

static bool is_exec_failure(const ZvmException &e, const char *fragment) {
    return e.error_code == ZVM_ERR_EXEC_FAILURE &&
           _str_icontains(e.debug, fragment);
}

static ZvmException zfs_error(const ZvmException &e, int code,
                              const std::string &msg) {
    ZvmException rc(code, msg + ": " + e.what(), e.debug);
    rc.exit_code = e.exit_code;
    rc.debug_data = e.debug_data;
    return rc;
}

ZfsBackend::ZfsBackend(Executor &exec, const std::string &base,
                       const std::string &zfs_cmd, uint32_t timeout)
    : exec(exec), base(base), zfs_cmd(zfs_cmd), tmo(timeout) {}

CommandResult ZfsBackend::zfs(const std::vector<std::string> &args) {
    return exec.run(zfs_cmd, args, tmo);
}

std::string ZfsBackend::backingPath(const std::string &id) const {
    return base + "/" + id;
}

std::string ZfsBackend::devicePath(const std::string &backing_path) const {
    return ZVM_ZVOL_DEV_DIR + backing_path;
}

std::string ZfsBackend::createVolume(const std::string &id,
                                     uint64_t size_bytes) {
    std::string path = backingPath(id);
    std::vector<std::string> args;

    args.push_back("create");
    args.push_back("-V");
    args.push_back(ZVM::to_string(size_bytes));
    args.push_back(path);

    try {
        zfs(args);
    } catch (const ZvmException &e) {
        if (is_exec_failure(e, ZFS_ERR_NO_SPACE)) {
            throw zfs_error(e, ZVM_ERR_NOT_ENOUGH_SPACE,
                            "Not enough space to create " + path);
        }
        if (is_exec_failure(e, ZFS_ERR_EXISTS)) {
            throw zfs_error(e, ZVM_ERR_NAME_CONFLICT,
                            "Dataset " + path + " already exists");
        }
        throw zfs_error(e, e.error_code, "Failed to create " + path);
    }

    syslog(LOG_USER | LOG_INFO, "zfs: created %s (%llu bytes)", path.c_str(),
           (unsigned long long)size_bytes);
    return path;
}

void ZfsBackend::destroy(const std::string &path) {
    std::vector<std::string> args;

    args.push_back("destroy");
    args.push_back(path);

    try {
        zfs(args);
        syslog(LOG_USER | LOG_INFO, "zfs: destroyed %s", path.c_str());
    } catch (const ZvmException &e) {
        if (is_exec_failure(e, ZFS_ERR_NOT_EXIST)) {
            syslog(LOG_USER | LOG_DEBUG, "zfs: %s already gone", path.c_str());
            return;
        }
        throw zfs_error(e, e.error_code, "Failed to destroy " + path);
    }
}

void ZfsBackend::deleteVolume(const std::string &backing_path) {
    destroy(backing_path);
}

std::string ZfsBackend::createSnapshot(const std::string &backing_path,
                                       const std::string &snap_id) {
    std::string snap_path = backing_path + "@" + snap_id;
    std::vector<std::string> args;

    args.push_back("snapshot");
    args.push_back(snap_path);

    try {
        zfs(args);
    } catch (const ZvmException &e) {
        if (is_exec_failure(e, ZFS_ERR_EXISTS)) {
            throw zfs_error(e, ZVM_ERR_SNAPSHOT_NAME_CONFLICT,
                            "Snapshot " + snap_path + " already exists");
        }
        if (is_exec_failure(e, ZFS_ERR_NOT_EXIST)) {
            throw zfs_error(e, ZVM_ERR_NOT_FOUND_VOLUME,
                            "Dataset " + backing_path + " does not exist");
        }
        if (is_exec_failure(e, ZFS_ERR_NO_SPACE)) {
            throw zfs_error(e, ZVM_ERR_NOT_ENOUGH_SPACE,
                            "Not enough space to snapshot " + backing_path);
        }
        throw zfs_error(e, e.error_code, "Failed to snapshot " + backing_path);
    }

    syslog(LOG_USER | LOG_INFO, "zfs: created snapshot %s", snap_path.c_str());
    return snap_path;
}

void ZfsBackend::deleteSnapshot(const std::string &snap_path) {
    destroy(snap_path);
}

std::string ZfsBackend::cloneFromSnapshot(const std::string &snap_path,
                                          const std::string &new_id) {
    std::string path = backingPath(new_id);
    std::vector<std::string> args;

    args.push_back("clone");
    args.push_back(snap_path);
    args.push_back(path);

    try {
        zfs(args);
    } catch (const ZvmException &e) {
        if (is_exec_failure(e, ZFS_ERR_EXISTS)) {
            throw zfs_error(e, ZVM_ERR_NAME_CONFLICT,
                            "Dataset " + path + " already exists");
        }
        if (is_exec_failure(e, ZFS_ERR_NOT_EXIST)) {
            throw zfs_error(e, ZVM_ERR_NOT_FOUND_SNAPSHOT,
                            "Snapshot " + snap_path + " does not exist");
        }
        if (is_exec_failure(e, ZFS_ERR_NO_SPACE)) {
            throw zfs_error(e, ZVM_ERR_NOT_ENOUGH_SPACE,
                            "Not enough space to clone " + snap_path);
        }
        throw zfs_error(e, e.error_code,
                        "Failed to clone " + snap_path + " to " + path);
    }

    syslog(LOG_USER | LOG_INFO, "zfs: cloned %s to %s", snap_path.c_str(),
           path.c_str());
    return path;
}

void ZfsBackend::resizeVolume(const std::string &backing_path,
                              uint64_t new_size) {
    std::vector<std::string> args;

    args.push_back("set");
    args.push_back("volsize=" + ZVM::to_string(new_size));
    args.push_back(backing_path);

    try {
        zfs(args);
    } catch (const ZvmException &e) {
        if (is_exec_failure(e, ZFS_ERR_NO_SPACE)) {
            throw zfs_error(e, ZVM_ERR_NOT_ENOUGH_SPACE,
                            "Not enough space to grow " + backing_path);
        }
        if (is_exec_failure(e, ZFS_ERR_NOT_EXIST)) {
            throw zfs_error(e, ZVM_ERR_NOT_FOUND_VOLUME,
                            "Dataset " + backing_path + " does not exist");
        }
        throw zfs_error(e, e.error_code, "Failed to resize " + backing_path);
    }

    syslog(LOG_USER | LOG_INFO, "zfs: %s volsize=%llu", backing_path.c_str(),
           (unsigned long long)new_size);
}

bool ZfsBackend::volumeExists(const std::string &backing_path) {
    std::vector<std::string> args;

    args.push_back("list");
    args.push_back("-H");
    args.push_back("-o");
    args.push_back("name");
    args.push_back(backing_path);

    try {
        zfs(args);
    } catch (const ZvmException &e) {
        if (is_exec_failure(e, ZFS_ERR_NOT_EXIST)) {
            return false;
        }
        throw zfs_error(e, e.error_code, "Failed to look up " + backing_path);
    }
    return true;
}

std::vector<std::string> ZfsBackend::list(const char *type) {
    std::vector<std::string> args;
    std::vector<std::string> rc;
    std::string prefix = base + "/";

    args.push_back("list");
    args.push_back("-H");
    args.push_back("-o");
    args.push_back("name");
    args.push_back("-t");
    args.push_back(type);
    args.push_back("-r");
    args.push_back(base);

    CommandResult r;
    try {
        r = zfs(args);
    } catch (const ZvmException &e) {
        throw zfs_error(e, e.error_code,
                        std::string("Failed to list ") + type + "s of " + base);
    }

    std::vector<std::string> lines = _split_lines(r.out);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].compare(0, prefix.size(), prefix) == 0) {
            rc.push_back(lines[i]);
        }
    }
    return rc;
}

std::vector<std::string> ZfsBackend::listVolumes() { return list("volume"); }

std::vector<std::string> ZfsBackend::listSnapshots() {
    return list("snapshot");
}

} // namespace ZVM
