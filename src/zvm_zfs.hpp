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

#ifndef ZVM_ZFS_HPP
#define ZVM_ZFS_HPP

#include "zvm_backend.hpp"
#include "zvm_exec.hpp"

namespace ZVM {

#define ZVM_ZVOL_DEV_DIR "/dev/zvol/"

/**
 * Volumes are zvols named <base>/<volume id>, snapshots are
 * <base>/<volume id>@<snapshot id>.
 */
class ZVM_DLL_LOCAL ZfsBackend : public StorageBackend {
  public:
    /**
     * Class ctor
     * @param exec      Executor used to run zfs
     * @param base      Dataset the zvols live under, e.g. "pool"
     * @param zfs_cmd   zfs binary
     * @param timeout   Time out for each command in ms
     */
    ZfsBackend(Executor &exec, const std::string &base,
               const std::string &zfs_cmd, uint32_t timeout);

    std::string backingPath(const std::string &id) const;
    std::string devicePath(const std::string &backing_path) const;
    std::string createVolume(const std::string &id, uint64_t size_bytes);
    void deleteVolume(const std::string &backing_path);
    std::string createSnapshot(const std::string &backing_path,
                               const std::string &snap_id);
    void deleteSnapshot(const std::string &snap_path);
    std::string cloneFromSnapshot(const std::string &snap_path,
                                  const std::string &new_id);
    void resizeVolume(const std::string &backing_path, uint64_t new_size);
    bool volumeExists(const std::string &backing_path);
    std::vector<std::string> listVolumes();
    std::vector<std::string> listSnapshots();

  private:
    CommandResult zfs(const std::vector<std::string> &args);
    void destroy(const std::string &path);
    std::vector<std::string> list(const char *type);

    Executor &exec;
    std::string base;
    std::string zfs_cmd;
    uint32_t tmo;
};

} // namespace ZVM

#endif
