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

#ifndef ZVM_BACKEND_HPP
#define ZVM_BACKEND_HPP

#include "libzvolmgmt/libzvolmgmt_common.h"

#include <stdint.h>
#include <string>
#include <vector>

namespace ZVM {

/**
 * Storage operations a volume backend provides.  Sizes are bytes.
 * Failures are raised as ZvmException.
 */
class ZVM_DLL_LOCAL StorageBackend {
  public:
    virtual ~StorageBackend() {}

    /**
     * Deterministic backing path for a volume id.
     * @param id    Volume id
     * @return Backing path
     */
    virtual std::string backingPath(const std::string &id) const = 0;

    /**
     * Block device node for a backing path.
     * @param backing_path  Backing path
     * @return Device path
     */
    virtual std::string devicePath(const std::string &backing_path) const = 0;

    /**
     * Creates a volume.
     * @param id            Volume id
     * @param size_bytes    Size, already rounded to the block size
     * @return Backing path of the new volume.
     */
    virtual std::string createVolume(const std::string &id,
                                     uint64_t size_bytes) = 0;

    /**
     * Deletes a volume, success if it is already gone.
     * @param backing_path  Volume to delete
     */
    virtual void deleteVolume(const std::string &backing_path) = 0;

    /**
     * Creates a snapshot of a volume.
     * @param backing_path  Volume to snapshot
     * @param snap_id       Snapshot id
     * @return Snapshot path
     */
    virtual std::string createSnapshot(const std::string &backing_path,
                                       const std::string &snap_id) = 0;

    /**
     * Deletes a snapshot, success if it is already gone.
     * @param snap_path     Snapshot to delete
     */
    virtual void deleteSnapshot(const std::string &snap_path) = 0;

    /**
     * Creates a writable volume from a snapshot.
     * @param snap_path     Snapshot path
     * @param new_id        Id of the new volume
     * @return Backing path of the new volume.
     */
    virtual std::string cloneFromSnapshot(const std::string &snap_path,
                                          const std::string &new_id) = 0;

    /**
     * Changes the size of a volume.
     * @param backing_path  Volume to resize
     * @param new_size      New size in bytes
     */
    virtual void resizeVolume(const std::string &backing_path,
                              uint64_t new_size) = 0;

    /**
     * @param backing_path  Volume to check
     * @return true if the volume exists on the backend
     */
    virtual bool volumeExists(const std::string &backing_path) = 0;

    /**
     * Backing paths of every volume the backend manages.
     */
    virtual std::vector<std::string> listVolumes() = 0;

    /**
     * Paths of every snapshot the backend manages.
     */
    virtual std::vector<std::string> listSnapshots() = 0;
};

} // namespace ZVM

#endif
