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

#ifndef ZVM_CLIENT_HPP
#define ZVM_CLIENT_HPP

#include "zvm_datatypes.hpp"
#include "zvm_ipc.hpp"

#include <map>
#include <string>
#include <vector>

namespace ZVM {

/**
 * Connection to zvmd.  Each call is one request/response round trip.
 * Errors reported by the daemon are raised as ZvmException with the
 * daemon's code, message and debug data.
 * Notes:   Not thread safe.
 */
class ZVM_DLL_LOCAL Client {
  public:
    /**
     * Connect to the daemon.
     * @param socket_path   Unix domain socket of zvmd
     */
    explicit Client(const std::string &socket_path);

    /**
     * Use an already connected socket, which the object owns.
     */
    explicit Client(int fd);

    Volume createVolume(const std::string &id, uint64_t size_bytes);
    void deleteVolume(const std::string &id);
    Export createExport(const std::string &id, const std::string &initiator);
    void removeExport(const std::string &id);
    Snapshot createSnapshot(const std::string &id, const std::string &snap_id);
    void deleteSnapshot(const std::string &snap_id);
    Volume createVolumeFromSnapshot(const std::string &snap_id,
                                    const std::string &new_id);
    Volume extendVolume(const std::string &id, uint64_t new_size_bytes);
    Export authorizeInitiator(const std::string &id,
                              const std::string &initiator);
    Export revokeInitiator(const std::string &id,
                           const std::string &initiator);
    Export checkForExport(const std::string &id);
    std::string localPath(const std::string &id);
    Volume volumeGet(const std::string &id);
    std::vector<Volume> volumeList();
    std::vector<Snapshot> snapshotList();
    std::vector<Export> exportList();
    ReconcileReport reconcile();

  private:
    Client(const Client &) = delete;
    Client &operator=(const Client &) = delete;

    Value rpc(const std::string &method,
              const std::map<std::string, Value> &params);

    Ipc tp;
    int32_t next_id;
};

} // namespace ZVM

#endif
