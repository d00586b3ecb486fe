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

#include "zvm_client.hpp"
#include "zvm_convert.hpp"

namespace ZVM {

static ZvmException bad_response(const ValueException &ve) {
    return ZvmException(ZVM_ERR_TRANSPORT_SERIALIZATION,
                        "Unexpected response from daemon", ve.what());
}

static Volume to_volume(Value v) {
    try {
        return value_to_volume(v);
    } catch (const ValueException &ve) {
        throw bad_response(ve);
    }
}

static Export to_export(Value v) {
    try {
        return value_to_export(v);
    } catch (const ValueException &ve) {
        throw bad_response(ve);
    }
}

static Snapshot to_snapshot(Value v) {
    try {
        return value_to_snapshot(v);
    } catch (const ValueException &ve) {
        throw bad_response(ve);
    }
}

static std::vector<Value> to_array(Value v) {
    try {
        return v.asArray();
    } catch (const ValueException &ve) {
        throw bad_response(ve);
    }
}

Client::Client(const std::string &socket_path)
    : tp(socket_path), next_id(ZVM_DEFAULT_ID) {}

Client::Client(int fd) : tp(fd), next_id(ZVM_DEFAULT_ID) {}

Value Client::rpc(const std::string &method,
                  const std::map<std::string, Value> &params) {
    try {
        return tp.rpc(method, Value(params), next_id++);
    } catch (const EOFException &eof) {
        throw ZvmException(ZVM_ERR_TRANSPORT_COMMUNICATION,
                           "Daemon closed the connection", eof.what());
    } catch (const ValueException &ve) {
        throw bad_response(ve);
    }
}

Volume Client::createVolume(const std::string &id, uint64_t size_bytes) {
    std::map<std::string, Value> p;
    p["id"] = Value(id);
    p["size_bytes"] = Value(size_bytes);
    return to_volume(rpc("create_volume", p));
}

void Client::deleteVolume(const std::string &id) {
    std::map<std::string, Value> p;
    p["id"] = Value(id);
    rpc("delete_volume", p);
}

Export Client::createExport(const std::string &id,
                            const std::string &initiator) {
    std::map<std::string, Value> p;
    p["id"] = Value(id);
    p["initiator"] = Value(initiator);
    return to_export(rpc("create_export", p));
}

void Client::removeExport(const std::string &id) {
    std::map<std::string, Value> p;
    p["id"] = Value(id);
    rpc("remove_export", p);
}

Snapshot Client::createSnapshot(const std::string &id,
                                const std::string &snap_id) {
    std::map<std::string, Value> p;
    p["id"] = Value(id);
    p["snap_id"] = Value(snap_id);
    return to_snapshot(rpc("create_snapshot", p));
}

void Client::deleteSnapshot(const std::string &snap_id) {
    std::map<std::string, Value> p;
    p["snap_id"] = Value(snap_id);
    rpc("delete_snapshot", p);
}

Volume Client::createVolumeFromSnapshot(const std::string &snap_id,
                                        const std::string &new_id) {
    std::map<std::string, Value> p;
    p["snap_id"] = Value(snap_id);
    p["new_id"] = Value(new_id);
    return to_volume(rpc("create_volume_from_snapshot", p));
}

Volume Client::extendVolume(const std::string &id, uint64_t new_size_bytes) {
    std::map<std::string, Value> p;
    p["id"] = Value(id);
    p["new_size_bytes"] = Value(new_size_bytes);
    return to_volume(rpc("extend_volume", p));
}

Export Client::authorizeInitiator(const std::string &id,
                                  const std::string &initiator) {
    std::map<std::string, Value> p;
    p["id"] = Value(id);
    p["initiator"] = Value(initiator);
    return to_export(rpc("authorize_initiator", p));
}

Export Client::revokeInitiator(const std::string &id,
                               const std::string &initiator) {
    std::map<std::string, Value> p;
    p["id"] = Value(id);
    p["initiator"] = Value(initiator);
    return to_export(rpc("revoke_initiator", p));
}

Export Client::checkForExport(const std::string &id) {
    std::map<std::string, Value> p;
    p["id"] = Value(id);
    return to_export(rpc("check_for_export", p));
}

std::string Client::localPath(const std::string &id) {
    std::map<std::string, Value> p;
    p["id"] = Value(id);
    Value v = rpc("local_path", p);
    try {
        return v.asString();
    } catch (const ValueException &ve) {
        throw bad_response(ve);
    }
}

Volume Client::volumeGet(const std::string &id) {
    std::map<std::string, Value> p;
    p["id"] = Value(id);
    return to_volume(rpc("volume_get", p));
}

std::vector<Volume> Client::volumeList() {
    std::vector<Volume> rc;
    std::vector<Value> l =
        to_array(rpc("volume_list", std::map<std::string, Value>()));

    for (size_t i = 0; i < l.size(); ++i) {
        rc.push_back(to_volume(l[i]));
    }
    return rc;
}

std::vector<Snapshot> Client::snapshotList() {
    std::vector<Snapshot> rc;
    std::vector<Value> l =
        to_array(rpc("snapshot_list", std::map<std::string, Value>()));

    for (size_t i = 0; i < l.size(); ++i) {
        rc.push_back(to_snapshot(l[i]));
    }
    return rc;
}

std::vector<Export> Client::exportList() {
    std::vector<Export> rc;
    std::vector<Value> l =
        to_array(rpc("export_list", std::map<std::string, Value>()));

    for (size_t i = 0; i < l.size(); ++i) {
        rc.push_back(to_export(l[i]));
    }
    return rc;
}

ReconcileReport Client::reconcile() {
    Value v = rpc("reconcile", std::map<std::string, Value>());
    try {
        return value_to_report(v);
    } catch (const ValueException &ve) {
        throw bad_response(ve);
    }
}

} // namespace ZVM
