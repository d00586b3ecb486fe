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

#include "zvm_dispatch.hpp"
#include "zvm_convert.hpp"

#include <syslog.h>

namespace ZVM {

typedef int (*handler)(ProvisioningApi &api, Value &params, Value &response);

static bool is_str(Value &params, const char *key) {
    return params.hasKey(key) && Value::string_t == params[key].valueType();
}

static bool is_num(Value &params, const char *key) {
    return params.hasKey(key) && Value::numeric_t == params[key].valueType();
}

static int handle_volume_create(ProvisioningApi &api, Value &params,
                                Value &response) {
    if (!is_str(params, "id") || !is_num(params, "size_bytes")) {
        return ZVM_ERR_TRANSPORT_INVALID_ARG;
    }

    Volume v = api.createVolume(params["id"].asString(),
                                params["size_bytes"].asUint64_t());
    response = volume_to_value(v);
    return ZVM_ERR_OK;
}

static int handle_volume_delete(ProvisioningApi &api, Value &params,
                                Value &response) {
    if (!is_str(params, "id")) {
        return ZVM_ERR_TRANSPORT_INVALID_ARG;
    }

    api.deleteVolume(params["id"].asString());
    return ZVM_ERR_OK;
}

static int handle_export_create(ProvisioningApi &api, Value &params,
                                Value &response) {
    if (!is_str(params, "id") || !is_str(params, "initiator")) {
        return ZVM_ERR_TRANSPORT_INVALID_ARG;
    }

    Export e = api.createExport(params["id"].asString(),
                                params["initiator"].asString());
    response = export_to_value(e);
    return ZVM_ERR_OK;
}

static int handle_export_remove(ProvisioningApi &api, Value &params,
                                Value &response) {
    if (!is_str(params, "id")) {
        return ZVM_ERR_TRANSPORT_INVALID_ARG;
    }

    api.removeExport(params["id"].asString());
    return ZVM_ERR_OK;
}

static int handle_snapshot_create(ProvisioningApi &api, Value &params,
                                  Value &response) {
    if (!is_str(params, "id") || !is_str(params, "snap_id")) {
        return ZVM_ERR_TRANSPORT_INVALID_ARG;
    }

    Snapshot s = api.createSnapshot(params["id"].asString(),
                                    params["snap_id"].asString());
    response = snapshot_to_value(s);
    return ZVM_ERR_OK;
}

static int handle_snapshot_delete(ProvisioningApi &api, Value &params,
                                  Value &response) {
    if (!is_str(params, "snap_id")) {
        return ZVM_ERR_TRANSPORT_INVALID_ARG;
    }

    api.deleteSnapshot(params["snap_id"].asString());
    return ZVM_ERR_OK;
}

static int handle_volume_clone(ProvisioningApi &api, Value &params,
                               Value &response) {
    if (!is_str(params, "snap_id") || !is_str(params, "new_id")) {
        return ZVM_ERR_TRANSPORT_INVALID_ARG;
    }

    Volume v = api.createVolumeFromSnapshot(params["snap_id"].asString(),
                                            params["new_id"].asString());
    response = volume_to_value(v);
    return ZVM_ERR_OK;
}

static int handle_volume_extend(ProvisioningApi &api, Value &params,
                                Value &response) {
    if (!is_str(params, "id") || !is_num(params, "new_size_bytes")) {
        return ZVM_ERR_TRANSPORT_INVALID_ARG;
    }

    Volume v = api.extendVolume(params["id"].asString(),
                                params["new_size_bytes"].asUint64_t());
    response = volume_to_value(v);
    return ZVM_ERR_OK;
}

static int handle_initiator_authorize(ProvisioningApi &api, Value &params,
                                      Value &response) {
    if (!is_str(params, "id") || !is_str(params, "initiator")) {
        return ZVM_ERR_TRANSPORT_INVALID_ARG;
    }

    Export e = api.authorizeInitiator(params["id"].asString(),
                                      params["initiator"].asString());
    response = export_to_value(e);
    return ZVM_ERR_OK;
}

static int handle_initiator_revoke(ProvisioningApi &api, Value &params,
                                   Value &response) {
    if (!is_str(params, "id") || !is_str(params, "initiator")) {
        return ZVM_ERR_TRANSPORT_INVALID_ARG;
    }

    Export e = api.revokeInitiator(params["id"].asString(),
                                   params["initiator"].asString());
    response = export_to_value(e);
    return ZVM_ERR_OK;
}

static int handle_export_check(ProvisioningApi &api, Value &params,
                               Value &response) {
    if (!is_str(params, "id")) {
        return ZVM_ERR_TRANSPORT_INVALID_ARG;
    }

    response = export_to_value(api.checkForExport(params["id"].asString()));
    return ZVM_ERR_OK;
}

static int handle_local_path(ProvisioningApi &api, Value &params,
                             Value &response) {
    if (!is_str(params, "id")) {
        return ZVM_ERR_TRANSPORT_INVALID_ARG;
    }

    response = Value(api.localPath(params["id"].asString()));
    return ZVM_ERR_OK;
}

static int handle_volume_get(ProvisioningApi &api, Value &params,
                             Value &response) {
    if (!is_str(params, "id")) {
        return ZVM_ERR_TRANSPORT_INVALID_ARG;
    }

    response = volume_to_value(api.volumeGet(params["id"].asString()));
    return ZVM_ERR_OK;
}

static int handle_volumes(ProvisioningApi &api, Value &params,
                          Value &response) {
    std::vector<Value> result;
    std::vector<Volume> vols = api.volumeList();

    for (size_t i = 0; i < vols.size(); ++i) {
        result.push_back(volume_to_value(vols[i]));
    }
    response = Value(result);
    return ZVM_ERR_OK;
}

static int handle_snapshots(ProvisioningApi &api, Value &params,
                            Value &response) {
    std::vector<Value> result;
    std::vector<Snapshot> snaps = api.snapshotList();

    for (size_t i = 0; i < snaps.size(); ++i) {
        result.push_back(snapshot_to_value(snaps[i]));
    }
    response = Value(result);
    return ZVM_ERR_OK;
}

static int handle_exports(ProvisioningApi &api, Value &params,
                          Value &response) {
    std::vector<Value> result;
    std::vector<Export> exps = api.exportList();

    for (size_t i = 0; i < exps.size(); ++i) {
        result.push_back(export_to_value(exps[i]));
    }
    response = Value(result);
    return ZVM_ERR_OK;
}

static int handle_reconcile(ProvisioningApi &api, Value &params,
                            Value &response) {
    response = report_to_value(api.reconcile());
    return ZVM_ERR_OK;
}

/**
 * map of function pointers
 */
static std::map<std::string, handler> dispatch =
    static_map<std::string, handler>("create_volume", handle_volume_create)(
        "delete_volume", handle_volume_delete)("create_export",
                                               handle_export_create)(
        "remove_export", handle_export_remove)("create_snapshot",
                                               handle_snapshot_create)(
        "delete_snapshot", handle_snapshot_delete)(
        "create_volume_from_snapshot", handle_volume_clone)(
        "extend_volume", handle_volume_extend)("authorize_initiator",
                                               handle_initiator_authorize)(
        "revoke_initiator", handle_initiator_revoke)("check_for_export",
                                                     handle_export_check)(
        "local_path", handle_local_path)("volume_get", handle_volume_get)(
        "volume_list", handle_volumes)("snapshot_list", handle_snapshots)(
        "export_list", handle_exports)("reconcile", handle_reconcile);

int process_request(ProvisioningApi &api, const std::string &method,
                    Value &request, Value &response) {
    int rc = ZVM_ERR_LIB_BUG;

    response = Value(); // Default response will be null

    if (dispatch.find(method) != dispatch.end()) {
        Value &params = request["params"];
        if (Value::object_t != params.valueType()) {
            return ZVM_ERR_TRANSPORT_INVALID_ARG;
        }
        rc = (dispatch[method])(api, params, response);
    } else {
        rc = ZVM_ERR_NO_SUPPORT;
    }

    return rc;
}

static const char *error_msg(int rc) {
    switch (rc) {
    case ZVM_ERR_NO_SUPPORT:
        return "Unsupported method";
    case ZVM_ERR_TRANSPORT_INVALID_ARG:
        return "Missing or invalid parameters";
    default:
        return "Request failed";
    }
}

int serve_connection(ProvisioningApi &api, int fd) {
    Ipc tp(fd);

    while (true) {
        Value req;
        uint32_t id = ZVM_DEFAULT_ID;

        try {
            req = tp.readRequest();
        } catch (const EOFException &eof) {
            return 0;
        } catch (const ValueException &ve) {
            syslog(LOG_USER | LOG_NOTICE, "Unparsable request: %s", ve.what());
            try {
                tp.errorSend(ZVM_ERR_TRANSPORT_SERIALIZATION,
                             "Unparsable request", ve.what(), id);
            } catch (const ZvmException &se) {
                syslog(LOG_USER | LOG_NOTICE, "%s", se.what());
            }
            return 1;
        }

        if (!req.isValidRequest()) {
            syslog(LOG_USER | LOG_NOTICE, "Invalid request");
            return 1;
        }

        try {
            if (Value::numeric_t == req["id"].valueType()) {
                id = req["id"].asUint32_t();
            }

            std::string method = req["method"].asString();
            Value resp;
            int rc = ZVM_ERR_LIB_BUG;

            syslog(LOG_USER | LOG_DEBUG, "request %u: %s", id, method.c_str());

            try {
                rc = process_request(api, method, req, resp);
            } catch (const ZvmException &e) {
                tp.errorSend(e.error_code, e.what(), e.debug, id);
                continue;
            } catch (const ValueException &ve) {
                tp.errorSend(ZVM_ERR_TRANSPORT_INVALID_ARG, ve.what(), "",
                             id);
                continue;
            } catch (const std::exception &se) {
                syslog(LOG_USER | LOG_ERR, "%s: unexpected exception: %s",
                       method.c_str(), se.what());
                tp.errorSend(ZVM_ERR_LIB_BUG, se.what(), "", id);
                continue;
            }

            if (ZVM_ERR_OK == rc) {
                tp.responseSend(resp, id);
            } else {
                tp.errorSend(rc, std::string(error_msg(rc)) + ": " + method,
                             "", id);
            }
        } catch (const ValueException &ve) {
            syslog(LOG_USER | LOG_NOTICE, "Invalid request: %s", ve.what());
            return 1;
        } catch (const ZvmException &le) {
            syslog(LOG_USER | LOG_NOTICE, "Unable to reply: %s", le.what());
            return 2;
        }
    }
}

} // namespace ZVM
