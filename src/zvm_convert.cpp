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

#include "zvm_convert.hpp"

namespace ZVM {

bool is_expected_object(Value &obj, const std::string &class_name) {
    if (obj.valueType() == Value::object_t) {
        std::map<std::string, Value> i = obj.asObject();
        std::map<std::string, Value>::iterator iter = i.find("class");
        if (iter != i.end() && iter->second.valueType() == Value::string_t &&
            iter->second.asString() == class_name) {
            return true;
        }
    }
    return false;
}

Volume value_to_volume(Value &vol) {
    Volume rc;

    if (!IS_CLASS_VOLUME(vol)) {
        throw ValueException("value_to_volume: Not correct type");
    }

    std::map<std::string, Value> v = vol.asObject();
    rc.id = v["id"].asString();
    rc.size_bytes = v["size_bytes"].asUint64_t();
    rc.backing_path = v["backing_path"].asString();
    rc.state = volume_state_from_str(v["state"].asString());
    rc.created_at = v["created_at"].asUint64_t();
    rc.origin_snapshot = v["origin_snapshot"].asString();
    rc.serial = v["serial"].asString();
    return rc;
}

Value volume_to_value(const Volume &vol) {
    std::map<std::string, Value> v;

    v["class"] = Value(CLASS_NAME_VOLUME);
    v["id"] = Value(vol.id);
    v["size_bytes"] = Value(vol.size_bytes);
    v["backing_path"] = Value(vol.backing_path);
    v["state"] = Value(volume_state_str(vol.state));
    v["created_at"] = Value(vol.created_at);
    v["origin_snapshot"] = Value(vol.origin_snapshot);
    v["serial"] = Value(vol.serial);
    return Value(v);
}

Snapshot value_to_snapshot(Value &snap) {
    Snapshot rc;

    if (!IS_CLASS_SNAPSHOT(snap)) {
        throw ValueException("value_to_snapshot: Not correct type");
    }

    std::map<std::string, Value> s = snap.asObject();
    rc.id = s["id"].asString();
    rc.volume_id = s["volume_id"].asString();
    rc.backing_path = s["backing_path"].asString();
    rc.size_bytes = s["size_bytes"].asUint64_t();
    rc.created_at = s["created_at"].asUint64_t();
    return rc;
}

Value snapshot_to_value(const Snapshot &snap) {
    std::map<std::string, Value> s;

    s["class"] = Value(CLASS_NAME_SNAPSHOT);
    s["id"] = Value(snap.id);
    s["volume_id"] = Value(snap.volume_id);
    s["backing_path"] = Value(snap.backing_path);
    s["size_bytes"] = Value(snap.size_bytes);
    s["created_at"] = Value(snap.created_at);
    return Value(s);
}

Export value_to_export(Value &exp) {
    Export rc;

    if (!IS_CLASS_EXPORT(exp)) {
        throw ValueException("value_to_export: Not correct type");
    }

    std::map<std::string, Value> e = exp.asObject();
    rc.volume_id = e["volume_id"].asString();
    rc.target_iqn = e["target_iqn"].asString();
    rc.tid = e["tid"].asUint32_t();
    rc.lun = e["lun"].asUint32_t();
    rc.portal = e["portal"].asString();

    std::vector<std::string> inits = value_to_string_list(e["initiators"]);
    rc.initiators.insert(inits.begin(), inits.end());
    return rc;
}

Value export_to_value(const Export &exp) {
    std::map<std::string, Value> e;
    std::vector<std::string> inits(exp.initiators.begin(),
                                   exp.initiators.end());

    e["class"] = Value(CLASS_NAME_EXPORT);
    e["volume_id"] = Value(exp.volume_id);
    e["target_iqn"] = Value(exp.target_iqn);
    e["tid"] = Value(exp.tid);
    e["lun"] = Value(exp.lun);
    e["portal"] = Value(exp.portal);
    e["initiators"] = string_list_to_value(inits);
    return Value(e);
}

ReconcileReport value_to_report(Value &report) {
    ReconcileReport rc;

    if (!IS_CLASS(report, CLASS_NAME_RECONCILE_REPORT)) {
        throw ValueException("value_to_report: Not correct type");
    }

    std::map<std::string, Value> r = report.asObject();
    rc.checked = value_to_string_list(r["checked"]);
    rc.marked_error = value_to_string_list(r["marked_error"]);
    rc.orphans = value_to_string_list(r["orphans"]);
    rc.skipped = value_to_string_list(r["skipped"]);
    return rc;
}

Value report_to_value(const ReconcileReport &report) {
    std::map<std::string, Value> r;

    r["class"] = Value(CLASS_NAME_RECONCILE_REPORT);
    r["checked"] = string_list_to_value(report.checked);
    r["marked_error"] = string_list_to_value(report.marked_error);
    r["orphans"] = string_list_to_value(report.orphans);
    r["skipped"] = string_list_to_value(report.skipped);
    return Value(r);
}

std::vector<std::string> value_to_string_list(Value &list) {
    std::vector<std::string> rc;
    std::vector<Value> v = list.asArray();

    for (size_t i = 0; i < v.size(); ++i) {
        rc.push_back(v[i].asString());
    }
    return rc;
}

Value string_list_to_value(const std::vector<std::string> &sl) {
    std::vector<Value> rc;

    for (size_t i = 0; i < sl.size(); ++i) {
        rc.push_back(Value(sl[i]));
    }
    return Value(rc);
}

} // namespace ZVM
