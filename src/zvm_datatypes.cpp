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

#include "zvm_datatypes.hpp"

#include <ctype.h>
#include <string.h>

namespace ZVM {

Volume::Volume()
    : size_bytes(0), state(ZVM_VOLUME_STATE_UNKNOWN), created_at(0) {}

Snapshot::Snapshot() : size_bytes(0), created_at(0) {}

Export::Export() : tid(0), lun(0) {}

static const struct {
    zvm_volume_state state;
    const char *name;
} state_names[] = {
    {ZVM_VOLUME_STATE_CREATING, "creating"},
    {ZVM_VOLUME_STATE_AVAILABLE, "available"},
    {ZVM_VOLUME_STATE_IN_USE, "in-use"},
    {ZVM_VOLUME_STATE_DELETING, "deleting"},
    {ZVM_VOLUME_STATE_ERROR, "error"},
};

const char *volume_state_str(zvm_volume_state state) {
    for (size_t i = 0; i < sizeof(state_names) / sizeof(state_names[0]); ++i) {
        if (state_names[i].state == state) {
            return state_names[i].name;
        }
    }
    return "unknown";
}

zvm_volume_state volume_state_from_str(const std::string &s) {
    for (size_t i = 0; i < sizeof(state_names) / sizeof(state_names[0]); ++i) {
        if (s == state_names[i].name) {
            return state_names[i].state;
        }
    }
    return ZVM_VOLUME_STATE_UNKNOWN;
}

int id_validate(const std::string &id) {
    if (id.empty() || id.size() > ZVM_ID_MAX_LEN || id[0] == '-' ||
        id[0] == '.') {
        return ZVM_ERR_INVALID_ARGUMENT;
    }

    for (size_t i = 0; i < id.size(); ++i) {
        char c = id[i];
        if (!isalnum((unsigned char)c) && c != '_' && c != '.' && c != ':' &&
            c != '-') {
            return ZVM_ERR_INVALID_ARGUMENT;
        }
    }
    return ZVM_ERR_OK;
}

int iqn_validate(const std::string &iqn) {
    if ((iqn.size() > 4) &&
        (0 == iqn.compare(0, 3, "iqn") || 0 == iqn.compare(0, 3, "naa") ||
         0 == iqn.compare(0, 3, "eui"))) {
        for (size_t i = 0; i < iqn.size(); ++i) {
            if (isspace((unsigned char)iqn[i])) {
                return ZVM_ERR_INVALID_ARGUMENT;
            }
        }
        return ZVM_ERR_OK;
    }
    return ZVM_ERR_INVALID_ARGUMENT;
}

} // namespace ZVM
