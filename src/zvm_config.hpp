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

#ifndef ZVM_CONFIG_HPP
#define ZVM_CONFIG_HPP

#include "libzvolmgmt/libzvolmgmt_common.h"

#include <stdint.h>
#include <string>
#include <vector>

namespace ZVM {

#define ZVM_URI_SCHEME         "zfs+iscsi"
#define ZVM_DB_DEFAULT         "/var/lib/zvm/registry.db"
#define ZVM_TIMEOUT_DEFAULT    60000
#define ZVM_ISCSI_PORT_DEFAULT 3260

/**
 * Daemon configuration, taken from a single URI:
 * zfs+iscsi://[user@]host[:ssh port]/<dataset>?key=value&...
 */
struct ZVM_DLL_LOCAL Config {
    Config();

    std::string base; /* ZFS dataset the zvols live under */
    std::string host;
    std::string user;
    int ssh_port; /* 0 when not given */

    std::string zfs_cmd;
    zvm_target_helper target_helper;
    std::string target_prefix;
    std::string iscsi_ip_address;
    std::string portal;
    std::string db;
    uint32_t timeout; /* ms, per command */
    uint64_t block_size;
    std::vector<std::string> root_helper;
    uint32_t reconcile_interval; /* s, 0 to reconcile at start up only */

    /**
     * true if commands run on this host.
     */
    bool isLocal() const;

    /**
     * Words placed in front of every command: ssh for a remote host,
     * followed by the root helper.
     */
    std::vector<std::string> commandPrefix() const;
};

/**
 * Parse a configuration URI.
 * Raises ZvmException(ZVM_ERR_INVALID_ARGUMENT) for a malformed URI, an
 * unknown query key or a bad value.
 * @param uri   URI to parse
 * @return Configuration with defaults filled in
 */
ZVM_DLL_LOCAL Config config_parse(const std::string &uri);

} // namespace ZVM

#endif
