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

#include "zvm_config.hpp"
#include "zvm_datatypes.hpp"
#include "zvm_export.hpp"
#include "zvm_ipc.hpp"
#include "zvm_provision.hpp"
#include "zvm_target.hpp"

#include <ctype.h>
#include <errno.h>
#include <libxml/uri.h>
#include <libxml/xmlmemory.h>
#include <map>
#include <stdlib.h>

namespace ZVM {

#define BLOCK_SIZE_MIN 512
#define BLOCK_SIZE_MAX 131072

typedef std::map<std::string, std::string> query_key_value;

static void invalid(const std::string &msg) {
    throw ZvmException(ZVM_ERR_INVALID_ARGUMENT, msg);
}

static std::string unescape(const std::string &s) {
    std::string rc;
    char *u = xmlURIUnescapeString(s.c_str(), (int)s.size(), NULL);

    if (!u) {
        invalid("Unable to unescape '" + s + "'");
    }
    rc = u;
    xmlFree(u);
    return rc;
}

static query_key_value parse_qs(const std::string &qs) {
    query_key_value rc;
    size_t start = 0;

    while (start <= qs.size()) {
        size_t amp = qs.find('&', start);
        if (amp == std::string::npos) {
            amp = qs.size();
        }

        std::string kv = qs.substr(start, amp - start);
        if (!kv.empty()) {
            size_t eq = kv.find('=');
            if (eq == std::string::npos) {
                rc[unescape(kv)] = "";
            } else {
                rc[unescape(kv.substr(0, eq))] = unescape(kv.substr(eq + 1));
            }
        }
        start = amp + 1;
    }
    return rc;
}

static uint64_t number(const std::string &key, const std::string &value,
                       uint64_t max) {
    char *end = NULL;

    if (value.empty() || !isdigit((unsigned char)value[0])) {
        invalid("Invalid value '" + value + "' for " + key);
    }

    errno = 0;
    unsigned long long v = strtoull(value.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v > max) {
        invalid("Invalid value '" + value + "' for " + key);
    }
    return v;
}

static std::vector<std::string> words(const std::string &s) {
    std::vector<std::string> rc;
    size_t i = 0;

    while (i < s.size()) {
        while (i < s.size() && isspace((unsigned char)s[i])) {
            ++i;
        }
        size_t start = i;
        while (i < s.size() && !isspace((unsigned char)s[i])) {
            ++i;
        }
        if (i > start) {
            rc.push_back(s.substr(start, i - start));
        }
    }
    return rc;
}

Config::Config()
    : ssh_port(0), zfs_cmd("zfs"), target_helper(ZVM_TARGET_HELPER_LIOADM),
      target_prefix(ZVM_TARGET_PREFIX_DEFAULT), iscsi_ip_address("0.0.0.0"),
      db(ZVM_DB_DEFAULT), timeout(ZVM_TIMEOUT_DEFAULT),
      block_size(ZVM_BLOCK_SIZE_DEFAULT), reconcile_interval(0) {}

bool Config::isLocal() const {
    return host.empty() || host == "localhost" || host == "127.0.0.1";
}

std::vector<std::string> Config::commandPrefix() const {
    std::vector<std::string> rc;

    if (!isLocal()) {
        rc.push_back("ssh");
        rc.push_back("-o");
        rc.push_back("BatchMode=yes");
        if (ssh_port) {
            rc.push_back("-p");
            rc.push_back(ZVM::to_string(ssh_port));
        }
        rc.push_back(user.empty() ? host : user + "@" + host);
        rc.push_back("--");
    }
    rc.insert(rc.end(), root_helper.begin(), root_helper.end());
    return rc;
}

Config config_parse(const std::string &uri_str) {
    Config c;
    query_key_value qs;
    xmlURIPtr uri = xmlParseURI(uri_str.c_str());

    if (!uri) {
        invalid("Malformed URI '" + uri_str + "'");
    }

    std::string scheme = uri->scheme ? uri->scheme : "";
    std::string query = uri->query_raw ? uri->query_raw : "";
    c.host = uri->server ? uri->server : "";
    c.user = uri->user ? uri->user : "";
    c.ssh_port = uri->port > 0 ? uri->port : 0;
    c.base = uri->path ? uri->path : "";
    xmlFreeURI(uri);

    if (scheme != ZVM_URI_SCHEME) {
        invalid("URI scheme must be " ZVM_URI_SCHEME ", got '" + scheme + "'");
    }

    while (!c.base.empty() && c.base[0] == '/') {
        c.base.erase(0, 1);
    }
    while (!c.base.empty() && c.base[c.base.size() - 1] == '/') {
        c.base.erase(c.base.size() - 1);
    }
    if (c.base.empty()) {
        invalid("URI is missing the ZFS dataset path");
    }

    qs = parse_qs(query);

    query_key_value::const_iterator it;
    for (it = qs.begin(); it != qs.end(); ++it) {
        const std::string &k = it->first;
        const std::string &v = it->second;

        if (k == "zfs") {
            if (v.empty()) {
                invalid("zfs must not be empty");
            }
            c.zfs_cmd = v;
        } else if (k == "target_helper") {
            if (v == "tgtadm") {
                c.target_helper = ZVM_TARGET_HELPER_TGTADM;
            } else if (v == "lioadm") {
                c.target_helper = ZVM_TARGET_HELPER_LIOADM;
            } else {
                invalid("Unknown target_helper '" + v + "'");
            }
        } else if (k == "target_prefix") {
            if (iqn_validate(v + "x") != ZVM_ERR_OK) {
                invalid("Invalid target_prefix '" + v + "'");
            }
            c.target_prefix = v;
        } else if (k == "iscsi_ip_address") {
            if (v.empty()) {
                invalid("iscsi_ip_address must not be empty");
            }
            c.iscsi_ip_address = v;
        } else if (k == "portal") {
            std::string ip;
            std::string port;
            if (!portal_split(v, ip, port)) {
                invalid("Invalid portal '" + v + "'");
            }
            c.portal = v;
        } else if (k == "db") {
            if (v.empty()) {
                invalid("db must not be empty");
            }
            c.db = v;
        } else if (k == "timeout") {
            c.timeout = (uint32_t)number(k, v, UINT32_MAX);
            if (c.timeout == 0) {
                invalid("timeout must be greater than 0");
            }
        } else if (k == "block_size") {
            c.block_size = number(k, v, BLOCK_SIZE_MAX);
            if (c.block_size < BLOCK_SIZE_MIN ||
                (c.block_size & (c.block_size - 1)) != 0) {
                invalid("block_size must be a power of two between 512 and "
                        "131072");
            }
        } else if (k == "root_helper") {
            c.root_helper = words(v);
        } else if (k == "reconcile_interval") {
            c.reconcile_interval = (uint32_t)number(k, v, UINT32_MAX);
        } else {
            invalid("Unknown URI option '" + k + "'");
        }
    }

    if (c.portal.empty()) {
        c.portal = c.iscsi_ip_address + ":" +
                   ZVM::to_string(ZVM_ISCSI_PORT_DEFAULT);
    }
    return c;
}

} // namespace ZVM
