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

#ifndef ZVM_DISPATCH_HPP
#define ZVM_DISPATCH_HPP

#include "zvm_ipc.hpp"
#include "zvm_provision.hpp"

#include <map>
#include <string>

namespace ZVM {

/**
 * Used to create a map of method name to handler.
 */
template <typename K, typename V> class ZVM_DLL_LOCAL static_map {
  private:
    std::map<K, V> _m;

  public:
    static_map(const K &key, const V &val) { _m[key] = val; }

    static_map<K, V> &operator()(const K &key, const V &val) {
        _m[key] = val;
        return *this;
    }

    operator std::map<K, V>() { return _m; }
};

/**
 * Run one request against the provisioning API.
 * @param api       Provisioning API
 * @param method    Method name
 * @param request   Full request, params are taken from it
 * @param[out] response Result value
 * @return ZVM_ERR_OK, ZVM_ERR_NO_SUPPORT for an unknown method or
 *         ZVM_ERR_TRANSPORT_INVALID_ARG for bad params.  Failures of the
 *         operation itself are raised as ZvmException.
 */
ZVM_DLL_LOCAL int process_request(ProvisioningApi &api,
                                  const std::string &method, Value &request,
                                  Value &response);

/**
 * Serve requests arriving on a connected socket, in order, until the
 * peer closes it.
 * @param api   Provisioning API
 * @param fd    Connected socket, owned and closed by this call
 * @return 0 when the peer closed the connection, else non-zero
 */
ZVM_DLL_LOCAL int serve_connection(ProvisioningApi &api, int fd);

} // namespace ZVM

#endif
