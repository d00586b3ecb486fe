/*
 * Copyright (C) 2011-2014,2018 Red Hat, Inc.
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

#include "zvm_ipc.hpp"

#include <algorithm>
#include <ctype.h>
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace ZVM {

/* Largest payload accepted from a peer */
#define MAX_PAYLOAD 0x7FFFFFFFul

Transport::Transport() : s(-1) {}

Transport::Transport(int socket_desc) : s(socket_desc) {}

int Transport::msg_send(const std::string &msg, int &error_code) {
    char hdr[HDR_LEN + 1];

    error_code = 0;
    if (msg.empty() || msg.size() > MAX_PAYLOAD) {
        return -1;
    }

    snprintf(hdr, sizeof(hdr), "%0*zu", HDR_LEN, msg.size());
    std::string frame = std::string(hdr) + msg;
    size_t sent = 0;

    while (sent < frame.size()) {
        // MSG_NOSIGNAL, a closed peer is an error and not a SIGPIPE
        ssize_t n = send(s, frame.data() + sent, frame.size() - sent,
                         MSG_NOSIGNAL);
        if (n >= 0) {
            sent += n;
        } else if (errno != EINTR) {
            error_code = errno;
            return -1;
        }
    }
    return 0;
}

/* Reads exactly count bytes, EOFException if the peer goes away first */
static std::string recv_exact(int fd, size_t count, int &error_code) {
    std::string rc;
    char buff[4096];

    error_code = 0;
    rc.reserve(count);
    while (rc.size() < count) {
        ssize_t n = recv(fd, buff, std::min(sizeof(buff), count - rc.size()),
                         MSG_WAITALL);
        if (n > 0) {
            rc.append(buff, n);
        } else if (n == 0) {
            throw EOFException("Connection closed by peer");
        } else if (errno != EINTR) {
            error_code = errno;
            throw EOFException(std::string("recv: ") + strerror(errno));
        }
    }
    return rc;
}

std::string Transport::msg_recv(int &error_code) {
    std::string hdr = recv_exact(s, HDR_LEN, error_code);

    for (size_t i = 0; i < hdr.size(); ++i) {
        if (!isdigit((unsigned char)hdr[i])) {
            throw ValueException("Malformed message header '" + hdr + "'");
        }
    }

    unsigned long len = strtoul(hdr.c_str(), NULL, 10);
    if (len > MAX_PAYLOAD) {
        throw ValueException("Message of " + hdr + " bytes is too large");
    }
    return recv_exact(s, len, error_code);
}

int Transport::socket_get(const std::string &path, int &error_code) {
    struct sockaddr_un addr;
    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);

    error_code = 0;
    if (fd == -1) {
        error_code = errno;
        return -1;
    }

    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(fd, (struct sockaddr *)&addr, sizeof(addr)) != 0) {
        error_code = errno;
        ::close(fd);
        return -1;
    }
    return fd;
}

Transport::~Transport() { close(); }

void Transport::close() {
    if (s >= 0) {
        ::close(s);
        s = -1;
    }
}

EOFException::EOFException(std::string m) : std::runtime_error(m) {}

ValueException::ValueException(std::string m) : std::runtime_error(m) {}

ZvmException::ZvmException(int code, const std::string &msg)
    : std::runtime_error(msg), error_code(code), exit_code(-1) {}

ZvmException::ZvmException(int code, const std::string &msg,
                           const std::string &debug_addl)
    : std::runtime_error(msg), error_code(code), debug(debug_addl),
      exit_code(-1) {}

ZvmException::ZvmException(const ZvmException &cause,
                           const std::string &operation,
                           const std::string &vol_id)
    : std::runtime_error(operation + "(" + vol_id + "): " + cause.what()),
      error_code(cause.error_code), debug(cause.debug),
      debug_data(cause.debug_data), op(operation),
      volume_id(vol_id), exit_code(cause.exit_code) {}

ZvmException::~ZvmException() throw() {}

Value::Value(void) : j(json()) {}

Value::Value(bool v) : j(json(v)) {}

Value::Value(uint32_t v) : j(json(v)) {}

Value::Value(int32_t v) : j(json(v)) {}

Value::Value(uint64_t v) : j(json(v)) {}

Value::Value(int64_t v) : j(json(v)) {}

Value::Value(const std::vector<Value> &v) : array(v) {
    j = json::array();
    for (const Value &e : v) {
        j.push_back(e._getJson());
    }
}

Value::Value(const char *v) {
    if (v == NULL) {
        j = json();
    } else {
        j = json(v);
        s = std::string(v);
    }
}

Value::Value(const std::string &v) : j(json(v)), s(v) {}

Value::Value(const std::map<std::string, Value> &v) : obj(v) {
    j = json::object();
    for (auto const &e : v) {
        j[e.first] = e.second._getJson();
    }
}

std::string Value::serialize(void) const { return j.dump(); }

Value::value_type Value::valueType() const {
    switch (j.type()) {
    case json::value_t::null:
        return Value::null_t;
    case json::value_t::boolean:
        return Value::boolean_t;
    case json::value_t::string:
        return Value::string_t;
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
        return Value::numeric_t;
    case json::value_t::object:
        return Value::object_t;
    case json::value_t::array:
        return Value::array_t;
    default:
        std::string em =
            std::string("Unknown value_type ") + std::string(j.type_name());
        throw ValueException(em);
    }
}

Value &Value::operator[](const std::string &key) {
    if (j.is_object()) {
        auto rc = obj.find(key);
        if (rc == obj.end()) {
            std::string em =
                std::string("Specified key '") + key + std::string("' not found");
            throw ValueException(em);
        }
        return rc->second;
    }
    throw ValueException("Value is not object");
}

bool Value::hasKey(const std::string &k) const {
    if (j.is_object()) {
        return obj.find(k) != obj.end();
    }
    return false;
}

bool Value::isValidRequest() const {
    return (j.is_object() && hasKey("method") && hasKey("id") &&
            hasKey("params"));
}

int32_t Value::asInt32_t() const {
    if (j.is_number_integer()) {
        bool big = j.is_number_unsigned() ? j.get<uint64_t>() > INT32_MAX
                                           : (j.get<int64_t>() > INT32_MAX ||
                                              j.get<int64_t>() < INT32_MIN);
        if (big) {
            std::string em = std::string("Value '") + j.dump() +
                             std::string("' overflows int32_t");
            throw ValueException(em);
        }
        return j.get<int32_t>();
    }
    throw ValueException("Value not numeric");
}

uint32_t Value::asUint32_t() const {
    uint64_t v = asUint64_t();

    if (v > UINT32_MAX) {
        std::string em = std::string("Value '") + j.dump() +
                         std::string("' overflows uint32_t");
        throw ValueException(em);
    }
    return (uint32_t)v;
}

uint64_t Value::asUint64_t() const {
    if (j.is_number_unsigned()) {
        return j.get<uint64_t>();
    }
    if (j.is_number_integer()) {
        if (j.get<int64_t>() < 0) {
            std::string em = std::string("Value '") + j.dump() +
                             std::string("' is negative");
            throw ValueException(em);
        }
        return j.get<uint64_t>();
    }
    throw ValueException("Value not numeric");
}

std::string Value::asString() const {
    if (j.is_string()) {
        return s;
    } else if (j.is_null()) {
        return std::string();
    }
    throw ValueException("Value not string");
}

std::map<std::string, Value> Value::asObject() const {
    if (j.is_object()) {
        return obj;
    }
    throw ValueException("Value not object");
}

std::vector<Value> Value::asArray() const {
    if (j.is_array()) {
        return array;
    }
    throw ValueException("Value not array");
}

json Value::_getJson() const { return j; }

std::string Payload::serialize(const Value &v) { return v.serialize(); }

Value Payload::from_json(const json &j) {
    if (j.is_object()) {
        std::map<std::string, Value> vm;
        for (json::const_iterator it = j.begin(); it != j.end(); ++it) {
            vm.emplace(it.key(), from_json(it.value()));
        }
        return Value(vm);
    } else if (j.is_array()) {
        std::vector<Value> vv;
        for (json::const_iterator it = j.begin(); it != j.end(); ++it) {
            vv.push_back(from_json(*it));
        }
        return Value(vv);
    } else if (j.is_number_unsigned()) {
        return Value(j.get<uint64_t>());
    } else if (j.is_number_integer()) {
        return Value(j.get<int64_t>());
    } else if (j.is_string()) {
        return Value(j.get<std::string>());
    } else if (j.is_null()) {
        return Value();
    } else if (j.is_boolean()) {
        return Value(j.get<bool>());
    }
    std::string em =
        std::string("Unsupported value_type ") + std::string(j.type_name());
    throw ValueException(em);
}

Value Payload::deserialize(const std::string &json_str) {
    try {
        return from_json(json::parse(json_str));
    } catch (const json::exception &je) {
        throw ValueException(je.what());
    }
}

static int daemon_connect(const std::string &socket_path) {
    int e = 0;
    int fd = Transport::socket_get(socket_path, e);
    if (fd < 0) {
        throw ZvmException(ZVM_ERR_DAEMON_NOT_RUNNING,
                           "Unable to connect to " + socket_path,
                           std::string("errno ") + ZVM::to_string(e) + " " +
                               strerror(e));
    }
    return fd;
}

Ipc::Ipc(int fd) : t(fd) {}

Ipc::Ipc(const std::string &socket_path) : t(daemon_connect(socket_path)) {}

Ipc::~Ipc() { t.close(); }

void Ipc::send(const Value &msg, const char *what) {
    int ec = 0;

    if (t.msg_send(Payload::serialize(msg), ec) != 0) {
        throw ZvmException(ZVM_ERR_TRANSPORT_COMMUNICATION,
                           std::string("Failed to send ") + what,
                           ec ? strerror(ec) : "empty message");
    }
}

void Ipc::requestSend(const std::string &request, const Value &params,
                      int32_t id) {
    std::map<std::string, Value> v;

    v["method"] = Value(request);
    v["id"] = Value(id);
    v["params"] = params;
    send(Value(v), "request");
}

void Ipc::errorSend(int error_code, const std::string &msg,
                    const std::string &debug, uint32_t id) {
    std::map<std::string, Value> v;
    std::map<std::string, Value> error;

    error["code"] = Value((int32_t)error_code);
    error["message"] = Value(msg);
    error["data"] = Value(debug);

    v["id"] = Value(id);
    v["error"] = Value(error);
    send(Value(v), "error response");
}

Value Ipc::readRequest(void) {
    int ec = 0;
    return Payload::deserialize(t.msg_recv(ec));
}

void Ipc::responseSend(const Value &response, uint32_t id) {
    std::map<std::string, Value> v;

    v["id"] = Value(id);
    v["result"] = response;
    send(Value(v), "response");
}

Value Ipc::responseRead() {
    Value r = readRequest();
    if (r.hasKey(std::string("result"))) {
        return r["result"];
    }

    if (!r.hasKey(std::string("error"))) {
        throw ZvmException(ZVM_ERR_TRANSPORT_SERIALIZATION,
                           "Response carries neither result nor error",
                           r.serialize());
    }

    Value &error = r["error"];
    throw ZvmException(error["code"].asInt32_t(), error["message"].asString(),
                       error["data"].asString());
}

Value Ipc::rpc(const std::string &request, const Value &params, int32_t id) {
    requestSend(request, params, id);
    return responseRead();
}

} // namespace ZVM
