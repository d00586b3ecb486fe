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

#ifndef ZVM_IPC_HPP
#define ZVM_IPC_HPP

#include "libzvolmgmt/libzvolmgmt_common.h"
#include "libzvolmgmt/libzvolmgmt_error.h"

#include <map>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <stdint.h>
#include <string>
#include <vector>

namespace ZVM {

using json = nlohmann::json;

/**
 * Sends and receives payloads, unaware of the contents.
 * Notes:   Not thread safe. i.e. you cannot share the same object with two or
 * more threads.
 */
class ZVM_DLL_LOCAL Transport {
  public:
    /**
     * Size of the header which immediately proceeds the payload.
     */
    const static int HDR_LEN = 10;

    /**
     * Empty ctor.
     */
    Transport();

    /**
     * Class ctor, takes ownership of the descriptor.
     * @param socket_desc   Connected socket descriptor.
     */
    explicit Transport(int socket_desc);

    /**
     * Class dtor
     */
    ~Transport();

    /**
     * Sends a message over the transport.
     * @param[in]   msg         The message to be sent.
     * @param[out]  error_code  Errno (only valid if we return -1)
     * @return 0 on success, else -1
     */
    int msg_send(const std::string &msg, int &error_code);

    /**
     * Receives one message.  A peer going away mid message raises
     * EOFException, a header which is not HDR_LEN digits raises
     * ValueException.
     * @param error_code    errno of a failed recv, else 0
     * @return Message payload
     */
    std::string msg_recv(int &error_code);

    /**
     * Creates a connected socket (AF_UNIX) to the specified path
     * @param path of the AF_UNIX file to be used for IPC
     * @param error_code    Error reason for the failure (errno)
     * @return -1 on error, else connected socket.
     */
    static int socket_get(const std::string &path, int &error_code);

    /**
     * Closes the transport, called in the destructor if not done in advance.
     */
    void close();

  private:
    Transport(const Transport &) = delete;
    Transport &operator=(const Transport &) = delete;

    int s; // Socket descriptor
};

/**
 * Generic function to convert Type v into a string.
 * @param v Template type T
 * @return string representation
 */
template <class Type> static std::string to_string(Type v) {
    std::stringstream out;
    out << v;
    return out.str();
}

/**
 * Class that represents an EOF condition
 * @param m     Message
 */
class ZVM_DLL_LOCAL EOFException : public std::runtime_error {
  public:
    EOFException(std::string m);
};

/**
 * User defined class for Value errors during serialize / de-serialize.
 */
class ZVM_DLL_LOCAL ValueException : public std::runtime_error {
  public:
    /**
     * Constructor
     * @param m Exception message
     */
    ValueException(std::string m);
};

/**
 * Every failure the library reports.  error_code is a zvm_error_number.
 */
class ZVM_DLL_LOCAL ZvmException : public std::runtime_error {
  public:
    /**
     * Constructor
     * @param code      Error code
     * @param msg       Error message
     */
    ZvmException(int code, const std::string &msg);

    /**
     * Constructor
     * @param code          Error code
     * @param msg           Error message
     * @param debug_addl    Additional debug data, e.g. command stderr
     */
    ZvmException(int code, const std::string &msg,
                 const std::string &debug_addl);

    /**
     * Re-raise a lower level error with the operation and volume it was
     * raised for.  Code, debug data and exit code are carried over.
     * @param cause         Original error
     * @param operation     Name of the failed operation
     * @param vol_id        Volume the operation was working on
     */
    ZvmException(const ZvmException &cause, const std::string &operation,
                 const std::string &vol_id);

    /**
     * Destructor
     */
    ~ZvmException() throw();

    int error_code;
    std::string debug;
    std::string debug_data; // Command stdout when raised for a command
    std::string op;
    std::string volume_id;
    int exit_code; // -1 unless raised for a command exit status
};

/**
 * Represents a value in the serialization.
 */
class ZVM_DLL_LOCAL Value {
  public:
    /**
     * Different types this class can hold.
     */
    enum value_type {
        null_t,
        boolean_t,
        string_t,
        numeric_t,
        object_t,
        array_t
    };

    /**
     * Default constructor creates a "null" type
     */
    Value(void);

    /**
     * Boolean constructor
     * @param v value
     */
    Value(bool v);

    /**
     * Numeric unsigned 32 constructor
     * @param v value
     */
    Value(uint32_t v);

    /**
     * Numeric signed 32 constructor
     * @param v value
     */
    Value(int32_t v);

    /**
     * Numeric unsigned 64 constructor.
     * @param v value
     */
    Value(uint64_t v);

    /**
     * Numeric signed 64 constructor.
     * @param v value
     */
    Value(int64_t v);

    /**
     * Constructor for char * i.e. string.
     * @param v value
     */
    Value(const char *v);

    /**
     * Constructor for std::string
     * @param v value
     */
    Value(const std::string &v);

    /**
     * Constructor for object type
     * @param v values
     */
    Value(const std::map<std::string, Value> &v);

    /**
     * Constructor for array type
     * @param v array values
     */
    Value(const std::vector<Value> &v);

    /**
     * Serialize Value to json
     * @return
     */
    std::string serialize(void) const;

    /**
     * Returns the enumerated type represented by object
     * @return enumerated type
     */
    value_type valueType() const;

    /**
     * Overloaded operator for map access
     * @param key
     * @return Value
     */
    Value &operator[](const std::string &key);

    /**
     * Returns true if value has a key in key/value pair
     * @return true if key exists, else false.
     */
    bool hasKey(const std::string &k) const;

    /**
     * Checks to see if a Value contains a valid request
     * @return True if it is a request, else false
     */
    bool isValidRequest(void) const;

    /**
     * Signed 32 integer value represented by object.
     * @return integer value else ValueException on error
     */
    int32_t asInt32_t() const;

    /**
     * Unsigned 32 integer value represented by object.
     * @return integer value else ValueException on error
     */
    uint32_t asUint32_t() const;

    /**
     * Unsigned 64 integer value represented by object.
     * @return integer value else ValueException on error
     */
    uint64_t asUint64_t() const;

    /**
     * String value represented by object.
     * @return string value else ValueException on error
     */
    std::string asString() const;

    /**
     * key/value represented by object.
     * @return map of key and values else ValueException on error
     */
    std::map<std::string, Value> asObject() const;

    /**
     * vector of values represented by object.
     * @return vector of array values else ValueException on error
     */
    std::vector<Value> asArray() const;

    /**
     * Underlying json document.
     */
    json _getJson() const;

  private:
    json j;
    std::vector<Value> array;
    std::map<std::string, Value> obj;
    std::string s;
};

/**
 * Serialize, de-serialize methods.
 */
class ZVM_DLL_LOCAL Payload {
  public:
    /**
     * Given a Value returns json representation.
     * @param v Value to serialize
     * @return String representation
     */
    static std::string serialize(const Value &v);

    /**
     * Given a json string return a Value
     * @param json_str  String to de-serialize
     * @return Value
     */
    static Value deserialize(const std::string &json_str);

  private:
    static Value from_json(const json &j);
};

class ZVM_DLL_LOCAL Ipc {
  public:
    /**
     * Constructor that takes a file descriptor, which the object owns
     * @param fd    File descriptor to use
     */
    explicit Ipc(int fd);

    /**
     * Constructor that takes a socket path.
     * Raises ZvmException(ZVM_ERR_DAEMON_NOT_RUNNING) if nobody listens.
     * @param socket_path   Unix domain socket
     */
    explicit Ipc(const std::string &socket_path);

    /**
     * Destructor
     */
    ~Ipc();

    /**
     * Send a request over IPC
     * @param request       IPC function name
     * @param params        Parameters
     * @param id            Request ID
     */
    void requestSend(const std::string &request, const Value &params,
                     int32_t id = ZVM_DEFAULT_ID);
    /**
     * Reads a request
     * @returns Value
     */
    Value readRequest(void);

    /**
     * Send a response to a request
     * @param response      Response value
     * @param id            Id that matches request
     */
    void responseSend(const Value &response, uint32_t id = ZVM_DEFAULT_ID);

    /**
     * Read a response
     * @return Value of response
     */
    Value responseRead();

    /**
     * Send an error
     * @param error_code        Error code
     * @param msg               Error message
     * @param debug             Debug data
     * @param id                Id that matches request
     */
    void errorSend(int error_code, const std::string &msg,
                   const std::string &debug, uint32_t id = ZVM_DEFAULT_ID);

    /**
     * Do a remote procedure call (Request with a returned response
     * @param request           Function method
     * @param params            Function parameters
     * @param id                Id of request
     * @return Result of the operation.
     */
    Value rpc(const std::string &request, const Value &params,
              int32_t id = ZVM_DEFAULT_ID);

  private:
    void send(const Value &msg, const char *what);

    Transport t;
};

} // namespace ZVM

#endif
