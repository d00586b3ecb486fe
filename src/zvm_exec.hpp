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

#ifndef ZVM_EXEC_HPP
#define ZVM_EXEC_HPP

#include "libzvolmgmt/libzvolmgmt_common.h"

#include <stdint.h>
#include <string>
#include <vector>

namespace ZVM {

/**
 * Exit code reported when the command could not be executed at all.
 */
#define ZVM_EXEC_NOT_FOUND 127

/**
 * Captured outcome of a command which exited with status 0.
 */
struct ZVM_DLL_LOCAL CommandResult {
    CommandResult() : exit_code(0) {}

    int exit_code;
    std::string out;
    std::string err;
};

/**
 * Runs external provisioning commands.
 *
 * Implementations raise ZvmException with ZVM_ERR_TIMEOUT when the command
 * outlives the timeout (the process is killed) and ZVM_ERR_EXEC_FAILURE
 * when it exits non-zero.  In the latter case exit_code is set and debug
 * holds stderr.  No retries are done at this layer.
 */
class ZVM_DLL_LOCAL Executor {
  public:
    virtual ~Executor() {}

    /**
     * Run a command and wait for it.
     * @param command   Program to run, looked up in PATH
     * @param args      Arguments, not including the program name
     * @param timeout   Time out in ms
     * @return Result with exit code, stdout and stderr
     */
    virtual CommandResult run(const std::string &command,
                              const std::vector<std::string> &args,
                              uint32_t timeout) = 0;
};

/**
 * fork/exec based executor.
 */
class ZVM_DLL_LOCAL ProcessExecutor : public Executor {
  public:
    /**
     * Class ctor
     * @param prefix    Words placed in front of every command, e.g. a root
     *                  helper ("sudo") or an ssh invocation for a remote
     *                  host.  Empty to run commands directly.
     */
    explicit ProcessExecutor(
        const std::vector<std::string> &prefix = std::vector<std::string>());

    CommandResult run(const std::string &command,
                      const std::vector<std::string> &args,
                      uint32_t timeout);

  private:
    std::vector<std::string> prefix;
};

/**
 * Printable form of a command line, used in logs and error messages.
 */
ZVM_DLL_LOCAL std::string command_str(const std::string &command,
                                      const std::vector<std::string> &args);

} // namespace ZVM

#endif
