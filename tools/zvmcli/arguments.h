/*
 * Copyright (C) 2011-2012 Red Hat, Inc.
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301 USA
 */

#ifndef __ARGUMENTS_H
#define __ARGUMENTS_H

#include <string>
#include <vector>
#include <stdint.h>

namespace ZVM {

#define LIST_TYPE_VOL       "VOLUMES"
#define LIST_TYPE_SNAP      "SNAPSHOTS"
#define LIST_TYPE_EXP       "EXPORTS"

template <class Type>
class Arg {
public:
    bool present;
    Type value;

    Arg() : present(false) {
    }

    void set(Type t) {
        present = true;
        value = t;
    }
};

/**
 * Enumerated commands.  Note: make sure they match array index for long_options
 */
typedef enum {
    NONE = -1,
    LIST = 1,
    CREATE_VOL = 2,
    DELETE_VOL = 3,
    CREATE_EXPORT = 4,
    REMOVE_EXPORT = 5,
    CREATE_SNAP = 6,
    DELETE_SNAP = 7,
    CLONE = 8,
    EXTEND_VOL = 9,
    ACCESS_GRANT = 10,
    ACCESS_REVOKE = 11,
    CHECK_EXPORT = 12,
    LOCAL_PATH = 13,
    RECONCILE = 14,
} commandTypes;

/**
 * Class the encapsulates the command line arguments.
 */
class Arguments {
public:
    Arguments():c(NONE){}

    /**
     * Daemon socket.
     */
    Arg<std::string> socket;

    /**
     * Output sizes as human
     */
    Arg<bool> human;

    /**
     * Use terse output
     */
    Arg<std::string> terse;

    /**
     * Generic name, needs command for context.
     */
    Arg<std::string> name;

    /**
     * Size specifier, needs command for context.
     */
    Arg<std::string> size;

    /**
     * Initiator iqn, needs command for context.
     */
    Arg<std::string> initiator;

    /**
     * Volume specifier, needs command for context.
     */
    Arg<std::string> volume;

    /**
     * Actual command to execute
     */
    commandTypes c;

    /**
     * String representation of command.
     */
    std::string commandStr;

    /**
     * Command value.
     */
    std::string commandValue;

    /**
     * Size argument in bytes, 0 if not given.
     */
    uint64_t sizeBytes() const;
};

/**
 * Processes the command line arguments.
 * Note: This function will exit() on missing/bad arguments.
 * @param argc      Command line argument count
 * @param argv      Arguments
 * @param args      Class which holds the parsed arguments.
 */
void processCommandLine( int argc, char **argv, Arguments &args );

} //namespace

#endif
