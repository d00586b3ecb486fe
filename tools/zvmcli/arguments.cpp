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

#include "arguments.h"
#include "zvm_utils.hpp"
#include "libzvolmgmt/libzvolmgmt_common.h"
#include <stdio.h>
#include <stdlib.h>
#include <getopt.h>
#include <stdarg.h>
#include <unistd.h>
#include <algorithm>

#ifndef VERSION
#define VERSION "unknown"
#endif

namespace ZVM {

#define _(text) text
const char *list_types[] = { LIST_TYPE_VOL, LIST_TYPE_SNAP, LIST_TYPE_EXP };
const std::vector<std::string> listTypes(list_types, list_types + 3);

uint64_t Arguments::sizeBytes() const
{
    uint64_t rc = 0;
    if( size.present ) {
        _size_parse(size.value, &rc);
    }
    return rc;
}

void syntaxError(const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vprintf(fmt, args);
    va_end(args);
    exit(1);
}

void usage()
{
        printf(_("Usage: %s [OPTIONS]... [COMAND]...\n"), "zvmcli");
        fputs(_("\
Manage ZFS volumes and their iSCSI exports through zvmd.\n\
\n\
"), stdout);
        fputs(_("\
Options include:\n\
  -s, --socket=PATH             daemon socket (ZVM_UDS_PATH)\n\
  -H,                           print sizes in human readable format\n\
                                (e.g., MiB, GiB, TiB)\n\
  -t, --terse=SEP               print output in terse form with \"SEP\" as a \n\
                                record separator\n\
"), stdout);
        fputs(_("\
Commands include:\n\
  -l                            List records of type [VOLUMES|SNAPSHOTS|EXPORTS]\n\
      --create-volume=ID        requires:\n\
                                --size <volume size> Can use K, M, G, T\n\
      --delete-volume=ID        deletes a volume given its volume id\n\
      --extend-volume=ID        grows a volume, requires:\n\
                                --size <new size>\n\
"), stdout);
        fputs(_("\
      --create-export=ID        exports a volume over iSCSI, requires:\n\
                                --initiator <initiator iqn>\n\
      --remove-export=ID        removes the export of a volume\n\
      --check-export=ID         checks the target of an export is present\n\
      --access-grant=INIT_IQN   allows an initiator to log in, requires:\n\
                                --volume <volume id>\n\
      --access-revoke=INIT_IQN  removes access for an initiator, requires:\n\
                                --volume <volume id>\n\
"), stdout);
        fputs(_("\
      --create-snapshot=ID      snapshots a volume, requires:\n\
                                --name <snapshot id>\n\
      --delete-snapshot=SNAP_ID deletes a snapshot\n\
      --clone=SNAP_ID           creates a volume from a snapshot, requires:\n\
                                --name <new volume id>\n\
      --local-path=ID           prints the block device of a volume\n\
      --reconcile               compares records with the storage\n\
"), stdout);
        fputs(_("\
  -v, --version                 print version information and exit\n\
  -h, --help                    print help text\n\n\n\
"), stdout);

    exit(1);
}

void version()
{
    printf("zvmcli version %s, built on %s\n\n", VERSION, __DATE__ ", " __TIME__);
    printf("License LGPLv2.1+: GNU LGPL version 2.1 or later\n");
    exit(0);
}

static std::string join(std::vector<std::string> s, std::string del)
{
    std::string rc = "";

    for( size_t i = 0; i < s.size(); ++i) {
        rc += s[i];
        if( i + 1 < s.size()) {
            rc +=del;
        }
    }

    return rc;
}

std::string validateDomain( std::string option, std::string  value,
                        const std::vector<std::string> &domain)
{
    std::string arg(value);
    std::transform(arg.begin(), arg.end(), arg.begin(), ::toupper);

    for( size_t i = 0; i < domain.size(); ++i ) {
        if( arg == domain[i] ) {
            return arg;
        }
    }
    syntaxError("option (%s) with value (%s) not in set [%s]\n", option.c_str(),
                value.c_str(), join(domain, "|").c_str());

    return "Never get here!";
}

void setCommand( Arguments &args, const std::string &cs, commandTypes c,
                    std::string value)
{
    if( args.c != NONE ) {
        syntaxError(" only one command can be specified at a time, "
                        "previous is (%s)\n", args.commandStr.c_str());
    } else {
        args.commandStr = cs;
        args.c = c;
        args.commandValue = value;
    }
}

static struct option long_options[] = {
    {"socket", required_argument, 0, 's'},              //0
    {"list", required_argument, 0, 'l'},                //1
    {"create-volume", required_argument, 0, 0},         //2
    {"delete-volume", required_argument, 0, 0},         //3
    {"create-export", required_argument, 0, 0},         //4
    {"remove-export", required_argument, 0, 0},         //5
    {"create-snapshot", required_argument, 0, 0},       //6
    {"delete-snapshot", required_argument, 0, 0},       //7
    {"clone", required_argument, 0, 0},                 //8
    {"extend-volume", required_argument, 0, 0},         //9
    {"access-grant", required_argument, 0, 0},          //10
    {"access-revoke", required_argument, 0, 0},         //11
    {"check-export", required_argument, 0, 0},          //12
    {"local-path", required_argument, 0, 0},            //13
    {"reconcile", no_argument, 0, 0},                   //14
    {"terse", required_argument, 0, 't'},               //15
    {"help", no_argument, 0, 'h'},                      //16
    {"version", no_argument, 0, 'v'},                   //17
    {"size", required_argument, 0, 0},                  //18
    {"initiator", required_argument, 0, 0},             //19
    {"name", required_argument, 0, 0},                  //20
    {"volume", required_argument, 0, 0},                //21
    {0, 0, 0, 0}
};

void parseArguments(int argc, char **argv, Arguments &args) {
    int c;

    while (1) {

        int long_opt_index = 0;

        c = getopt_long(argc, argv, "s:Hvht:l:",
            long_options, &long_opt_index);

        /* Detect the end of the options. */
        if (c == -1)
            break;

        switch (c) {
            case 0: {
                /* If this option set a flag, do nothing else now. */
                if (long_options[long_opt_index].flag != 0)
                    break;

                if( long_opt_index <= RECONCILE ) {
                    setCommand(args, long_options[long_opt_index].name,
                                (commandTypes)long_opt_index,
                                optarg ? optarg : "");
                } else {
                    switch (long_opt_index) {
                        case (18): {
                            uint64_t s = 0;

                            if( ! _size_parse(optarg, &s) ) {
                                syntaxError("--size %s not in the form "
                                            "<num>|<num>[K|M|G|T]\n", optarg);
                            }
                            args.size.set(optarg);
                            break;
                        }
                        case (19): {
                            args.initiator.set(optarg);
                            break;
                        }
                        case (20): {
                            args.name.set(optarg);
                            break;
                        }
                        case (21): {
                            args.volume.set(optarg);
                            break;
                        }
                    }
                }
                break;
            }
            case('s'): {
                args.socket.set(optarg);
                break;
            }
            case 'l': {
                setCommand(args, "l", LIST, validateDomain("-l", optarg,
                            listTypes));
                break;
            }
            case 'h': {
                usage();
                break;
            }
            case 'H': {
                args.human.set(true);
                break;
            }
            case 't': {
                args.terse.set(optarg);
                break;
            }
            case 'v': {
                version();
                break;
            }
            case '?': {
                break;
            }
            default: {
                syntaxError("Code bug, missing handler for option %c\n", c);
            }
        }
    }
}

//Everything parsed, lets see if it logically makes sense.
void requiredArguments( Arguments &args)
{
    if( args.c == NONE ) {
        syntaxError("No command specified. -h for help\n");
    } else {
        switch ( args.c ) {
            case (CREATE_VOL) :
            case (EXTEND_VOL) : {
                if( !args.size.present ) {
                    syntaxError("--%s requires --size\n",
                                    args.commandStr.c_str());
                }
                break;
            }
            case ( CREATE_EXPORT ) : {
                if( !args.initiator.present ) {
                    syntaxError("--%s requires --initiator\n",
                                    args.commandStr.c_str());
                }
                break;
            }
            case ( CREATE_SNAP ) :
            case ( CLONE ) : {
                if( !args.name.present ) {
                    syntaxError("--%s requires --name\n",
                                    args.commandStr.c_str());
                }
                break;
            }
            case ( ACCESS_GRANT ) :
            case ( ACCESS_REVOKE ) : {
                if( !args.volume.present ) {
                    syntaxError("--%s requires --volume\n",
                                    args.commandStr.c_str());
                }
                break;
            }
            case ( NONE ):
            case ( LIST ):
            case ( DELETE_VOL ):
            case ( REMOVE_EXPORT ):
            case ( DELETE_SNAP ):
            case ( CHECK_EXPORT ):
            case ( LOCAL_PATH ):
            case ( RECONCILE ): {
                break;
            }

        }

        //Check other values.
        if( !args.socket.present ) {
            char *uds_env = getenv(ZVM_UDS_PATH_ENV);
            if( uds_env ) {
                args.socket.set(uds_env);
            } else {
                args.socket.set(ZVM_UDS_PATH_DEFAULT);
            }
        }
    }
}

void processCommandLine( int argc, char **argv, Arguments &args )
{
    parseArguments(argc, argv, args);
    requiredArguments(args);
}

} //Namespace
