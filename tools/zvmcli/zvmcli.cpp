/*
 * Copyright (C) 2011-2013 Red Hat, Inc.
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

#include <string>
#include <stdio.h>
#include "arguments.h"
#include "zvmcli_func.h"

static int run(const ZVM::Arguments &a, ZVM::Client &c)
{
    switch( a.c ) {
        case (ZVM::LIST) : {
            return list(a, c);
        }
        case (ZVM::CREATE_VOL) : {
            return createVolume(a, c);
        }
        case (ZVM::DELETE_VOL) : {
            return deleteVolume(a, c);
        }
        case (ZVM::CREATE_EXPORT) : {
            return createExport(a, c);
        }
        case (ZVM::REMOVE_EXPORT) : {
            return removeExport(a, c);
        }
        case (ZVM::CREATE_SNAP) : {
            return createSnapshot(a, c);
        }
        case (ZVM::DELETE_SNAP) : {
            return deleteSnapshot(a, c);
        }
        case (ZVM::CLONE) : {
            return cloneSnapshot(a, c);
        }
        case (ZVM::EXTEND_VOL) : {
            return extendVolume(a, c);
        }
        case (ZVM::ACCESS_GRANT) : {
            return accessGrant(a, c);
        }
        case (ZVM::ACCESS_REVOKE) : {
            return accessRevoke(a, c);
        }
        case (ZVM::CHECK_EXPORT) : {
            return checkExport(a, c);
        }
        case (ZVM::LOCAL_PATH) : {
            return localPath(a, c);
        }
        case (ZVM::RECONCILE) : {
            return reconcile(a, c);
        }
        case (ZVM::NONE): {
            break;
        }
    }
    return ZVM_ERR_OK;
}

int main(int argc, char *argv[])
{
    ZVM::Arguments a;
    ZVM::processCommandLine(argc, argv, a);

    int main_rc = 0;

    try {
        ZVM::Client c(a.socket.value);
        main_rc = run(a, c);
    } catch (const ZVM::ZvmException &e) {
        dumpError(e);
        main_rc = e.error_code;
    }
    return main_rc ? 1 : 0;
}
