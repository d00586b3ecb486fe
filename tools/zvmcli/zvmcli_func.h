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

#ifndef _ZVMCLI_FUNC_H
#define _ZVMCLI_FUNC_H

#include "arguments.h"
#include "zvm_client.hpp"

/**
 * Dumps error information to stdout.
 * @param e     Error raised by the client library or the daemon.
 */
void dumpError(const ZVM::ZvmException &e);

/**
 * Dumps volumes, snapshots or exports to stdout.
 * @param a     Command line arguments.
 * @param c     Connection
 * @return ZVM_ERR_OK on success, else error reason.
 */
int list(const ZVM::Arguments &a, ZVM::Client &c);

/**
 * Creates a volume
 * @param a     Command line arguments.
 * @param c     Connection
 * @return ZVM_ERR_OK on success, else error reason.
 */
int createVolume(const ZVM::Arguments &a, ZVM::Client &c);

/**
 * Deletes a volume
 * @param a     Command line arguments
 * @param c     Connection
 * @return ZVM_ERR_OK on success, else error reason.
 */
int deleteVolume(const ZVM::Arguments &a, ZVM::Client &c);

/**
 * Grows a volume
 * @param a     Command line arguments
 * @param c     Connection
 * @return ZVM_ERR_OK on success, else error reason.
 */
int extendVolume(const ZVM::Arguments &a, ZVM::Client &c);

/**
 * Exports a volume to an initiator
 * @param a     Command line arguments
 * @param c     Connection
 * @return ZVM_ERR_OK on success, else error reason.
 */
int createExport(const ZVM::Arguments &a, ZVM::Client &c);

/**
 * Removes the export of a volume
 * @param a     Command line arguments
 * @param c     Connection
 * @return ZVM_ERR_OK on success, else error reason.
 */
int removeExport(const ZVM::Arguments &a, ZVM::Client &c);

/**
 * Checks that the target of an export is still present.
 * @param a     Command line arguments
 * @param c     Connection
 * @return ZVM_ERR_OK on success, else error reason.
 */
int checkExport(const ZVM::Arguments &a, ZVM::Client &c);

/**
 * Grants access to an initiator for an exported volume.
 * @param a     Command line arguments
 * @param c     Connection
 * @return ZVM_ERR_OK on success, else error reason.
 */
int accessGrant(const ZVM::Arguments &a, ZVM::Client &c);

/**
 * Removes access for an initiator.
 * @param a     Command line arguments
 * @param c     Connection
 * @return ZVM_ERR_OK on success, else error reason.
 */
int accessRevoke(const ZVM::Arguments &a, ZVM::Client &c);

int createSnapshot(const ZVM::Arguments &a, ZVM::Client &c);
int deleteSnapshot(const ZVM::Arguments &a, ZVM::Client &c);

/**
 * Creates a new volume from a snapshot.
 * @param a     Command line arguments
 * @param c     Connection
 * @return ZVM_ERR_OK on success, else error reason.
 */
int cloneSnapshot(const ZVM::Arguments &a, ZVM::Client &c);

/**
 * Prints the local block device of a volume.
 */
int localPath(const ZVM::Arguments &a, ZVM::Client &c);

/**
 * Runs a reconciliation pass and prints what it found.
 * @param a     Command line arguments
 * @param c     Connection
 * @return ZVM_ERR_OK on success, else error reason.
 */
int reconcile(const ZVM::Arguments &a, ZVM::Client &c);

#endif
