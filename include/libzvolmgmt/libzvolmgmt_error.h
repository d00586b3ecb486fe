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

#ifndef ZVM_ERROR_H
#define ZVM_ERROR_H

#include "libzvolmgmt_common.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Possible enumerated return codes from library
 */
typedef enum {
    ZVM_ERR_OK = 0,                  /**< OK */
    ZVM_ERR_LIB_BUG = 1,             /**< Library BUG */
    ZVM_ERR_TIMEOUT = 11,            /**< External command timed out */
    ZVM_ERR_DAEMON_NOT_RUNNING = 12, /**< Daemon socket not reachable */

    ZVM_ERR_NAME_CONFLICT = 50,          /**< Volume id already exists */
    ZVM_ERR_SNAPSHOT_NAME_CONFLICT = 51, /**< Snapshot id already exists */

    ZVM_ERR_INVALID_ARGUMENT = 101, /**< Precondition checks failed */

    ZVM_ERR_NO_SUPPORT = 153, /**< Feature not supported */

    ZVM_ERR_VOLUME_BUSY = 160,          /**< Volume is exported */
    ZVM_ERR_HAS_CHILD_DEPENDENCY = 161, /**< Snapshots or clones exist */
    ZVM_ERR_ALREADY_EXPORTED = 162,     /**< Volume already has an export */

    ZVM_ERR_NOT_FOUND_SNAPSHOT = 204, /**< Specified snapshot not found */
    ZVM_ERR_NOT_FOUND_VOLUME = 205,   /**< Specified volume not found */
    ZVM_ERR_NOT_FOUND_EXPORT = 206,   /**< Volume has no export */

    ZVM_ERR_NO_SUPPORT_SHRINK = 252, /**< Volume can only grow */

    ZVM_ERR_NOT_ENOUGH_SPACE = 350, /**< Insufficient space */

    ZVM_ERR_EXEC_FAILURE = 360, /**< External command exited non-zero */

    ZVM_ERR_ALREADY_LOCKED = 370, /**< Another operation holds the lease */

    ZVM_ERR_RECONCILIATION_MISMATCH = 380, /**< Rollback or state check failed */

    ZVM_ERR_TRANSPORT_COMMUNICATION = 400, /**< Error communicating with daemon */
    ZVM_ERR_TRANSPORT_SERIALIZATION = 401, /**< Transport serialization error */
    ZVM_ERR_TRANSPORT_INVALID_ARG = 402, /**< Parameter transported over IPC is invalid */

    ZVM_ERR_REGISTRY_IO = 450, /**< Registry database error */

    ZVM_ERR_VOLUME_NOT_READY = 512 /**< Volume is in a transitional or error state */
} zvm_error_number;

#ifdef __cplusplus
}
#endif

#endif /* ZVM_ERROR_H */
