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

#ifndef ZVM_TYPES_H
#define ZVM_TYPES_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Life cycle state of a volume record.
 */
typedef enum {
    ZVM_VOLUME_STATE_UNKNOWN = -1, /**< Unrecognized state string */
    ZVM_VOLUME_STATE_CREATING = 0, /**< Backend create issued */
    ZVM_VOLUME_STATE_AVAILABLE = 1, /**< Ready, not exported */
    ZVM_VOLUME_STATE_IN_USE = 2,   /**< Exported over iSCSI */
    ZVM_VOLUME_STATE_DELETING = 3, /**< Backend delete issued */
    ZVM_VOLUME_STATE_ERROR = 4     /**< Needs operator attention */
} zvm_volume_state;

/**
 * iSCSI target administration tool.
 */
typedef enum {
    ZVM_TARGET_HELPER_UNKNOWN = -1,
    ZVM_TARGET_HELPER_TGTADM = 1, /**< scsi-target-utils */
    ZVM_TARGET_HELPER_LIOADM = 2  /**< LIO via targetcli */
} zvm_target_helper;

#ifdef __cplusplus
}
#endif

#endif /* ZVM_TYPES_H */
