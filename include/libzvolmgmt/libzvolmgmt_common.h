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

#ifndef ZVM_COMMON_H
#define ZVM_COMMON_H

#include "libzvolmgmt_types.h"

#if defined _WIN32 || defined __CYGWIN__
#define ZVM_DLL_IMPORT __declspec(dllimport)
#define ZVM_DLL_EXPORT __declspec(dllexport)
#define ZVM_DLL_LOCAL
#else
#if __GNUC__ >= 4
#define ZVM_DLL_IMPORT __attribute__((visibility("default")))
#define ZVM_DLL_EXPORT __attribute__((visibility("default")))
#define ZVM_DLL_LOCAL  __attribute__((visibility("hidden")))
#else
#define ZVM_DLL_IMPORT
#define ZVM_DLL_EXPORT
#define ZVM_DLL_LOCAL
#endif
#endif

/**
 * Default location of the daemon's unix domain socket, may be overridden
 * with the environment variable ZVM_UDS_PATH.
 */
#define ZVM_UDS_PATH_DEFAULT "/var/run/zvm/zvmd.sock"

/**
 * Environment variable holding the daemon socket path.
 */
#define ZVM_UDS_PATH_ENV "ZVM_UDS_PATH"

/**
 * Default id used for requests when the caller does not care.
 */
#define ZVM_DEFAULT_ID 100

#endif /* ZVM_COMMON_H */
