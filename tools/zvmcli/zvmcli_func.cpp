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
#include "zvmcli_func.h"
#include "arguments.h"
#include "zvm_utils.hpp"
#include <stdio.h>
#include <stdint.h>
#define __STDC_FORMAT_MACROS    /* To use PRIu64 */
#include <inttypes.h>

using ZVM::ZvmException;

static std::string initiatorsJoin(const std::set<std::string> &inits,
                                  const char *sep)
{
    std::string rc;
    std::set<std::string>::const_iterator it;

    for( it = inits.begin(); it != inits.end(); ++it ) {
        if( !rc.empty() ) {
            rc += sep;
        }
        rc += *it;
    }
    return rc;
}

void printVolume(const ZVM::Arguments &a, const ZVM::Volume &v)
{
    const char *state = ZVM::volume_state_str(v.state);
    std::string s = ZVM::_size_human(a.human.present, v.size_bytes);

    if( a.terse.present ) {
        const char *sep = a.terse.value.c_str();

        printf("%s%s%s%s%s%s%s%s%" PRIu64 "%s%s\n", v.id.c_str(), sep,
                s.c_str(), sep, state, sep, v.backing_path.c_str(), sep,
                v.created_at, sep, v.origin_snapshot.c_str());
    } else {
        printf("%-32s\t%20s\t%-10s\t%-40s\t%s\n", v.id.c_str(), s.c_str(),
                state, v.backing_path.c_str(), v.origin_snapshot.c_str());
    }
}

void printSnapshot(const ZVM::Arguments &a, const ZVM::Snapshot &s)
{
    std::string size = ZVM::_size_human(a.human.present, s.size_bytes);

    if( a.terse.present ) {
        const char *sep = a.terse.value.c_str();

        printf("%s%s%s%s%s%s%s%s%" PRIu64 "\n", s.id.c_str(), sep,
                s.volume_id.c_str(), sep, size.c_str(), sep,
                s.backing_path.c_str(), sep, s.created_at);
    } else {
        printf("%-32s\t%-32s\t%20s\t%-40s\t%" PRIu64 "\n", s.id.c_str(),
                s.volume_id.c_str(), size.c_str(), s.backing_path.c_str(),
                s.created_at);
    }
}

void printExport(const ZVM::Arguments &a, const ZVM::Export &e)
{
    if( a.terse.present ) {
        const char *sep = a.terse.value.c_str();

        printf("%s%s%s%s%u%s%u%s%s%s%s\n", e.volume_id.c_str(), sep,
                e.target_iqn.c_str(), sep, e.tid, sep, e.lun, sep,
                e.portal.c_str(), sep,
                initiatorsJoin(e.initiators, ",").c_str());
    } else {
        printf("%-32s\t%-60s\t%-4u\t%-4u\t%-22s\t%s\n", e.volume_id.c_str(),
                e.target_iqn.c_str(), e.tid, e.lun, e.portal.c_str(),
                initiatorsJoin(e.initiators, ",").c_str());
    }
}

void dumpError(const ZvmException &e)
{
    printf("Error occurred: %d\n", e.error_code);
    printf("Msg: %s\n", e.what());

    if( e.debug.size() ) {
        printf("Exception: %s\n", e.debug.c_str());
    }
}

static int listVolumes(const ZVM::Arguments &a, ZVM::Client &c)
{
    std::vector<ZVM::Volume> vols = c.volumeList();

    if( !a.terse.present ) {
        printf("%-32s\t%20s\t%-10s\t%-40s\t%s\n", "ID", "Size", "State",
                "Backing", "Origin");
    }

    for( size_t i = 0; i < vols.size(); ++i ) {
        printVolume(a, vols[i]);
    }
    return ZVM_ERR_OK;
}

static int listSnapshots(const ZVM::Arguments &a, ZVM::Client &c)
{
    std::vector<ZVM::Snapshot> snaps = c.snapshotList();

    if( !a.terse.present ) {
        printf("%-32s\t%-32s\t%20s\t%-40s\t%s\n", "ID", "Volume", "Size",
                "Backing", "Created");
    }

    for( size_t i = 0; i < snaps.size(); ++i ) {
        printSnapshot(a, snaps[i]);
    }
    return ZVM_ERR_OK;
}

static int listExports(const ZVM::Arguments &a, ZVM::Client &c)
{
    std::vector<ZVM::Export> exps = c.exportList();

    if( !a.terse.present ) {
        printf("%-32s\t%-60s\t%-4s\t%-4s\t%-22s\t%s\n", "Volume", "Target",
                "TID", "LUN", "Portal", "Initiators");
    }

    for( size_t i = 0; i < exps.size(); ++i ) {
        printExport(a, exps[i]);
    }
    return ZVM_ERR_OK;
}

int list(const ZVM::Arguments &a, ZVM::Client &c)
{
    int rc = 1;

    try {
        if( a.commandValue == LIST_TYPE_VOL ) {
            rc = listVolumes(a, c);
        } else if ( a.commandValue == LIST_TYPE_SNAP ) {
            rc = listSnapshots(a, c);
        } else if ( a.commandValue == LIST_TYPE_EXP ) {
            rc = listExports(a, c);
        }
    } catch (const ZvmException &e) {
        dumpError(e);
        rc = e.error_code;
    }
    return rc;
}

int createVolume(const ZVM::Arguments &a, ZVM::Client &c)
{
    try {
        printVolume(a, c.createVolume(a.commandValue, a.sizeBytes()));
    } catch (const ZvmException &e) {
        dumpError(e);
        return e.error_code;
    }
    return ZVM_ERR_OK;
}

int deleteVolume(const ZVM::Arguments &a, ZVM::Client &c)
{
    try {
        c.deleteVolume(a.commandValue);
    } catch (const ZvmException &e) {
        dumpError(e);
        return e.error_code;
    }
    return ZVM_ERR_OK;
}

int extendVolume(const ZVM::Arguments &a, ZVM::Client &c)
{
    try {
        printVolume(a, c.extendVolume(a.commandValue, a.sizeBytes()));
    } catch (const ZvmException &e) {
        dumpError(e);
        return e.error_code;
    }
    return ZVM_ERR_OK;
}

int createExport(const ZVM::Arguments &a, ZVM::Client &c)
{
    try {
        printExport(a, c.createExport(a.commandValue, a.initiator.value));
    } catch (const ZvmException &e) {
        dumpError(e);
        return e.error_code;
    }
    return ZVM_ERR_OK;
}

int removeExport(const ZVM::Arguments &a, ZVM::Client &c)
{
    try {
        c.removeExport(a.commandValue);
    } catch (const ZvmException &e) {
        dumpError(e);
        return e.error_code;
    }
    return ZVM_ERR_OK;
}

int checkExport(const ZVM::Arguments &a, ZVM::Client &c)
{
    try {
        printExport(a, c.checkForExport(a.commandValue));
    } catch (const ZvmException &e) {
        dumpError(e);
        return e.error_code;
    }
    return ZVM_ERR_OK;
}

static int _access(const ZVM::Arguments &a, ZVM::Client &c, bool grant)
{
    try {
        if( grant ) {
            printExport(a, c.authorizeInitiator(a.volume.value,
                                                a.commandValue));
        } else {
            printExport(a, c.revokeInitiator(a.volume.value,
                                             a.commandValue));
        }
    } catch (const ZvmException &e) {
        dumpError(e);
        return e.error_code;
    }
    return ZVM_ERR_OK;
}

int accessGrant(const ZVM::Arguments &a, ZVM::Client &c)
{
    return _access(a, c, true);
}

int accessRevoke(const ZVM::Arguments &a, ZVM::Client &c)
{
    return _access(a, c, false);
}

int createSnapshot(const ZVM::Arguments &a, ZVM::Client &c)
{
    try {
        printSnapshot(a, c.createSnapshot(a.commandValue, a.name.value));
    } catch (const ZvmException &e) {
        dumpError(e);
        return e.error_code;
    }
    return ZVM_ERR_OK;
}

int deleteSnapshot(const ZVM::Arguments &a, ZVM::Client &c)
{
    try {
        c.deleteSnapshot(a.commandValue);
    } catch (const ZvmException &e) {
        dumpError(e);
        return e.error_code;
    }
    return ZVM_ERR_OK;
}

int cloneSnapshot(const ZVM::Arguments &a, ZVM::Client &c)
{
    try {
        printVolume(a, c.createVolumeFromSnapshot(a.commandValue,
                                                  a.name.value));
    } catch (const ZvmException &e) {
        dumpError(e);
        return e.error_code;
    }
    return ZVM_ERR_OK;
}

int localPath(const ZVM::Arguments &a, ZVM::Client &c)
{
    try {
        printf("%s\n", c.localPath(a.commandValue).c_str());
    } catch (const ZvmException &e) {
        dumpError(e);
        return e.error_code;
    }
    return ZVM_ERR_OK;
}

static void printIds(const char *label, const std::vector<std::string> &ids)
{
    for( size_t i = 0; i < ids.size(); ++i ) {
        printf("%-12s%s\n", label, ids[i].c_str());
    }
}

int reconcile(const ZVM::Arguments &a, ZVM::Client &c)
{
    try {
        ZVM::ReconcileReport r = c.reconcile();

        if( a.terse.present ) {
            const char *sep = a.terse.value.c_str();
            printf("%zu%s%zu%s%zu%s%zu\n", r.checked.size(), sep,
                    r.marked_error.size(), sep, r.orphans.size(), sep,
                    r.skipped.size());
        } else {
            printf("Checked %zu, marked error %zu, orphans %zu, "
                    "skipped %zu\n", r.checked.size(), r.marked_error.size(),
                    r.orphans.size(), r.skipped.size());
            printIds("error", r.marked_error);
            printIds("orphan", r.orphans);
            printIds("skipped", r.skipped);
        }
    } catch (const ZvmException &e) {
        dumpError(e);
        return e.error_code;
    }
    return ZVM_ERR_OK;
}
