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

#include "fakes.hpp"
#include "zvm_db.hpp"
#include "zvm_provision.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace ZVM;

#define INITIATOR "iqn.1993-08.org.debian:01:compute1"

static bool contains(const std::vector<std::string> &l, const char *id) {
    return std::find(l.begin(), l.end(), id) != l.end();
}

class Reconcile : public ::testing::Test {
  protected:
    Reconcile()
        : reg(_DB_MEMORY, 1000), backend("pool"), admin(false),
          exports(reg, admin, ZVM_TARGET_PREFIX_DEFAULT, "10.0.0.5:3260"),
          api(reg, backend, exports) {}

    /* Record a volume without going through the api */
    void record(const std::string &id, zvm_volume_state s, bool on_backend) {
        Volume v;
        v.id = id;
        v.size_bytes = 8192;
        v.backing_path = "pool/" + id;
        v.state = s;
        reg.volumePut(v);
        if (on_backend) {
            backend.volumes[v.backing_path] = v.size_bytes;
        }
    }

    zvm_volume_state state(const std::string &id) {
        Volume v;
        return reg.get(id, v) ? v.state : ZVM_VOLUME_STATE_UNKNOWN;
    }

    VolumeRegistry reg;
    MemoryBackend backend;
    MemoryTargetAdmin admin;
    ExportManager exports;
    ProvisioningApi api;
};

TEST_F(Reconcile, Consistent) {
    api.createVolume("v1", 8192);
    api.createVolume("v2", 8192);
    api.createExport("v2", INITIATOR);
    api.createSnapshot("v1", "s1");

    ReconcileReport r = api.reconcile();
    EXPECT_EQ(2u, r.checked.size());
    EXPECT_TRUE(r.marked_error.empty());
    EXPECT_TRUE(r.orphans.empty());
    EXPECT_TRUE(r.skipped.empty());
    EXPECT_EQ(ZVM_VOLUME_STATE_AVAILABLE, state("v1"));
    EXPECT_EQ(ZVM_VOLUME_STATE_IN_USE, state("v2"));
}

TEST_F(Reconcile, MissingBackingDataset) {
    api.createVolume("v1", 8192);
    backend.volumes.clear();

    ReconcileReport r = api.reconcile();
    ASSERT_EQ(1u, r.marked_error.size());
    EXPECT_EQ("v1", r.marked_error[0]);
    EXPECT_EQ(ZVM_VOLUME_STATE_ERROR, state("v1"));

    // Second pass finds it in error already
    r = api.reconcile();
    EXPECT_TRUE(contains(r.checked, "v1"));
    EXPECT_TRUE(r.marked_error.empty());
    EXPECT_EQ(ZVM_VOLUME_STATE_ERROR, state("v1"));
}

TEST_F(Reconcile, InterruptedCreate) {
    record("done", ZVM_VOLUME_STATE_CREATING, true);
    record("lost", ZVM_VOLUME_STATE_CREATING, false);

    ReconcileReport r = api.reconcile();
    EXPECT_EQ(ZVM_VOLUME_STATE_AVAILABLE, state("done"));
    EXPECT_EQ(ZVM_VOLUME_STATE_ERROR, state("lost"));
    EXPECT_FALSE(contains(r.marked_error, "done"));
    EXPECT_TRUE(contains(r.marked_error, "lost"));
}

TEST_F(Reconcile, InterruptedDelete) {
    record("v1", ZVM_VOLUME_STATE_DELETING, true);

    ReconcileReport r = api.reconcile();
    EXPECT_TRUE(contains(r.marked_error, "v1"));
    EXPECT_EQ(ZVM_VOLUME_STATE_ERROR, state("v1"));
    EXPECT_EQ(1u, backend.volumes.count("pool/v1"));
}

TEST_F(Reconcile, MissingTarget) {
    api.createVolume("v1", 8192);
    api.createExport("v1", INITIATOR);
    admin.targets.clear();

    ReconcileReport r = api.reconcile();
    EXPECT_TRUE(contains(r.marked_error, "v1"));
    EXPECT_EQ(ZVM_VOLUME_STATE_ERROR, state("v1"));

    // The export record stays for the operator to inspect
    EXPECT_EQ(1u, api.exportList().size());
}

TEST_F(Reconcile, ExportStateMismatch) {
    record("busy", ZVM_VOLUME_STATE_IN_USE, true);
    record("idle", ZVM_VOLUME_STATE_AVAILABLE, true);

    Export e;
    e.volume_id = "idle";
    e.target_iqn = exports.targetIqn("idle");
    reg.exportPut(e);
    admin.targets[e.target_iqn] = MemoryTargetAdmin::Target();

    ReconcileReport r = api.reconcile();
    EXPECT_TRUE(contains(r.marked_error, "busy"));
    EXPECT_TRUE(contains(r.marked_error, "idle"));
}

TEST_F(Reconcile, MissingSnapshot) {
    api.createVolume("v1", 8192);
    api.createSnapshot("v1", "s1");
    backend.snapshots.clear();

    ReconcileReport r = api.reconcile();
    EXPECT_TRUE(contains(r.marked_error, "v1"));

    Snapshot s;
    EXPECT_TRUE(reg.snapshotGet("s1", s));
}

TEST_F(Reconcile, Orphans) {
    api.createVolume("v1", 8192);
    backend.volumes["pool/stray"] = 8192;

    ReconcileReport r = api.reconcile();
    ASSERT_EQ(1u, r.orphans.size());
    EXPECT_EQ("pool/stray", r.orphans[0]);
    EXPECT_TRUE(r.marked_error.empty());

    // Reported only, never destroyed
    EXPECT_EQ(1u, backend.volumes.count("pool/stray"));
}

TEST_F(Reconcile, LeasedVolumeSkipped) {
    record("v1", ZVM_VOLUME_STATE_CREATING, false);
    Lease held = reg.reserve("v1");

    ReconcileReport r = api.reconcile();
    ASSERT_EQ(1u, r.skipped.size());
    EXPECT_EQ("v1", r.skipped[0]);
    EXPECT_FALSE(contains(r.checked, "v1"));
    EXPECT_EQ(ZVM_VOLUME_STATE_CREATING, state("v1"));

    // A dataset of a leased volume is not an orphan
    backend.volumes["pool/v1"] = 8192;
    r = api.reconcile();
    EXPECT_TRUE(r.orphans.empty());
    EXPECT_TRUE(held.held());
}
