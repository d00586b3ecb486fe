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
#include "zvm_utils.hpp"

#include <gtest/gtest.h>
#include <thread>

using namespace ZVM;

#define INITIATOR "iqn.1993-08.org.debian:01:compute1"

class Provision : public ::testing::Test {
  protected:
    Provision()
        : reg(_DB_MEMORY, 1000), backend("pool"), admin(false),
          exports(reg, admin, ZVM_TARGET_PREFIX_DEFAULT, "10.0.0.5:3260"),
          api(reg, backend, exports) {}

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

TEST_F(Provision, CreateAndExport) {
    Volume v = api.createVolume("v1", 10 * GiB);

    EXPECT_EQ("v1", v.id);
    EXPECT_EQ(10 * GiB, v.size_bytes);
    EXPECT_EQ("pool/v1", v.backing_path);
    EXPECT_EQ(ZVM_VOLUME_STATE_AVAILABLE, v.state);
    EXPECT_EQ(_volume_serial("v1"), v.serial);
    EXPECT_EQ(ZVM_VOLUME_STATE_AVAILABLE, state("v1"));
    EXPECT_EQ(10 * GiB, backend.sizeOf("pool/v1"));

    Export e = api.createExport("v1", INITIATOR);
    EXPECT_EQ("iqn.2010-10.org.openstack:v1", e.target_iqn);
    EXPECT_EQ(0u, e.lun);
    EXPECT_EQ("10.0.0.5:3260", e.portal);
    EXPECT_EQ(1u, e.initiators.count(INITIATOR));
    EXPECT_EQ(ZVM_VOLUME_STATE_IN_USE, state("v1"));

    ASSERT_TRUE(admin.has(e.target_iqn));
    EXPECT_EQ("/dev/zvol/pool/v1", admin.targets[e.target_iqn].device);
    EXPECT_EQ(v.serial, admin.targets[e.target_iqn].serial);
}

TEST_F(Provision, RoundTripLeavesNothing) {
    api.createVolume("v1", 10 * GiB);
    api.createExport("v1", INITIATOR);
    api.removeExport("v1");
    EXPECT_EQ(ZVM_VOLUME_STATE_AVAILABLE, state("v1"));
    api.deleteVolume("v1");

    EXPECT_TRUE(api.volumeList().empty());
    EXPECT_TRUE(api.exportList().empty());
    EXPECT_TRUE(backend.volumes.empty());
    EXPECT_TRUE(admin.targets.empty());
    EXPECT_EQ(0u, backend.used);
}

TEST_F(Provision, DeleteIsIdempotent) {
    api.deleteVolume("v1");
    api.createVolume("v1", 8192);
    api.deleteVolume("v1");
    api.deleteVolume("v1");
    EXPECT_TRUE(backend.volumes.empty());

    api.removeExport("v1");
}

TEST_F(Provision, DeleteExportedVolume) {
    api.createVolume("v1", 8192);
    api.createExport("v1", INITIATOR);

    try {
        api.deleteVolume("v1");
        FAIL() << "exported volume deleted";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_VOLUME_BUSY, e.error_code);
        EXPECT_EQ("delete_volume", e.op);
        EXPECT_EQ("v1", e.volume_id);
        EXPECT_EQ(0u, std::string(e.what()).find("delete_volume(v1): "));
    }
    EXPECT_EQ(1u, backend.volumes.count("pool/v1"));
    EXPECT_EQ(ZVM_VOLUME_STATE_IN_USE, state("v1"));

    api.removeExport("v1");
    api.deleteVolume("v1");
    EXPECT_TRUE(backend.volumes.empty());
}

TEST_F(Provision, ConcurrentExport) {
    const int n = 8;
    std::vector<std::thread> workers;
    std::vector<int> rc(n, -1);

    api.createVolume("v1", 8192);
    admin.create_delay_ms = 100;

    for (int i = 0; i < n; ++i) {
        workers.push_back(std::thread([this, &rc, i]() {
            try {
                api.createExport("v1", INITIATOR);
                rc[i] = ZVM_ERR_OK;
            } catch (const ZvmException &e) {
                rc[i] = e.error_code;
            }
        }));
    }
    for (size_t i = 0; i < workers.size(); ++i) {
        workers[i].join();
    }

    int ok = 0;
    for (int i = 0; i < n; ++i) {
        if (rc[i] == ZVM_ERR_OK) {
            ++ok;
        } else {
            EXPECT_EQ(ZVM_ERR_ALREADY_EXPORTED, rc[i]);
        }
    }
    EXPECT_EQ(1, ok);
    EXPECT_EQ(1u, admin.creates);
    EXPECT_EQ(1u, api.exportList().size());
    EXPECT_EQ(ZVM_VOLUME_STATE_IN_USE, state("v1"));
}

TEST_F(Provision, ExportTwice) {
    api.createVolume("v1", 8192);
    api.createExport("v1", INITIATOR);

    try {
        api.createExport("v1", "iqn.other");
        FAIL() << "exported twice";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_ALREADY_EXPORTED, e.error_code);
    }
}

TEST_F(Provision, CreateValidation) {
    EXPECT_EQ(8192u, api.createVolume("v1", 1).size_bytes);
    EXPECT_EQ(16384u, api.createVolume("v2", 8193).size_bytes);

    try {
        api.createVolume("v1", 8192);
        FAIL() << "duplicate id";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_NAME_CONFLICT, e.error_code);
    }

    try {
        api.createVolume("a/b", 8192);
        FAIL() << "invalid id";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_INVALID_ARGUMENT, e.error_code);
    }

    try {
        api.createVolume("v3", 0);
        FAIL() << "empty volume";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_INVALID_ARGUMENT, e.error_code);
    }

    try {
        api.createExport("v1", "not an iqn");
        FAIL() << "invalid initiator";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_INVALID_ARGUMENT, e.error_code);
    }

    try {
        api.createExport("v9", INITIATOR);
        FAIL() << "unknown volume exported";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_NOT_FOUND_VOLUME, e.error_code);
    }
    EXPECT_EQ(2u, backend.volumes.size());
}

TEST_F(Provision, NotEnoughSpace) {
    backend.capacity = GiB;

    try {
        api.createVolume("v1", 2 * GiB);
        FAIL() << "created beyond capacity";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_NOT_ENOUGH_SPACE, e.error_code);
        EXPECT_EQ("create_volume", e.op);
    }

    Volume v;
    EXPECT_FALSE(reg.get("v1", v));
    EXPECT_FALSE(reg.isReserved("v1"));

    api.createVolume("v1", GiB / 2);
    try {
        api.extendVolume("v1", 2 * GiB);
        FAIL() << "grown beyond capacity";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_NOT_ENOUGH_SPACE, e.error_code);
    }
    EXPECT_EQ(GiB / 2, api.volumeGet("v1").size_bytes);
}

TEST_F(Provision, Extend) {
    api.createVolume("v1", GiB);

    Volume v = api.extendVolume("v1", 2 * GiB + 1);
    EXPECT_EQ(2 * GiB + 8192, v.size_bytes);
    EXPECT_EQ(2 * GiB + 8192, api.volumeGet("v1").size_bytes);
    EXPECT_EQ(2 * GiB + 8192, backend.sizeOf("pool/v1"));

    // Same size is accepted
    api.extendVolume("v1", 2 * GiB + 8192);

    try {
        api.extendVolume("v1", GiB);
        FAIL() << "volume shrunk";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_NO_SUPPORT_SHRINK, e.error_code);
    }

    try {
        api.extendVolume("v9", GiB);
        FAIL() << "unknown volume extended";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_NOT_FOUND_VOLUME, e.error_code);
    }
}

TEST_F(Provision, Snapshots) {
    api.createVolume("v1", GiB);

    Snapshot s = api.createSnapshot("v1", "s1");
    EXPECT_EQ("s1", s.id);
    EXPECT_EQ("v1", s.volume_id);
    EXPECT_EQ("pool/v1@s1", s.backing_path);
    EXPECT_EQ(1u, backend.snapshots.count("pool/v1@s1"));

    api.createVolume("v2", GiB);
    try {
        api.createSnapshot("v2", "s1");
        FAIL() << "snapshot id reused";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_SNAPSHOT_NAME_CONFLICT, e.error_code);
    }
    EXPECT_EQ(0u, backend.snapshots.count("pool/v2@s1"));

    try {
        api.createSnapshot("v9", "s2");
        FAIL() << "snapshot of unknown volume";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_NOT_FOUND_VOLUME, e.error_code);
    }

    try {
        api.deleteVolume("v1");
        FAIL() << "volume with snapshots deleted";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_HAS_CHILD_DEPENDENCY, e.error_code);
    }
    EXPECT_EQ(ZVM_VOLUME_STATE_AVAILABLE, state("v1"));

    api.deleteSnapshot("s1");
    api.deleteSnapshot("s1");
    EXPECT_TRUE(backend.snapshots.empty());
    EXPECT_TRUE(api.snapshotList().empty());
    api.deleteVolume("v1");
}

TEST_F(Provision, Clone) {
    api.createVolume("v1", GiB);
    api.createSnapshot("v1", "s1");

    Volume c = api.createVolumeFromSnapshot("s1", "c1");
    EXPECT_EQ("pool/c1", c.backing_path);
    EXPECT_EQ(GiB, c.size_bytes);
    EXPECT_EQ("s1", c.origin_snapshot);
    EXPECT_EQ(ZVM_VOLUME_STATE_AVAILABLE, state("c1"));

    try {
        api.deleteSnapshot("s1");
        FAIL() << "snapshot with clones deleted";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_HAS_CHILD_DEPENDENCY, e.error_code);
    }

    try {
        api.createVolumeFromSnapshot("s9", "c2");
        FAIL() << "clone of unknown snapshot";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_NOT_FOUND_SNAPSHOT, e.error_code);
    }

    try {
        api.createVolumeFromSnapshot("s1", "v1");
        FAIL() << "clone over an existing volume";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_NAME_CONFLICT, e.error_code);
    }

    api.deleteVolume("c1");
    api.deleteSnapshot("s1");
    api.deleteVolume("v1");
    EXPECT_TRUE(backend.volumes.empty());
}

TEST_F(Provision, CloneAfterParentGrew) {
    api.createVolume("v1", GiB);
    Snapshot s = api.createSnapshot("v1", "s1");
    EXPECT_EQ(GiB, s.size_bytes);
    api.extendVolume("v1", 2 * GiB);

    // The clone has the size the parent had when the snapshot was taken
    Volume c = api.createVolumeFromSnapshot("s1", "c1");
    EXPECT_EQ(GiB, c.size_bytes);
    EXPECT_EQ(GiB, backend.sizeOf("pool/c1"));

    c = api.extendVolume("c1", GiB + GiB / 2);
    EXPECT_EQ(GiB + GiB / 2, c.size_bytes);
    EXPECT_EQ(GiB + GiB / 2, backend.sizeOf("pool/c1"));
}

TEST_F(Provision, ExportRollbackFailure) {
    api.createVolume("v1", 8192);
    admin.fail_bind = true;
    admin.fail_remove = true;

    try {
        api.createExport("v1", INITIATOR);
        FAIL() << "expected a failure";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_RECONCILIATION_MISMATCH, e.error_code);
        EXPECT_EQ("create_export", e.op);
    }
    EXPECT_EQ(ZVM_VOLUME_STATE_ERROR, state("v1"));
    EXPECT_TRUE(api.exportList().empty());

    try {
        api.createSnapshot("v1", "s1");
        FAIL() << "snapshot of a volume in error";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_VOLUME_NOT_READY, e.error_code);
    }
}

TEST_F(Provision, ExportRolledBack) {
    api.createVolume("v1", 8192);
    admin.fail_bind = true;

    try {
        api.createExport("v1", INITIATOR);
        FAIL() << "expected a failure";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_EXEC_FAILURE, e.error_code);
    }
    EXPECT_EQ(ZVM_VOLUME_STATE_AVAILABLE, state("v1"));
    EXPECT_TRUE(admin.targets.empty());

    admin.fail_bind = false;
    api.createExport("v1", INITIATOR);
    EXPECT_EQ(ZVM_VOLUME_STATE_IN_USE, state("v1"));
}

TEST_F(Provision, DeleteFailure) {
    api.createVolume("v1", 8192);
    backend.fail_delete = true;

    try {
        api.deleteVolume("v1");
        FAIL() << "expected a failure";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_EXEC_FAILURE, e.error_code);
        EXPECT_EQ("dataset is busy", e.debug);
    }
    EXPECT_EQ(ZVM_VOLUME_STATE_ERROR, state("v1"));

    // A volume in error may still be deleted
    backend.fail_delete = false;
    api.deleteVolume("v1");
    EXPECT_EQ(ZVM_VOLUME_STATE_UNKNOWN, state("v1"));
}

TEST_F(Provision, LeaseHeld) {
    api.createVolume("v1", 8192);
    Lease held = reg.reserve("v1");

    try {
        api.deleteVolume("v1");
        FAIL() << "deleted while locked";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_ALREADY_LOCKED, e.error_code);
    }

    try {
        api.extendVolume("v1", GiB);
        FAIL() << "extended while locked";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_ALREADY_LOCKED, e.error_code);
    }

    held.release();
    api.deleteVolume("v1");
}

TEST_F(Provision, Initiators) {
    api.createVolume("v1", 8192);
    api.createExport("v1", INITIATOR);

    Export e = api.authorizeInitiator("v1", "iqn.compute2");
    EXPECT_EQ(2u, e.initiators.size());
    e = api.revokeInitiator("v1", INITIATOR);
    EXPECT_EQ(1u, e.initiators.size());

    api.createVolume("v2", 8192);
    try {
        api.authorizeInitiator("v2", "iqn.compute2");
        FAIL() << "granted without an export";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_NOT_FOUND_EXPORT, e.error_code);
    }
}

TEST_F(Provision, CheckForExport) {
    api.createVolume("v1", 8192);

    try {
        api.checkForExport("v1");
        FAIL() << "no export expected";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_NOT_FOUND_EXPORT, e.error_code);
    }

    api.createExport("v1", INITIATOR);
    EXPECT_EQ("iqn.2010-10.org.openstack:v1",
              api.checkForExport("v1").target_iqn);

    // Dataset destroyed outside of our control
    backend.volumes.erase("pool/v1");
    try {
        api.checkForExport("v1");
        FAIL() << "missing dataset not noticed";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_RECONCILIATION_MISMATCH, e.error_code);
        EXPECT_NE(std::string::npos, std::string(e.what()).find("pool/v1"));
    }

    admin.targets.clear();
    try {
        api.checkForExport("v1");
        FAIL() << "missing target not noticed";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_RECONCILIATION_MISMATCH, e.error_code);
        EXPECT_EQ("check_for_export", e.op);
    }
}

TEST_F(Provision, LocalPath) {
    api.createVolume("v1", 8192);
    EXPECT_EQ("/dev/zvol/pool/v1", api.localPath("v1"));

    try {
        api.localPath("v9");
        FAIL() << "path of unknown volume";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_NOT_FOUND_VOLUME, e.error_code);
    }
}

TEST(ProvisionTgt, DataLunOne) {
    VolumeRegistry reg(_DB_MEMORY, 1000);
    MemoryBackend backend("tank/volumes");
    MemoryTargetAdmin admin(true);
    ExportManager exports(reg, admin, ZVM_TARGET_PREFIX_DEFAULT,
                          "10.0.0.5:3260");
    ProvisioningApi api(reg, backend, exports);

    EXPECT_EQ("tank/volumes/v1", api.createVolume("v1", GiB).backing_path);

    Export e = api.createExport("v1", INITIATOR);
    EXPECT_EQ(1u, e.lun);
    EXPECT_EQ(1u, e.tid);
    EXPECT_EQ("/dev/zvol/tank/volumes/v1",
              admin.targets[e.target_iqn].device);
}
