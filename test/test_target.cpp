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
#include "zvm_target.hpp"

#include <gtest/gtest.h>

using namespace ZVM;

#define IQN "iqn.2010-10.org.openstack:v1"

TEST(Portal, Split) {
    std::string ip;
    std::string port;

    EXPECT_TRUE(portal_split("10.0.0.5:3261", ip, port));
    EXPECT_EQ("10.0.0.5", ip);
    EXPECT_EQ("3261", port);

    EXPECT_TRUE(portal_split("10.0.0.5", ip, port));
    EXPECT_EQ("10.0.0.5", ip);
    EXPECT_EQ("3260", port);

    EXPECT_TRUE(portal_split("[fd00::5]:3260", ip, port));
    EXPECT_EQ("fd00::5", ip);
    EXPECT_EQ("3260", port);

    EXPECT_TRUE(portal_split("[fd00::5]", ip, port));
    EXPECT_EQ("fd00::5", ip);
    EXPECT_EQ("3260", port);

    EXPECT_FALSE(portal_split("10.0.0.5:", ip, port));
    EXPECT_FALSE(portal_split("10.0.0.5:iscsi", ip, port));
    EXPECT_FALSE(portal_split("10.0.0.5:70000", ip, port));
    EXPECT_FALSE(portal_split(":3260", ip, port));
}

TEST(TgtAdm, CreateTarget) {
    FakeExecutor exec;
    TgtAdm tgt(exec, 1000);

    EXPECT_TRUE(tgt.usesTid());
    EXPECT_EQ(1u, tgt.createTarget("v1", IQN, 4, "/dev/zvol/pool/v1",
                                   "0123456789abcdef", "10.0.0.5:3260"));

    ASSERT_EQ(3u, exec.calls.size());
    EXPECT_EQ("tgtadm --lld iscsi --op new --mode target --tid 4 -T " IQN,
              exec.calls[0]);
    EXPECT_EQ("tgtadm --lld iscsi --op new --mode logicalunit --tid 4 "
              "--lun 1 -b /dev/zvol/pool/v1",
              exec.calls[1]);
    EXPECT_EQ("tgtadm --lld iscsi --op update --mode logicalunit --tid 4 "
              "--lun 1 --params scsi_sn=0123456789abcdef",
              exec.calls[2]);
}

TEST(TgtAdm, CreateTargetFailure) {
    FakeExecutor exec;
    TgtAdm tgt(exec, 1000);

    exec.fail("logicalunit", "tgtadm: invalid request");
    try {
        tgt.createTarget("v1", IQN, 4, "/dev/zvol/pool/v1", "0123",
                         "10.0.0.5:3260");
        FAIL() << "expected a failure";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_EXEC_FAILURE, e.error_code);
    }

    // The target made by the first step is removed again
    ASSERT_EQ(3u, exec.calls.size());
    EXPECT_EQ("tgtadm --lld iscsi --op delete --force --mode target --tid 4",
              exec.calls[2]);
}

TEST(TgtAdm, CreateTargetTidTaken) {
    FakeExecutor exec;
    TgtAdm tgt(exec, 1000);

    exec.fail("--op new --mode target", "tgtadm: this target already exists",
              22);
    try {
        tgt.createTarget("v1", IQN, 1, "/dev/zvol/pool/v1", "0123",
                         "10.0.0.5:3260");
        FAIL() << "expected a failure";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_EXEC_FAILURE, e.error_code);
    }

    // Somebody else's target 1 is left alone
    ASSERT_EQ(1u, exec.calls.size());
    EXPECT_EQ("tgtadm --lld iscsi --op new --mode target --tid 1 -T " IQN,
              exec.calls[0]);
}

TEST(TgtAdm, CreateTargetUndoFailure) {
    FakeExecutor exec;
    TgtAdm tgt(exec, 1000);

    exec.fail("--op update", "tgtadm: invalid request");
    exec.fail("--op delete", "tgtadm: this target is still active", 22);
    try {
        tgt.createTarget("v1", IQN, 4, "/dev/zvol/pool/v1", "0123",
                         "10.0.0.5:3260");
        FAIL() << "expected a failure";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_RECONCILIATION_MISMATCH, e.error_code);
        EXPECT_EQ(22, e.exit_code);
        EXPECT_NE(std::string::npos, e.debug.find("invalid request"));
        EXPECT_NE(std::string::npos, e.debug.find("still active"));
    }
}

TEST(TgtAdm, RemoveAndAcl) {
    FakeExecutor exec;
    TgtAdm tgt(exec, 1000);

    tgt.removeTarget("v1", IQN, 4);
    EXPECT_EQ("tgtadm --lld iscsi --op delete --force --mode target --tid 4",
              exec.calls.back());

    tgt.bindInitiator(IQN, 4, "iqn.initiator1");
    EXPECT_EQ("tgtadm --lld iscsi --op bind --mode target --tid 4 "
              "--initiator-name iqn.initiator1",
              exec.calls.back());

    tgt.unbindInitiator(IQN, 4, "iqn.initiator1");
    EXPECT_EQ("tgtadm --lld iscsi --op unbind --mode target --tid 4 "
              "--initiator-name iqn.initiator1",
              exec.calls.back());
}

TEST(TgtAdm, RemoveAbsentTarget) {
    FakeExecutor exec;
    TgtAdm tgt(exec, 1000);

    exec.fail("--op delete", "tgtadm: can't find the target", 22);
    tgt.removeTarget("v1", IQN, 4);

    exec.fail("--op delete", "tgtadm: this target is still active", 22);
    try {
        tgt.removeTarget("v1", IQN, 4);
        FAIL() << "expected a failure";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_EXEC_FAILURE, e.error_code);
        EXPECT_EQ(22, e.exit_code);
    }
}

TEST(TgtAdm, ListTargets) {
    FakeExecutor exec;
    TgtAdm tgt(exec, 1000);

    exec.reply("--op show",
               "Target 1: iqn.2010-10.org.openstack:v1\n"
               "    System information:\n"
               "        Driver: iscsi\n"
               "        State: ready\n"
               "    LUN information:\n"
               "        LUN: 1\n"
               "            Type: disk\n"
               "Target 2: iqn.2010-10.org.openstack:v2\n"
               "    System information:\n");

    std::vector<std::string> t = tgt.listTargets();
    ASSERT_EQ(2u, t.size());
    EXPECT_EQ("iqn.2010-10.org.openstack:v1", t[0]);
    EXPECT_EQ("iqn.2010-10.org.openstack:v2", t[1]);
}

TEST(TgtAdm, ListTids) {
    FakeExecutor exec;
    TgtAdm tgt(exec, 1000);

    exec.reply("--op show",
               "Target 1: iqn.2003-01.org.example:backup\n"
               "    System information:\n"
               "Target 7: iqn.2010-10.org.openstack:v1\n"
               "    LUN information:\n");

    std::set<uint32_t> tids = tgt.listTids();
    ASSERT_EQ(2u, tids.size());
    EXPECT_EQ(1u, tids.count(1));
    EXPECT_EQ(1u, tids.count(7));
}

TEST(LioAdm, CreateTargetAnyAddress) {
    FakeExecutor exec;
    LioAdm lio(exec, 1000);

    EXPECT_FALSE(lio.usesTid());
    EXPECT_EQ(0u, lio.createTarget("v1", IQN, 0, "/dev/zvol/pool/v1",
                                   "0123456789abcdef", "0.0.0.0:3260"));

    ASSERT_EQ(3u, exec.calls.size());
    EXPECT_EQ("targetcli /backstores/block create name=v1 "
              "dev=/dev/zvol/pool/v1 wwn=0123456789abcdef",
              exec.calls[0]);
    EXPECT_EQ("targetcli /iscsi create " IQN, exec.calls[1]);
    EXPECT_EQ("targetcli /iscsi/" IQN "/tpg1/luns create /backstores/block/v1",
              exec.calls[2]);
}

TEST(LioAdm, CreateTargetOnPortal) {
    FakeExecutor exec;
    LioAdm lio(exec, 1000, "/usr/bin/targetcli");

    exec.fail("portals delete", "No such NetworkPortal in configfs");
    lio.createTarget("v1", IQN, 0, "/dev/zvol/pool/v1", "0123",
                     "10.0.0.5:3260");

    ASSERT_EQ(5u, exec.calls.size());
    EXPECT_EQ("/usr/bin/targetcli /iscsi/" IQN
              "/tpg1/portals delete 0.0.0.0 3260",
              exec.calls[3]);
    EXPECT_EQ("/usr/bin/targetcli /iscsi/" IQN
              "/tpg1/portals create 10.0.0.5 3260",
              exec.calls[4]);
}

TEST(LioAdm, CreateBackstoreExists) {
    FakeExecutor exec;
    LioAdm lio(exec, 1000);

    exec.fail("/backstores/block create",
              "This _Backstore already exists in configFS");
    EXPECT_THROW(lio.createTarget("v1", IQN, 0, "/dev/zvol/pool/v1", "0123",
                                  "0.0.0.0:3260"),
                 ZvmException);

    // The existing backstore is not deleted
    ASSERT_EQ(1u, exec.calls.size());
}

TEST(LioAdm, CreateTargetExists) {
    FakeExecutor exec;
    LioAdm lio(exec, 1000);

    exec.fail("/iscsi create", "This Target already exists in configFS");
    EXPECT_THROW(lio.createTarget("v1", IQN, 0, "/dev/zvol/pool/v1", "0123",
                                  "0.0.0.0:3260"),
                 ZvmException);

    ASSERT_EQ(3u, exec.calls.size());
    EXPECT_EQ("targetcli /backstores/block delete v1", exec.calls[2]);
}

TEST(LioAdm, CreateLunFailure) {
    FakeExecutor exec;
    LioAdm lio(exec, 1000);

    exec.fail("luns create", "LUN creation failed");
    EXPECT_THROW(lio.createTarget("v1", IQN, 0, "/dev/zvol/pool/v1", "0123",
                                  "0.0.0.0:3260"),
                 ZvmException);

    ASSERT_EQ(5u, exec.calls.size());
    EXPECT_EQ("targetcli /iscsi delete " IQN, exec.calls[3]);
    EXPECT_EQ("targetcli /backstores/block delete v1", exec.calls[4]);
    EXPECT_TRUE(lio.listTids().empty());
}

TEST(LioAdm, RemoveAndAcl) {
    FakeExecutor exec;
    LioAdm lio(exec, 1000);

    exec.fail("/iscsi delete", "No such Target in configfs");
    exec.fail("/backstores/block delete", "No storage object named v1");
    lio.removeTarget("v1", IQN, 0);

    ASSERT_EQ(2u, exec.calls.size());
    EXPECT_EQ("targetcli /iscsi delete " IQN, exec.calls[0]);
    EXPECT_EQ("targetcli /backstores/block delete v1", exec.calls[1]);

    lio.bindInitiator(IQN, 0, "iqn.initiator1");
    EXPECT_EQ("targetcli /iscsi/" IQN "/tpg1/acls create iqn.initiator1",
              exec.calls.back());

    lio.unbindInitiator(IQN, 0, "iqn.initiator1");
    EXPECT_EQ("targetcli /iscsi/" IQN "/tpg1/acls delete iqn.initiator1",
              exec.calls.back());

    exec.fail("/iscsi delete", "Device or resource busy");
    try {
        lio.removeTarget("v1", IQN, 0);
        FAIL() << "expected a failure";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_EXEC_FAILURE, e.error_code);
    }
}

TEST(LioAdm, ListTargets) {
    FakeExecutor exec;
    LioAdm lio(exec, 1000);

    exec.reply("/iscsi ls",
               "o- iscsi ............................ [Targets: 2]\n"
               "  o- iqn.2010-10.org.openstack:v1 ......... [TPGs: 1]\n"
               "  | o- tpg1 .................. [no-gen-acls, no-auth]\n"
               "  o- iqn.2010-10.org.openstack:v2 ......... [TPGs: 1]\n");

    std::vector<std::string> t = lio.listTargets();
    ASSERT_EQ(2u, t.size());
    EXPECT_EQ("iqn.2010-10.org.openstack:v1", t[0]);
    EXPECT_EQ("iqn.2010-10.org.openstack:v2", t[1]);
}
