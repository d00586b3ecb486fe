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

#include "zvm_config.hpp"
#include "zvm_ipc.hpp"

#include <gtest/gtest.h>

using namespace ZVM;

static int parse_error(const std::string &uri) {
    try {
        config_parse(uri);
    } catch (const ZvmException &e) {
        return e.error_code;
    }
    return ZVM_ERR_OK;
}

TEST(Config, Defaults) {
    Config c = config_parse("zfs+iscsi:///tank/volumes");

    EXPECT_EQ("tank/volumes", c.base);
    EXPECT_TRUE(c.isLocal());
    EXPECT_EQ("zfs", c.zfs_cmd);
    EXPECT_EQ(ZVM_TARGET_HELPER_LIOADM, c.target_helper);
    EXPECT_EQ("iqn.2010-10.org.openstack:", c.target_prefix);
    EXPECT_EQ("0.0.0.0:3260", c.portal);
    EXPECT_EQ(ZVM_DB_DEFAULT, c.db);
    EXPECT_EQ((uint32_t)ZVM_TIMEOUT_DEFAULT, c.timeout);
    EXPECT_EQ(8192u, c.block_size);
    EXPECT_EQ(0u, c.reconcile_interval);
    EXPECT_TRUE(c.commandPrefix().empty());
}

TEST(Config, AllOptions) {
    Config c = config_parse(
        "zfs+iscsi:///tank/volumes/?zfs=/usr/sbin/zfs&target_helper=tgtadm"
        "&target_prefix=iqn.2003-01.org.example:&iscsi_ip_address=10.0.0.5"
        "&db=/tmp/zvm.db&timeout=5000&block_size=16384"
        "&reconcile_interval=300");

    EXPECT_EQ("tank/volumes", c.base);
    EXPECT_EQ("/usr/sbin/zfs", c.zfs_cmd);
    EXPECT_EQ(ZVM_TARGET_HELPER_TGTADM, c.target_helper);
    EXPECT_EQ("iqn.2003-01.org.example:", c.target_prefix);
    EXPECT_EQ("10.0.0.5:3260", c.portal);
    EXPECT_EQ("/tmp/zvm.db", c.db);
    EXPECT_EQ(5000u, c.timeout);
    EXPECT_EQ(16384u, c.block_size);
    EXPECT_EQ(300u, c.reconcile_interval);
}

TEST(Config, Portal) {
    Config c = config_parse(
        "zfs+iscsi:///tank?iscsi_ip_address=10.0.0.5&portal=10.0.0.6%3A3261");
    EXPECT_EQ("10.0.0.6:3261", c.portal);
}

TEST(Config, Remote) {
    Config c = config_parse("zfs+iscsi://admin@storage1:2222/tank/volumes"
                            "?root_helper=sudo%20-n");

    EXPECT_FALSE(c.isLocal());
    EXPECT_EQ("storage1", c.host);
    EXPECT_EQ("admin", c.user);
    EXPECT_EQ(2222, c.ssh_port);

    std::vector<std::string> p = c.commandPrefix();
    ASSERT_EQ(9u, p.size());
    EXPECT_EQ("ssh", p[0]);
    EXPECT_EQ("-o", p[1]);
    EXPECT_EQ("BatchMode=yes", p[2]);
    EXPECT_EQ("-p", p[3]);
    EXPECT_EQ("2222", p[4]);
    EXPECT_EQ("admin@storage1", p[5]);
    EXPECT_EQ("--", p[6]);
    EXPECT_EQ("sudo", p[7]);
    EXPECT_EQ("-n", p[8]);

    c = config_parse("zfs+iscsi://storage1/tank");
    p = c.commandPrefix();
    ASSERT_EQ(5u, p.size());
    EXPECT_EQ("storage1", p[3]);

    EXPECT_TRUE(config_parse("zfs+iscsi://localhost/tank").isLocal());
}

TEST(Config, LocalRootHelper) {
    Config c = config_parse("zfs+iscsi:///tank?root_helper=sudo+-n");
    std::vector<std::string> p = c.commandPrefix();

    // '+' is not a space in a URI query
    ASSERT_EQ(1u, p.size());
    EXPECT_EQ("sudo+-n", p[0]);

    c = config_parse("zfs+iscsi:///tank?root_helper=sudo%20-n");
    p = c.commandPrefix();
    ASSERT_EQ(2u, p.size());
    EXPECT_EQ("sudo", p[0]);
    EXPECT_EQ("-n", p[1]);
}

TEST(Config, Rejected) {
    EXPECT_EQ(ZVM_ERR_INVALID_ARGUMENT, parse_error("nfs:///tank"));
    EXPECT_EQ(ZVM_ERR_INVALID_ARGUMENT, parse_error("zfs+iscsi://host1"));
    EXPECT_EQ(ZVM_ERR_INVALID_ARGUMENT, parse_error("zfs+iscsi:///"));
    EXPECT_EQ(ZVM_ERR_INVALID_ARGUMENT,
              parse_error("zfs+iscsi:///tank?colour=blue"));
    EXPECT_EQ(ZVM_ERR_INVALID_ARGUMENT,
              parse_error("zfs+iscsi:///tank?target_helper=iet"));
    EXPECT_EQ(ZVM_ERR_INVALID_ARGUMENT,
              parse_error("zfs+iscsi:///tank?block_size=1000"));
    EXPECT_EQ(ZVM_ERR_INVALID_ARGUMENT,
              parse_error("zfs+iscsi:///tank?block_size=262144"));
    EXPECT_EQ(ZVM_ERR_INVALID_ARGUMENT,
              parse_error("zfs+iscsi:///tank?timeout=0"));
    EXPECT_EQ(ZVM_ERR_INVALID_ARGUMENT,
              parse_error("zfs+iscsi:///tank?timeout=-5"));
    EXPECT_EQ(ZVM_ERR_INVALID_ARGUMENT,
              parse_error("zfs+iscsi:///tank?timeout=10s"));
    EXPECT_EQ(ZVM_ERR_INVALID_ARGUMENT,
              parse_error("zfs+iscsi:///tank?portal=10.0.0.5%3Aiscsi"));
    EXPECT_EQ(ZVM_ERR_INVALID_ARGUMENT,
              parse_error("zfs+iscsi:///tank?target_prefix=target"));
    EXPECT_EQ(ZVM_ERR_INVALID_ARGUMENT, parse_error("zfs+iscsi:///tank?db="));
}
