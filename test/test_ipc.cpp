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

#include "zvm_convert.hpp"
#include "zvm_ipc.hpp"

#include <gtest/gtest.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace ZVM;

class SocketPair : public ::testing::Test {
  protected:
    void SetUp() { ASSERT_EQ(0, socketpair(AF_UNIX, SOCK_STREAM, 0, sv)); }

    int sv[2];
};

TEST_F(SocketPair, Framing) {
    Transport t(sv[0]);
    int ec = 0;
    char buf[64];

    ASSERT_EQ(0, t.msg_send("{\"a\":1}", ec));

    ssize_t got = recv(sv[1], buf, 17, MSG_WAITALL);
    ASSERT_EQ(17, got);
    EXPECT_EQ("0000000007{\"a\":1}", std::string(buf, got));

    const char *reply = "0000000002[]";
    ASSERT_EQ((ssize_t)strlen(reply), send(sv[1], reply, strlen(reply), 0));
    EXPECT_EQ("[]", t.msg_recv(ec));
    EXPECT_EQ(0, ec);

    close(sv[1]);
    EXPECT_THROW(t.msg_recv(ec), EOFException);
}

TEST_F(SocketPair, ShortPayload) {
    Transport t(sv[0]);
    int ec = 0;

    const char *partial = "0000000100{\"a\"";
    send(sv[1], partial, strlen(partial), 0);
    close(sv[1]);

    EXPECT_THROW(t.msg_recv(ec), EOFException);
}

TEST_F(SocketPair, BadHeader) {
    Transport t(sv[0]);
    int ec = 0;

    const char *junk = "GET / HTTP/1.1\r\n\r\n";
    send(sv[1], junk, strlen(junk), 0);

    EXPECT_THROW(t.msg_recv(ec), ValueException);
    EXPECT_EQ(-1, t.msg_send("", ec));
}

TEST_F(SocketPair, RequestAndResponse) {
    Ipc client(sv[0]);
    Ipc server(sv[1]);
    std::map<std::string, Value> p;

    p["id"] = Value("v1");
    p["size_bytes"] = Value((uint64_t)10737418240ull);
    client.requestSend("create_volume", Value(p), 7);

    Value req = server.readRequest();
    EXPECT_TRUE(req.isValidRequest());
    EXPECT_EQ("create_volume", req["method"].asString());
    EXPECT_EQ(7, req["id"].asInt32_t());
    EXPECT_EQ("v1", req["params"]["id"].asString());
    EXPECT_EQ(10737418240ull, req["params"]["size_bytes"].asUint64_t());

    server.responseSend(Value("ok"), 7);
    EXPECT_EQ("ok", client.responseRead().asString());
}

TEST_F(SocketPair, ErrorResponse) {
    Ipc client(sv[0]);
    Ipc server(sv[1]);

    client.requestSend("delete_volume", Value(std::map<std::string, Value>()));
    server.readRequest();
    server.errorSend(ZVM_ERR_VOLUME_BUSY, "delete_volume(v1): Volume v1 is "
                                          "exported",
                     "tgtadm: this target is still active");

    try {
        client.responseRead();
        FAIL() << "error response not raised";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_VOLUME_BUSY, e.error_code);
        EXPECT_STREQ("delete_volume(v1): Volume v1 is exported", e.what());
        EXPECT_EQ("tgtadm: this target is still active", e.debug);
    }
}

TEST_F(SocketPair, ResponseWithoutResult) {
    Ipc client(sv[0]);
    Transport raw(sv[1]);
    int ec = 0;

    raw.msg_send("{\"id\":100}", ec);
    try {
        client.responseRead();
        FAIL() << "empty response accepted";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_TRANSPORT_SERIALIZATION, e.error_code);
    }
}

TEST(Ipc, DaemonNotRunning) {
    try {
        Ipc i("/tmp/zvm-test-nobody-listens.sock");
        FAIL() << "connected to nothing";
    } catch (const ZvmException &e) {
        EXPECT_EQ(ZVM_ERR_DAEMON_NOT_RUNNING, e.error_code);
    }
}

TEST(Payload, Values) {
    Value v = Payload::deserialize(
        "{\"s\":\"x\",\"n\":18446744073709551615,\"neg\":-5,\"b\":true,"
        "\"a\":[1,\"two\"],\"z\":null}");

    EXPECT_EQ(Value::object_t, v.valueType());
    EXPECT_EQ("x", v["s"].asString());
    EXPECT_EQ(UINT64_MAX, v["n"].asUint64_t());
    EXPECT_EQ(-5, v["neg"].asInt32_t());
    EXPECT_EQ(Value::boolean_t, v["b"].valueType());
    EXPECT_EQ(2u, v["a"].asArray().size());
    EXPECT_EQ(Value::null_t, v["z"].valueType());
    EXPECT_FALSE(v.hasKey("missing"));

    EXPECT_THROW(v["s"].asUint64_t(), ValueException);
    EXPECT_THROW(v["neg"].asUint32_t(), ValueException);
    EXPECT_THROW(v["n"].asUint32_t(), ValueException);
    EXPECT_THROW(v["n"].asInt32_t(), ValueException);
    EXPECT_THROW(v["neg"].asUint64_t(), ValueException);

    v = Payload::deserialize(
        "{\"big\":9223372036854775808,\"u32\":4294967295}");
    EXPECT_EQ(9223372036854775808ull, v["big"].asUint64_t());
    EXPECT_EQ(UINT32_MAX, v["u32"].asUint32_t());
    EXPECT_THROW(v["u32"].asInt32_t(), ValueException);

    EXPECT_THROW(Payload::deserialize("{\"id\":"), ValueException);
    EXPECT_THROW(Payload::deserialize(""), ValueException);
}

TEST(Convert, Volume) {
    Volume v;
    v.id = "c1";
    v.size_bytes = 10737418240ull;
    v.backing_path = "pool/c1";
    v.state = ZVM_VOLUME_STATE_IN_USE;
    v.created_at = 1400000000;
    v.origin_snapshot = "s1";
    v.serial = "0123456789abcdef";

    Value val = Payload::deserialize(Payload::serialize(volume_to_value(v)));
    EXPECT_EQ("Volume", val["class"].asString());
    EXPECT_EQ("in-use", val["state"].asString());

    Volume out = value_to_volume(val);
    EXPECT_EQ(v.id, out.id);
    EXPECT_EQ(v.size_bytes, out.size_bytes);
    EXPECT_EQ(v.state, out.state);
    EXPECT_EQ(v.origin_snapshot, out.origin_snapshot);
    EXPECT_EQ(v.serial, out.serial);

    EXPECT_THROW(value_to_snapshot(val), ValueException);
    EXPECT_THROW(value_to_export(val), ValueException);
}

TEST(Convert, Export) {
    Export e;
    e.volume_id = "v1";
    e.target_iqn = "iqn.2010-10.org.openstack:v1";
    e.tid = 2;
    e.lun = 1;
    e.portal = "10.0.0.5:3260";
    e.initiators.insert("iqn.initiator2");
    e.initiators.insert("iqn.initiator1");

    Value val = export_to_value(e);
    std::vector<Value> inits = val["initiators"].asArray();
    ASSERT_EQ(2u, inits.size());
    EXPECT_EQ("iqn.initiator1", inits[0].asString());

    Export out = value_to_export(val);
    EXPECT_EQ(e.target_iqn, out.target_iqn);
    EXPECT_EQ(2u, out.tid);
    EXPECT_EQ(1u, out.lun);
    EXPECT_EQ(e.initiators, out.initiators);

    EXPECT_THROW(value_to_volume(val), ValueException);
}

TEST(Convert, Report) {
    ReconcileReport r;
    r.checked.push_back("v1");
    r.checked.push_back("v2");
    r.marked_error.push_back("v2");
    r.orphans.push_back("pool/stray");

    Value val = report_to_value(r);
    ReconcileReport out = value_to_report(val);
    EXPECT_EQ(r.checked, out.checked);
    EXPECT_EQ(r.marked_error, out.marked_error);
    EXPECT_EQ(r.orphans, out.orphans);
    EXPECT_TRUE(out.skipped.empty());

    Value notclass = Value("ReconcileReport");
    EXPECT_THROW(value_to_report(notclass), ValueException);
}
