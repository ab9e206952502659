// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "FakeHandler.hxx"
#include "broker/BusNames.hxx"
#include "broker/Credentials.hxx"
#include "broker/DeviceBrokerObject.hxx"
#include "broker/Error.hxx"
#include "broker/SessionBrokerObject.hxx"
#include "broker/SystemBrokerObject.hxx"
#include "lib/dbus/AppendIter.hxx"
#include "lib/dbus/Error.hxx"
#include "lib/dbus/Message.hxx"

#include <gtest/gtest.h>

#include <initializer_list>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace Broker;

namespace {

class FakeSenderUidLookup final : public SenderUidLookup {
public:
    std::map<std::string, uid_t, std::less<>> senders{
        {":1.42", 1000},
    };

    unsigned n_lookups = 0;

    uid_t LookupSenderUid(const char *sender) override {
        ++n_lookups;

        auto i = senders.find(sender);
        if (i == senders.end())
            throw std::runtime_error("No such name");

        return i->second;
    }
};

} // anonymous namespace

static ODBus::Message
MakeCall(const char *path, const char *interface, const char *method,
         std::initializer_list<const char *> args,
         const char *sender=":1.42")
{
    auto msg = ODBus::Message::NewMethodCall("org.example.Test", path,
                                             interface, method);

    /* replies refer to the serial, which is usually assigned by
       the connection */
    dbus_message_set_serial(msg.Get(), 1);

    ODBus::AppendMessageIter i{*msg.Get()};
    for (const char *arg : args)
        i.Append(arg);

    if (sender != nullptr)
        msg.SetSender(sender);

    return msg;
}

static ODBus::Message
MakeSystemCall(const char *method,
               std::initializer_list<const char *> args,
               const char *sender=":1.42")
{
    return MakeCall(SystemBroker::PATH, SystemBroker::INTERFACE,
                    method, args, sender);
}

static std::string
GetStringResult(ODBus::Message &reply)
{
    EXPECT_EQ(reply.GetType(), DBUS_MESSAGE_TYPE_METHOD_RETURN);

    ODBus::Error error;
    const char *result;
    if (!reply.GetArgs(error, DBUS_TYPE_STRING, &result))
        return {};

    return result;
}

static std::string
GetErrorName(ODBus::Message &reply)
{
    EXPECT_TRUE(reply.IsError());
    const char *name = reply.GetErrorName();
    return name != nullptr ? name : "";
}

struct SystemBrokerObjectTest : ::testing::Test {
    const std::shared_ptr<RecordingHandler> handler =
        std::make_shared<RecordingHandler>();
    FakeSenderUidLookup uid_lookup;
    SystemBrokerObject object{handler, uid_lookup};
};

TEST_F(SystemBrokerObjectTest, Call)
{
    auto call = MakeSystemCall("acquireTokenSilently",
                               {"0.1", "corr-123", R"({"scope":"x"})"});
    auto reply = object.HandleMethodCall(call);
    ASSERT_TRUE(reply.IsDefined());
    EXPECT_EQ(GetStringResult(reply),
              R"({"operation":"acquireTokenSilently"})");

    ASSERT_EQ(handler->calls.size(), 1U);
    EXPECT_EQ(handler->calls[0].operation, Operation::ACQUIRE_TOKEN_SILENTLY);
    EXPECT_EQ(handler->calls[0].protocol_version, "0.1");
    EXPECT_EQ(handler->calls[0].correlation_id, "corr-123");
    EXPECT_EQ(handler->calls[0].request_json, R"({"scope":"x"})");
    EXPECT_EQ(handler->calls[0].uid, 1000U);
}

TEST_F(SystemBrokerObjectTest, AllOperations)
{
    for (const auto operation : all_operations) {
        auto call = MakeSystemCall(ToString(operation), {"0.1", "c", "{}"});
        auto reply = object.HandleMethodCall(call);
        ASSERT_TRUE(reply.IsDefined());
        EXPECT_EQ(GetStringResult(reply),
                  std::string{"{\"operation\":\""} + ToString(operation) + "\"}");
    }

    ASSERT_EQ(handler->calls.size(), all_operations.size());
    for (std::size_t i = 0; i < all_operations.size(); ++i)
        EXPECT_EQ(handler->calls[i].operation, all_operations[i]);
}

TEST_F(SystemBrokerObjectTest, UidPerCall)
{
    uid_lookup.senders.emplace(":1.50", 2000);

    auto a = MakeSystemCall("getAccounts", {"0.1", "a", "{}"}, ":1.42");
    auto b = MakeSystemCall("getAccounts", {"0.1", "b", "{}"}, ":1.50");
    object.HandleMethodCall(a);
    object.HandleMethodCall(b);

    /* the uid is looked up again for each call */
    EXPECT_EQ(uid_lookup.n_lookups, 2U);

    ASSERT_EQ(handler->calls.size(), 2U);
    EXPECT_EQ(handler->calls[0].uid, 1000U);
    EXPECT_EQ(handler->calls[1].uid, 2000U);
}

TEST_F(SystemBrokerObjectTest, NoSender)
{
    auto call = MakeSystemCall("getAccounts", {"0.1", "c", "{}"}, nullptr);
    auto reply = object.HandleMethodCall(call);
    ASSERT_TRUE(reply.IsDefined());
    EXPECT_EQ(GetErrorName(reply), DBUS_ERROR_ACCESS_DENIED);
    EXPECT_TRUE(handler->calls.empty());
}

TEST_F(SystemBrokerObjectTest, UnknownSender)
{
    auto call = MakeSystemCall("getAccounts", {"0.1", "c", "{}"}, ":1.99");
    auto reply = object.HandleMethodCall(call);
    ASSERT_TRUE(reply.IsDefined());
    EXPECT_EQ(GetErrorName(reply), DBUS_ERROR_ACCESS_DENIED);
    EXPECT_TRUE(handler->calls.empty());
}

TEST_F(SystemBrokerObjectTest, InvalidArgs)
{
    auto a = MakeSystemCall("getAccounts", {"0.1", "c"});
    auto reply = object.HandleMethodCall(a);
    EXPECT_EQ(GetErrorName(reply), DBUS_ERROR_INVALID_ARGS);

    auto b = MakeSystemCall("getAccounts", {"0.1", "c", "{}", "extra"});
    reply = object.HandleMethodCall(b);
    EXPECT_EQ(GetErrorName(reply), DBUS_ERROR_INVALID_ARGS);

    auto c = MakeSystemCall("getAccounts", {});
    reply = object.HandleMethodCall(c);
    EXPECT_EQ(GetErrorName(reply), DBUS_ERROR_INVALID_ARGS);

    auto d = MakeSystemCall("getAccounts", {"0.1", "c"});
    ODBus::AppendMessageIter{*d.Get()}.Append(dbus_uint32_t{42});
    reply = object.HandleMethodCall(d);
    EXPECT_EQ(GetErrorName(reply), DBUS_ERROR_INVALID_ARGS);

    EXPECT_TRUE(handler->calls.empty());
}

TEST_F(SystemBrokerObjectTest, UnknownMethod)
{
    auto a = MakeSystemCall("noSuchMethod", {"0.1", "c", "{}"});
    auto reply = object.HandleMethodCall(a);
    EXPECT_EQ(GetErrorName(reply), DBUS_ERROR_UNKNOWN_METHOD);

    auto b = MakeCall(SystemBroker::PATH, "org.example.Other",
                      "getAccounts", {"0.1", "c", "{}"});
    reply = object.HandleMethodCall(b);
    EXPECT_EQ(GetErrorName(reply), DBUS_ERROR_UNKNOWN_METHOD);

    EXPECT_TRUE(handler->calls.empty());
}

TEST_F(SystemBrokerObjectTest, NoInterface)
{
    /* the interface is optional in method calls */
    auto call = MakeCall(SystemBroker::PATH, nullptr,
                         "getAccounts", {"0.1", "c", "{}"});
    auto reply = object.HandleMethodCall(call);
    EXPECT_EQ(GetStringResult(reply), R"({"operation":"getAccounts"})");
}

TEST_F(SystemBrokerObjectTest, HandlerError)
{
    handler->respond = [](const RecordedCall &) -> std::string {
        throw Error{ErrorCode::NOT_SUPPORTED, "nope"};
    };

    auto a = MakeSystemCall("getAccounts", {"0.1", "c", "{}"});
    auto reply = object.HandleMethodCall(a);
    EXPECT_EQ(GetErrorName(reply), DBUS_ERROR_NOT_SUPPORTED);

    ODBus::Error error;
    dbus_set_error_from_message(error, reply.Get());
    EXPECT_STREQ(error.GetMessage(), "nope");

    handler->respond = [](const RecordedCall &) -> std::string {
        throw std::runtime_error("boom");
    };

    auto b = MakeSystemCall("getAccounts", {"0.1", "c", "{}"});
    reply = object.HandleMethodCall(b);
    EXPECT_EQ(GetErrorName(reply), DBUS_ERROR_FAILED);

    /* results must be valid UTF-8 */
    handler->respond = [](const RecordedCall &) -> std::string {
        return "\xff\xfe";
    };

    auto c = MakeSystemCall("getAccounts", {"0.1", "c", "{}"});
    reply = object.HandleMethodCall(c);
    EXPECT_EQ(GetErrorName(reply), DBUS_ERROR_FAILED);
}

TEST_F(SystemBrokerObjectTest, ErrorMessageNotUtf8)
{
    handler->respond = [](const RecordedCall &) -> std::string {
        throw Error{ErrorCode::ACCESS_DENIED, "bad user \xff\xfe"};
    };

    auto call = MakeSystemCall("getAccounts", {"0.1", "c", "{}"});
    auto reply = object.HandleMethodCall(call);

    /* the error name survives, the message is replaced */
    EXPECT_EQ(GetErrorName(reply), DBUS_ERROR_ACCESS_DENIED);

    ODBus::Error error;
    dbus_set_error_from_message(error, reply.Get());
    ASSERT_NE(error.GetMessage(), nullptr);
    EXPECT_TRUE(dbus_validate_utf8(error.GetMessage(), nullptr));
    EXPECT_EQ(std::string_view{error.GetMessage()}.find("bad user"),
              std::string_view::npos);
}

TEST_F(SystemBrokerObjectTest, ResultWithNullByte)
{
    handler->respond = [](const RecordedCall &) -> std::string {
        using namespace std::string_literals;
        return "{\"a\":1}\0{\"b\":2}"s;
    };

    auto call = MakeSystemCall("getAccounts", {"0.1", "c", "{}"});
    auto reply = object.HandleMethodCall(call);

    /* the result is not silently truncated */
    EXPECT_EQ(GetErrorName(reply), DBUS_ERROR_FAILED);

    ODBus::Error error;
    dbus_set_error_from_message(error, reply.Get());
    EXPECT_STREQ(error.GetMessage(), "Result contains a null byte");
}

TEST_F(SystemBrokerObjectTest, Introspect)
{
    auto call = MakeCall(SystemBroker::PATH, DBUS_INTERFACE_INTROSPECTABLE,
                         "Introspect", {});
    auto reply = object.HandleMethodCall(call);
    const auto xml = GetStringResult(reply);

    EXPECT_NE(xml.find("<interface name=\"org.samba.himmelblau\">"),
              xml.npos);
    EXPECT_NE(xml.find("<method name=\"acquireTokenSilently\">"), xml.npos);
    EXPECT_NE(xml.find("<method name=\"getLinuxBrokerVersion\">"), xml.npos);
    EXPECT_NE(xml.find("<arg name=\"correlation_id\" type=\"s\" direction=\"in\"/>"),
              xml.npos);
}

TEST(SessionBrokerObject, Forward)
{
    RecordingSessionHandler handler;
    SessionBrokerObject object{handler};

    /* the session broker does not need to identify the caller */
    auto call = MakeCall(SessionBroker::PATH, SessionBroker::INTERFACE,
                         "acquirePrtSsoCookie", {"0.1", "c", "payload"},
                         nullptr);
    auto reply = object.HandleMethodCall(call);
    EXPECT_EQ(GetStringResult(reply), "payload");

    ASSERT_EQ(handler.calls.size(), 1U);
    EXPECT_EQ(handler.calls[0].operation, Operation::ACQUIRE_PRT_SSO_COOKIE);
    EXPECT_EQ(handler.calls[0].correlation_id, "c");
}

TEST(SessionBrokerObject, RelayError)
{
    RecordingSessionHandler handler;
    handler.respond = [](const RecordedCall &) -> std::string {
        throw Error{ErrorCode::TIMEOUT, "No response"};
    };

    SessionBrokerObject object{handler};

    auto call = MakeCall(SessionBroker::PATH, SessionBroker::INTERFACE,
                         "getAccounts", {"0.1", "c", "{}"});
    auto reply = object.HandleMethodCall(call);
    EXPECT_EQ(GetErrorName(reply), DBUS_ERROR_TIMEOUT);
}

TEST(SessionBrokerObject, WrongInterface)
{
    RecordingSessionHandler handler;
    SessionBrokerObject object{handler};

    auto call = MakeCall(SessionBroker::PATH, SystemBroker::INTERFACE,
                         "getAccounts", {"0.1", "c", "{}"});
    auto reply = object.HandleMethodCall(call);
    EXPECT_EQ(GetErrorName(reply), DBUS_ERROR_UNKNOWN_METHOD);
    EXPECT_TRUE(handler.calls.empty());
}

TEST(DeviceBrokerObject, AllOperations)
{
    const auto handler = std::make_shared<RecordingDeviceHandler>();
    DeviceBrokerObject object{handler};

    for (const auto operation : all_device_operations) {
        auto call = MakeCall(DeviceBroker::PATH, DeviceBroker::INTERFACE,
                             ToString(operation), {"session-1", "{}"});
        auto reply = object.HandleMethodCall(call);
        EXPECT_EQ(GetStringResult(reply), ToString(operation));
    }

    ASSERT_EQ(handler->calls.size(), all_device_operations.size());
    for (std::size_t i = 0; i < all_device_operations.size(); ++i) {
        EXPECT_EQ(handler->calls[i].operation, all_device_operations[i]);
        EXPECT_EQ(handler->calls[i].session_id, "session-1");
    }
}

TEST(DeviceBrokerObject, InvalidArgs)
{
    const auto handler = std::make_shared<RecordingDeviceHandler>();
    DeviceBrokerObject object{handler};

    auto call = MakeCall(DeviceBroker::PATH, DeviceBroker::INTERFACE,
                         "sign", {"0.1", "c", "{}"});
    auto reply = object.HandleMethodCall(call);
    EXPECT_EQ(GetErrorName(reply), DBUS_ERROR_INVALID_ARGS);
    EXPECT_TRUE(handler->calls.empty());
}

TEST(DeviceBrokerObject, Names)
{
    EXPECT_STREQ(ToString(DeviceOperation::GENERATE_PKCS10_CERT_SIGNING_REQUEST),
                 "generatePKCS10CertSigningRequest");
    EXPECT_STREQ(ToString(DeviceOperation::MAKE_HTTP_REQUEST_WITH_CLIENT_TLS),
                 "makeHttpRequestWithClientTls");

    for (const auto operation : all_device_operations) {
        const auto parsed = ParseDeviceOperation(ToString(operation));
        ASSERT_TRUE(parsed);
        EXPECT_EQ(*parsed, operation);
    }

    EXPECT_FALSE(ParseDeviceOperation("acquireTokenSilently"));
}
