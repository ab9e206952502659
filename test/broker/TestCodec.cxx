// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "broker/Codec.hxx"

#include <gtest/gtest.h>

using namespace Broker;

TEST(Codec, OperationNames)
{
    for (const auto operation : all_operations) {
        const auto parsed = ParseOperation(ToString(operation));
        ASSERT_TRUE(parsed);
        EXPECT_EQ(*parsed, operation);
    }

    EXPECT_STREQ(ToString(Operation::ACQUIRE_TOKEN_SILENTLY),
                 "acquireTokenSilently");
    EXPECT_STREQ(ToString(Operation::GET_LINUX_BROKER_VERSION),
                 "getLinuxBrokerVersion");
    EXPECT_FALSE(ParseOperation("AcquireTokenSilently"));
    EXPECT_FALSE(ParseOperation(""));
}

TEST(Codec, Decode)
{
    std::string buffer = R"({"acquireTokenSilently":["0.1","corr-123","{\"scope\":\"x\"}"]})";

    const auto request = DecodeRequest(buffer);
    ASSERT_TRUE(request);
    EXPECT_EQ(request->operation, Operation::ACQUIRE_TOKEN_SILENTLY);
    EXPECT_EQ(request->protocol_version, "0.1");
    EXPECT_EQ(request->correlation_id, "corr-123");
    EXPECT_EQ(request->request_json, R"({"scope":"x"})");

    /* the whole buffer was consumed */
    EXPECT_TRUE(buffer.empty());
}

TEST(Codec, Encode)
{
    EXPECT_EQ(EncodeRequest(Operation::GET_ACCOUNTS, "0.1", "c", "{}"),
              R"({"getAccounts":["0.1","c","{}"]})");

    const Request request{
        Operation::REMOVE_ACCOUNT,
        "1.0", "id \"quoted\"", "{\"a\":[1,2]}",
    };

    const auto decoded = ParseRequest(EncodeRequest(request));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded->operation, request.operation);
    EXPECT_EQ(decoded->protocol_version, request.protocol_version);
    EXPECT_EQ(decoded->correlation_id, request.correlation_id);
    EXPECT_EQ(decoded->request_json, request.request_json);
}

TEST(Codec, Incomplete)
{
    const std::string complete = EncodeRequest(Operation::GET_ACCOUNTS,
                                               "0.1", "c", "{}");

    /* no prefix of a request is a request */
    for (std::size_t i = 0; i < complete.size(); ++i) {
        std::string buffer = complete.substr(0, i);
        EXPECT_FALSE(DecodeRequest(buffer));
        EXPECT_EQ(buffer, complete.substr(0, i));
    }

    /* appending the rest completes it */
    std::string buffer = complete.substr(0, 10);
    ASSERT_FALSE(DecodeRequest(buffer));
    buffer.append(complete.substr(10));
    EXPECT_TRUE(DecodeRequest(buffer));
    EXPECT_TRUE(buffer.empty());
}

TEST(Codec, Malformed)
{
    static constexpr const char *tests[] = {
        "",
        "garbage",
        "[]",
        "{}",
        R"("acquireTokenSilently")",
        R"({"unknownOperation":["a","b","c"]})",
        R"({"getAccounts":["a","b"]})",
        R"({"getAccounts":["a","b","c","d"]})",
        R"({"getAccounts":["a","b",3]})",
        R"({"getAccounts":"abc"})",
        R"({"getAccounts":["a","b","c"],"removeAccount":["a","b","c"]})",
        /* two requests in one buffer */
        R"({"getAccounts":["a","b","c"]}{"getAccounts":["a","b","c"]})",
    };

    for (const char *i : tests) {
        std::string buffer = i;
        EXPECT_FALSE(DecodeRequest(buffer)) << i;
        EXPECT_EQ(buffer, i);
    }
}
