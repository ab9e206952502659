// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "broker/UnavailableHandler.hxx"
#include "broker/Error.hxx"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using namespace Broker;

TEST(UnavailableHandler, NotSupported)
{
    UnavailableHandler handler{"1.2.3"};

    for (const auto operation : all_operations) {
        if (operation == Operation::GET_LINUX_BROKER_VERSION)
            continue;

        try {
            Invoke(handler, operation, "0.1", "c", "{}", 1000);
            FAIL() << ToString(operation);
        } catch (const Error &e) {
            EXPECT_EQ(e.GetCode(), ErrorCode::NOT_SUPPORTED);
            EXPECT_NE(std::string_view{e.what()}.find(ToString(operation)),
                      std::string_view::npos);
        }
    }
}

TEST(UnavailableHandler, Version)
{
    UnavailableHandler handler{"1.2.3"};

    const auto result = Invoke(handler, Operation::GET_LINUX_BROKER_VERSION,
                               "0.1", "c", "{}", 1000);
    EXPECT_EQ(result, R"({"linuxBrokerVersion":"1.2.3"})");

    const auto j = nlohmann::json::parse(result);
    EXPECT_EQ(j.at("linuxBrokerVersion").get<std::string>(), "1.2.3");
}

TEST(UnavailableDeviceHandler, NotSupported)
{
    UnavailableDeviceHandler handler;

    for (const auto operation : all_device_operations) {
        try {
            Invoke(handler, operation, "session", "{}");
            FAIL() << ToString(operation);
        } catch (const Error &e) {
            EXPECT_EQ(e.GetCode(), ErrorCode::NOT_SUPPORTED);
        }
    }
}
