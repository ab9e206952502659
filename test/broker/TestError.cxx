// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "broker/Error.hxx"

#include <gtest/gtest.h>

#include <dbus/dbus-protocol.h>

#include <system_error>

using namespace Broker;

TEST(Error, DBusNames)
{
    static constexpr ErrorCode codes[] = {
        ErrorCode::FAILED,
        ErrorCode::ACCESS_DENIED,
        ErrorCode::TIMEOUT,
        ErrorCode::NOT_SUPPORTED,
        ErrorCode::INVALID_ARGS,
    };

    for (const auto code : codes)
        EXPECT_EQ(ErrorCodeFromDBusName(ToDBusErrorName(code)), code);

    EXPECT_STREQ(ToDBusErrorName(ErrorCode::ACCESS_DENIED),
                 "org.freedesktop.DBus.Error.AccessDenied");
    EXPECT_STREQ(ToDBusErrorName(ErrorCode::FAILED),
                 "org.freedesktop.DBus.Error.Failed");
}

TEST(Error, FromDBusName)
{
    EXPECT_EQ(ErrorCodeFromDBusName(DBUS_ERROR_NO_REPLY), ErrorCode::TIMEOUT);
    EXPECT_EQ(ErrorCodeFromDBusName(DBUS_ERROR_TIMED_OUT), ErrorCode::TIMEOUT);
    EXPECT_EQ(ErrorCodeFromDBusName(DBUS_ERROR_SERVICE_UNKNOWN),
              ErrorCode::FAILED);
    EXPECT_EQ(ErrorCodeFromDBusName("com.example.Whatever"), ErrorCode::FAILED);
    EXPECT_EQ(ErrorCodeFromDBusName(nullptr), ErrorCode::FAILED);
}

TEST(Error, ToError)
{
    const auto a = ToError(std::make_exception_ptr(Error{ErrorCode::TIMEOUT, "slow"}));
    EXPECT_EQ(a.GetCode(), ErrorCode::TIMEOUT);
    EXPECT_STREQ(a.what(), "slow");

    const auto b = ToError(std::make_exception_ptr(std::runtime_error{"Foo"}));
    EXPECT_EQ(b.GetCode(), ErrorCode::FAILED);
    EXPECT_STREQ(b.what(), "Foo");

    try {
        try {
            throw std::runtime_error{"Inner"};
        } catch (...) {
            std::throw_with_nested(std::runtime_error{"Outer"});
        }
    } catch (...) {
        const auto c = ToError(std::current_exception());
        EXPECT_EQ(c.GetCode(), ErrorCode::FAILED);
        EXPECT_STREQ(c.what(), "Outer; Inner");
    }
}
