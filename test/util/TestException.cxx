// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "util/Exception.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

TEST(ExceptionTest, RuntimeError)
{
    ASSERT_EQ(GetFullMessage(std::make_exception_ptr(std::runtime_error("Foo"))), "Foo");
}

TEST(ExceptionTest, DerivedError)
{
    class DerivedError : public std::runtime_error {
    public:
        explicit DerivedError(const char *_msg)
            :std::runtime_error(_msg) {}
    };

    ASSERT_EQ(GetFullMessage(std::make_exception_ptr(DerivedError("Foo"))), "Foo");
}

static std::exception_ptr
MakeNested()
{
    try {
        try {
            throw std::runtime_error("Inner");
        } catch (...) {
            std::throw_with_nested(std::runtime_error("/etc/foo.conf:3"));
        }
    } catch (...) {
        return std::current_exception();
    }
}

TEST(ExceptionTest, Nested)
{
    const auto ep = MakeNested();
    ASSERT_EQ(GetFullMessage(ep), "/etc/foo.conf:3; Inner");
    ASSERT_EQ(GetFullMessage(ep, "Unknown", ": "), "/etc/foo.conf:3: Inner");
}

TEST(ExceptionTest, Unknown)
{
    ASSERT_EQ(GetFullMessage(std::make_exception_ptr(42)), "Unknown exception");
    ASSERT_EQ(GetFullMessage(std::make_exception_ptr(42), "Other"), "Other");
}
