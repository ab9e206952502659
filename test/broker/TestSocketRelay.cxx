// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "TempSocketPath.hxx"
#include "broker/SocketRelay.hxx"
#include "broker/Codec.hxx"
#include "broker/Error.hxx"
#include "net/LocalSocketAddress.hxx"
#include "net/SocketConfig.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

#include <array>
#include <optional>
#include <thread>
#include <vector>

#include <sys/socket.h>

using namespace Broker;
using std::chrono::milliseconds;

/**
 * A fake privileged endpoint: accepts one connection, reads one
 * request and sends a canned response.
 */
class FakeBrokerSocket {
    UniqueSocketDescriptor listener;

    std::thread thread;

public:
    std::optional<Request> request;

    /**
     * @param response the response to send; nullptr means don't
     * respond at all
     * @param close_after_response close the connection right after
     * sending the response instead of waiting for the client to
     * close it
     */
    FakeBrokerSocket(const TempSocketPath &path,
                     const char *response,
                     bool close_after_response=false)
        :listener(SocketConfig{path.str(), 4}.Create(SOCK_STREAM))
    {
        thread = std::thread([this, response, close_after_response]{
            Run(response, close_after_response);
        });
    }

    ~FakeBrokerSocket() noexcept {
        thread.join();
    }

private:
    void Run(const char *response, bool close_after_response) {
        if (listener.WaitReadable(5000) <= 0)
            return;

        auto s = listener.AcceptNonBlock();
        if (!s.IsDefined())
            return;

        std::string input;
        std::array<std::byte, 256> buffer;

        while (!request) {
            if (s.WaitReadable(5000) <= 0)
                return;

            const auto nbytes = s.Receive(buffer);
            if (nbytes <= 0)
                return;

            input.append(ToStringView(std::span{buffer}.first(nbytes)));
            request = DecodeRequest(input);
        }

        if (response != nullptr) {
            const std::string_view r{response};
            if (s.Send(AsBytes(r)) != ssize_t(r.size()))
                return;
        }

        if (close_after_response)
            return;

        /* wait for the client to close the connection */
        while (s.WaitReadable(5000) > 0)
            if (s.Receive(buffer) <= 0)
                break;
    }
};

TEST(SocketRelay, ShortResponse)
{
    const TempSocketPath path;
    std::optional<FakeBrokerSocket> server;
    server.emplace(path, R"({"token":"abc"})");

    SocketRelay relay{path.str(), milliseconds{5000}};

    const auto start = std::chrono::steady_clock::now();
    const auto result = relay.AcquireTokenSilently("0.1", "corr-123",
                                                   R"({"scope":"x"})");
    const auto duration = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result, R"({"token":"abc"})");

    /* the short chunk ends the response, there is no waiting for
       the timeout */
    EXPECT_LT(duration, milliseconds{2500});

    server.reset();
}

TEST(SocketRelay, Request)
{
    const TempSocketPath path;
    std::optional<FakeBrokerSocket> server;
    server.emplace(path, "ok");

    SocketRelay relay{path.str()};
    EXPECT_EQ(relay.GetAccounts("0.1", "corr-1", "{}"), "ok");

    const auto request = server->request;
    server.reset();

    ASSERT_TRUE(request);
    EXPECT_EQ(request->operation, Operation::GET_ACCOUNTS);
    EXPECT_EQ(request->protocol_version, "0.1");
    EXPECT_EQ(request->correlation_id, "corr-1");
    EXPECT_EQ(request->request_json, "{}");
}

TEST(SocketRelay, MultipleChunks)
{
    const TempSocketPath path;
    const std::string response(40, 'x');
    std::optional<FakeBrokerSocket> server;
    server.emplace(path, response.c_str());

    SocketRelay relay{path.str(), milliseconds{5000}, 16};
    EXPECT_EQ(relay.GetAccounts("0.1", "c", "{}"), response);

    server.reset();
}

TEST(SocketRelay, ExactMultipleWithEndOfStream)
{
    const TempSocketPath path;
    const std::string response(32, 'x');
    std::optional<FakeBrokerSocket> server;
    server.emplace(path, response.c_str(), true);

    SocketRelay relay{path.str(), milliseconds{5000}, 16};
    EXPECT_EQ(relay.GetAccounts("0.1", "c", "{}"), response);

    server.reset();
}

TEST(SocketRelay, ExactMultipleTimesOut)
{
    /* a response of exactly N chunks is only completed by
       end-of-stream; if the peer keeps the connection open, the
       relay waits for more data until the timeout */
    const TempSocketPath path;
    const std::string response(32, 'x');
    std::optional<FakeBrokerSocket> server;
    server.emplace(path, response.c_str());

    SocketRelay relay{path.str(), milliseconds{200}, 16};

    try {
        relay.GetAccounts("0.1", "c", "{}");
        FAIL();
    } catch (const Error &e) {
        EXPECT_EQ(e.GetCode(), ErrorCode::TIMEOUT);
    }

    server.reset();
}

TEST(SocketRelay, SilentPeer)
{
    const TempSocketPath path;
    std::optional<FakeBrokerSocket> server;
    server.emplace(path, nullptr);

    const milliseconds timeout{200};
    SocketRelay relay{path.str(), timeout};

    const auto start = std::chrono::steady_clock::now();

    try {
        relay.AcquireTokenInteractively("0.1", "c", "{}");
        FAIL();
    } catch (const Error &e) {
        EXPECT_EQ(e.GetCode(), ErrorCode::TIMEOUT);
    }

    EXPECT_GE(std::chrono::steady_clock::now() - start, timeout);

    server.reset();
}

TEST(SocketRelay, ConnectFailure)
{
    const TempSocketPath path;

    SocketRelay relay{path.str(), milliseconds{200}};

    try {
        relay.GetAccounts("0.1", "c", "{}");
        FAIL();
    } catch (const Error &e) {
        EXPECT_EQ(e.GetCode(), ErrorCode::FAILED);
    }
}

TEST(SocketRelay, PeerNeverReads)
{
    /* the connection sits in the backlog and nobody reads the
       request; sending must not block beyond the timeout */
    const TempSocketPath path;
    const auto listener = SocketConfig{path.str(), 4}.Create(SOCK_STREAM);

    const milliseconds timeout{300};
    SocketRelay relay{path.str(), timeout};

    const std::string huge(8 * 1024 * 1024, 'x');

    const auto start = std::chrono::steady_clock::now();

    try {
        relay.GetAccounts("0.1", "c", huge);
        FAIL();
    } catch (const Error &e) {
        EXPECT_EQ(e.GetCode(), ErrorCode::TIMEOUT);
    }

    EXPECT_LT(std::chrono::steady_clock::now() - start, milliseconds{2500});
}

TEST(SocketRelay, BacklogFull)
{
    const TempSocketPath path;
    const auto listener = SocketConfig{path.str(), 1}.Create(SOCK_STREAM);

    /* fill the backlog with connections nobody accepts */
    std::vector<UniqueSocketDescriptor> pending;
    while (pending.size() < 64) {
        UniqueSocketDescriptor s;
        ASSERT_TRUE(s.CreateNonBlock(AF_LOCAL, SOCK_STREAM, 0));
        if (!s.Connect(LocalSocketAddress{path.str()}))
            break;

        pending.emplace_back(std::move(s));
    }

    const milliseconds timeout{300};
    SocketRelay relay{path.str(), timeout};

    const auto start = std::chrono::steady_clock::now();

    try {
        relay.GetAccounts("0.1", "c", "{}");
        FAIL();
    } catch (const Error &e) {
        EXPECT_EQ(e.GetCode(), ErrorCode::TIMEOUT);
    }

    const auto duration = std::chrono::steady_clock::now() - start;
    EXPECT_GE(duration, timeout);
    EXPECT_LT(duration, milliseconds{2500});
}
