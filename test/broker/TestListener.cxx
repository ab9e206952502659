// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "FakeHandler.hxx"
#include "TempSocketPath.hxx"
#include "broker/Listener.hxx"
#include "broker/Codec.hxx"
#include "broker/Error.hxx"
#include "broker/ShutdownSignal.hxx"
#include "event/Loop.hxx"
#include "net/ConnectSocket.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <thread>

#include <sys/stat.h>
#include <unistd.h>

using namespace Broker;

static void
SendString(SocketDescriptor s, std::string_view data)
{
    while (!data.empty()) {
        const auto nbytes = s.Send(AsBytes(data));
        if (nbytes <= 0)
            throw std::runtime_error("send() failed");
        data.remove_prefix(nbytes);
    }
}

/**
 * Receive exactly the given number of bytes (or less if the peer
 * closes the connection).
 */
static std::string
ReceiveString(SocketDescriptor s, std::size_t size)
{
    std::string result;
    std::array<std::byte, 1024> buffer;

    while (result.size() < size) {
        if (s.WaitReadable(5000) <= 0)
            break;

        const auto nbytes = s.Receive(buffer);
        if (nbytes <= 0)
            break;

        result.append(ToStringView(std::span{buffer}.first(nbytes)));
    }

    return result;
}

/**
 * Wait until the peer closes the connection.
 *
 * @return true if the connection was closed
 */
static bool
WaitClosed(SocketDescriptor s)
{
    std::array<std::byte, 64> buffer;

    while (s.WaitReadable(5000) > 0) {
        const auto nbytes = s.Receive(buffer);
        if (nbytes <= 0)
            return true;
    }

    return false;
}

static std::string
Expected(Operation operation)
{
    return std::string{"{\"operation\":\""} + ToString(operation) + "\"}";
}

struct ListenerTest : ::testing::Test {
    TempSocketPath path;
    EventLoop event_loop;
    ShutdownSignal shutdown;
    const std::shared_ptr<RecordingHandler> handler =
        std::make_shared<RecordingHandler>();
};

TEST_F(ListenerTest, Basic)
{
    Listener listener{event_loop, handler, shutdown};
    listener.ListenPath(path.c_str());

    /* the socket is world-connectable */
    struct stat st;
    ASSERT_EQ(stat(path.c_str(), &st), 0);
    EXPECT_TRUE(S_ISSOCK(st.st_mode));
    EXPECT_EQ(st.st_mode & 0777, 0777);

    std::string response1, response2;

    std::thread client([&]{
        auto s = CreateConnectLocalSocket(path.str());

        SendString(s, R"({"acquireTokenSilently":["0.1","corr-123","{\"scope\":\"x\"}"]})");
        response1 = ReceiveString(s, Expected(Operation::ACQUIRE_TOKEN_SILENTLY).size());

        /* the second request arrives in two parts */
        const auto request = EncodeRequest(Operation::GET_ACCOUNTS,
                                           "0.1", "corr-124", "{}");
        SendString(s, std::string_view{request}.substr(0, 7));
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
        SendString(s, std::string_view{request}.substr(7));
        response2 = ReceiveString(s, Expected(Operation::GET_ACCOUNTS).size());

        s.Close();

        shutdown.Fire();
    });

    event_loop.Run();
    client.join();

    EXPECT_EQ(response1, Expected(Operation::ACQUIRE_TOKEN_SILENTLY));
    EXPECT_EQ(response2, Expected(Operation::GET_ACCOUNTS));

    ASSERT_EQ(handler->calls.size(), 2U);
    EXPECT_EQ(handler->calls[0].operation, Operation::ACQUIRE_TOKEN_SILENTLY);
    EXPECT_EQ(handler->calls[0].protocol_version, "0.1");
    EXPECT_EQ(handler->calls[0].correlation_id, "corr-123");
    EXPECT_EQ(handler->calls[0].request_json, R"({"scope":"x"})");
    EXPECT_EQ(handler->calls[1].operation, Operation::GET_ACCOUNTS);
    EXPECT_EQ(handler->calls[1].correlation_id, "corr-124");

    /* both requests carry the peer's uid */
    EXPECT_EQ(handler->calls[0].uid, geteuid());
    EXPECT_EQ(handler->calls[1].uid, geteuid());

    EXPECT_TRUE(listener.IsShuttingDown());
    EXPECT_EQ(listener.GetConnectionCount(), 0U);
}

TEST_F(ListenerTest, ConcurrentConnections)
{
    Listener listener{event_loop, handler, shutdown};
    listener.ListenPath(path.c_str());

    std::string response;

    std::thread client([&]{
        /* the first connection sends an incomplete request and
           then stalls */
        auto a = CreateConnectLocalSocket(path.str());
        SendString(a, R"({"getAccounts":["0.1",)");

        /* this must not block the second connection */
        auto b = CreateConnectLocalSocket(path.str());
        SendString(b, EncodeRequest(Operation::REMOVE_ACCOUNT,
                                    "0.1", "b", "{}"));
        response = ReceiveString(b, Expected(Operation::REMOVE_ACCOUNT).size());
        b.Close();

        /* now complete the first one */
        SendString(a, R"("a","{}"]})");
        ReceiveString(a, Expected(Operation::GET_ACCOUNTS).size());
        a.Close();

        shutdown.Fire();
    });

    event_loop.Run();
    client.join();

    EXPECT_EQ(response, Expected(Operation::REMOVE_ACCOUNT));
    ASSERT_EQ(handler->calls.size(), 2U);
    EXPECT_EQ(handler->calls[0].operation, Operation::REMOVE_ACCOUNT);
    EXPECT_EQ(handler->calls[1].operation, Operation::GET_ACCOUNTS);
}

TEST_F(ListenerTest, SlowHandlerDoesNotBlockOthers)
{
    handler->respond = [](const RecordedCall &call){
        if (call.operation == Operation::ACQUIRE_TOKEN_INTERACTIVELY)
            std::this_thread::sleep_for(std::chrono::seconds{1});
        return Expected(call.operation);
    };

    Listener listener{event_loop, handler, shutdown};
    listener.ListenPath(path.c_str());

    std::string slow_response, fast_response;
    std::chrono::steady_clock::duration fast_duration{};

    std::thread client([&]{
        auto a = CreateConnectLocalSocket(path.str());
        SendString(a, EncodeRequest(Operation::ACQUIRE_TOKEN_INTERACTIVELY,
                                    "0.1", "a", "{}"));

        /* give the first request time to reach its handler */
        std::this_thread::sleep_for(std::chrono::milliseconds{100});

        const auto start = std::chrono::steady_clock::now();
        auto b = CreateConnectLocalSocket(path.str());
        SendString(b, EncodeRequest(Operation::GET_ACCOUNTS,
                                    "0.1", "b", "{}"));
        fast_response = ReceiveString(b, Expected(Operation::GET_ACCOUNTS).size());
        fast_duration = std::chrono::steady_clock::now() - start;
        b.Close();

        slow_response = ReceiveString(a, Expected(Operation::ACQUIRE_TOKEN_INTERACTIVELY).size());
        a.Close();

        shutdown.Fire();
    });

    event_loop.Run();
    client.join();

    EXPECT_EQ(fast_response, Expected(Operation::GET_ACCOUNTS));
    EXPECT_EQ(slow_response, Expected(Operation::ACQUIRE_TOKEN_INTERACTIVELY));
    EXPECT_LT(fast_duration, std::chrono::milliseconds{500});
}

TEST_F(ListenerTest, ShutdownWaitsForRunningHandler)
{
    handler->respond = [](const RecordedCall &call){
        std::this_thread::sleep_for(std::chrono::milliseconds{300});
        return Expected(call.operation);
    };

    Listener listener{event_loop, handler, shutdown};
    listener.ListenPath(path.c_str());

    std::string response;

    std::thread client([&]{
        auto s = CreateConnectLocalSocket(path.str());
        SendString(s, EncodeRequest(Operation::GET_ACCOUNTS,
                                    "0.1", "c", "{}"));
        std::this_thread::sleep_for(std::chrono::milliseconds{100});

        shutdown.Fire();

        /* the response is still delivered */
        response = ReceiveString(s, Expected(Operation::GET_ACCOUNTS).size());
        s.Close();
    });

    event_loop.Run();
    client.join();

    EXPECT_EQ(response, Expected(Operation::GET_ACCOUNTS));
    EXPECT_EQ(listener.GetConnectionCount(), 0U);
}

TEST_F(ListenerTest, HandlerError)
{
    handler->respond = [](const RecordedCall &) -> std::string {
        throw Error{ErrorCode::NOT_SUPPORTED, "nope"};
    };

    Listener listener{event_loop, handler, shutdown};
    listener.ListenPath(path.c_str());

    bool closed = false;

    std::thread client([&]{
        auto s = CreateConnectLocalSocket(path.str());
        SendString(s, EncodeRequest(Operation::GET_ACCOUNTS,
                                    "0.1", "c", "{}"));

        /* there is no error envelope; the connection is closed */
        closed = WaitClosed(s);
        s.Close();

        shutdown.Fire();
    });

    event_loop.Run();
    client.join();

    EXPECT_TRUE(closed);
    EXPECT_EQ(handler->calls.size(), 1U);
}

TEST_F(ListenerTest, RequestTooLarge)
{
    Listener listener{event_loop, handler, shutdown, 64};
    listener.ListenPath(path.c_str());

    bool closed = false;

    std::thread client([&]{
        auto s = CreateConnectLocalSocket(path.str());
        SendString(s, std::string(256, '{'));
        closed = WaitClosed(s);
        s.Close();

        shutdown.Fire();
    });

    event_loop.Run();
    client.join();

    EXPECT_TRUE(closed);
    EXPECT_TRUE(handler->calls.empty());
}

TEST_F(ListenerTest, ShutdownClosesIdleConnections)
{
    Listener listener{event_loop, handler, shutdown};
    listener.ListenPath(path.c_str());

    bool closed = false;

    std::thread client([&]{
        auto s = CreateConnectLocalSocket(path.str());

        /* a complete round-trip makes sure the connection has
           been accepted */
        SendString(s, EncodeRequest(Operation::GET_ACCOUNTS,
                                    "0.1", "c", "{}"));
        ReceiveString(s, Expected(Operation::GET_ACCOUNTS).size());

        shutdown.Fire();

        closed = WaitClosed(s);
        s.Close();
    });

    event_loop.Run();
    client.join();

    EXPECT_TRUE(closed);
    EXPECT_EQ(listener.GetConnectionCount(), 0U);

    /* no new connections are accepted */
    EXPECT_THROW(CreateConnectLocalSocket(path.str()), std::system_error);
}

TEST_F(ListenerTest, ShutdownDiscardsPartialRequest)
{
    Listener listener{event_loop, handler, shutdown};
    listener.ListenPath(path.c_str());

    bool closed = false;

    std::thread client([&]{
        auto s = CreateConnectLocalSocket(path.str());

        /* a complete round-trip makes sure the connection has
           been accepted */
        SendString(s, EncodeRequest(Operation::GET_ACCOUNTS,
                                    "0.1", "c", "{}"));
        ReceiveString(s, Expected(Operation::GET_ACCOUNTS).size());

        /* this request is never completed */
        SendString(s, R"({"getAccounts":[)");
        std::this_thread::sleep_for(std::chrono::milliseconds{50});

        shutdown.Fire();

        closed = WaitClosed(s);
        s.Close();
    });

    /* returns only after the stalled connection was closed */
    event_loop.Run();
    client.join();

    EXPECT_TRUE(closed);
    EXPECT_EQ(listener.GetConnectionCount(), 0U);
    EXPECT_EQ(handler->calls.size(), 1U);
}
