// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "FakeHandler.hxx"
#include "PrivateBusDaemon.hxx"
#include "broker/BusNames.hxx"
#include "broker/BusRelay.hxx"
#include "broker/BusService.hxx"
#include "broker/Credentials.hxx"
#include "broker/Error.hxx"
#include "broker/ShutdownSignal.hxx"
#include "broker/SystemBrokerObject.hxx"

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>
#include <string_view>
#include <thread>

#include <unistd.h>

using namespace Broker;
using std::chrono::milliseconds;

/**
 * Runs a System Broker on a private bus daemon.
 */
struct BusServiceTest : ::testing::Test {
    PrivateBusDaemon bus;

    const std::shared_ptr<RecordingHandler> handler =
        std::make_shared<RecordingHandler>();

    std::optional<BusSenderUidLookup> uid_lookup;
    std::optional<SystemBrokerObject> object;
    std::optional<BusService> service;

    ShutdownSignal shutdown;
    std::thread thread;

    void SetUp() override {
        ASSERT_TRUE(dbus_threads_init_default());

        if (!bus.IsAvailable())
            GTEST_SKIP() << "dbus-daemon is not available";

        auto connection = bus.Connect();
        uid_lookup.emplace(connection);
        object.emplace(handler, *uid_lookup);
        service.emplace(std::move(connection),
                        SystemBroker::NAME, SystemBroker::PATH,
                        *object);
    }

    void TearDown() override {
        shutdown.Fire();
        if (thread.joinable())
            thread.join();

        service.reset();
    }

    void StartService() {
        thread = std::thread([this]{
            service->Serve(shutdown);
        });
    }
};

TEST_F(BusServiceTest, NameAlreadyOwned)
{
    /* a second service must not steal or queue for the name */
    auto connection = bus.Connect();
    SystemBrokerObject other{handler, *uid_lookup};

    try {
        BusService second{std::move(connection),
                          SystemBroker::NAME, SystemBroker::PATH,
                          other};
        FAIL();
    } catch (const std::runtime_error &e) {
        EXPECT_NE(std::string_view{e.what()}.find("already owned"),
                  std::string_view::npos);
    }
}

TEST_F(BusServiceTest, Relay)
{
    StartService();

    BusRelay relay{milliseconds{5000}, bus.GetAddress()};
    EXPECT_EQ(relay.GetAccounts("0.1", "corr-1", "{}"),
              R"({"operation":"getAccounts"})");
    EXPECT_EQ(relay.AcquireTokenSilently("0.1", "corr-2", R"({"scope":"x"})"),
              R"({"operation":"acquireTokenSilently"})");

    shutdown.Fire();
    thread.join();

    /* the System Broker identified the caller by its bus
       connection */
    ASSERT_EQ(handler->calls.size(), 2U);
    EXPECT_EQ(handler->calls[0].operation, Operation::GET_ACCOUNTS);
    EXPECT_EQ(handler->calls[0].correlation_id, "corr-1");
    EXPECT_EQ(handler->calls[0].uid, geteuid());
    EXPECT_EQ(handler->calls[1].operation, Operation::ACQUIRE_TOKEN_SILENTLY);
    EXPECT_EQ(handler->calls[1].request_json, R"({"scope":"x"})");
}

TEST_F(BusServiceTest, RelayError)
{
    handler->respond = [](const RecordedCall &) -> std::string {
        throw Error{ErrorCode::NOT_SUPPORTED, "nope"};
    };

    StartService();

    BusRelay relay{milliseconds{5000}, bus.GetAddress()};

    try {
        relay.RemoveAccount("0.1", "c", "{}");
        FAIL();
    } catch (const Error &e) {
        EXPECT_EQ(e.GetCode(), ErrorCode::NOT_SUPPORTED);
        EXPECT_STREQ(e.what(), "nope");
    }
}

TEST_F(BusServiceTest, RelayTimeout)
{
    handler->respond = [](const RecordedCall &call){
        std::this_thread::sleep_for(std::chrono::seconds{1});
        return call.request_json;
    };

    StartService();

    BusRelay relay{milliseconds{200}, bus.GetAddress()};

    const auto start = std::chrono::steady_clock::now();

    try {
        relay.GetAccounts("0.1", "c", "{}");
        FAIL();
    } catch (const Error &e) {
        EXPECT_EQ(e.GetCode(), ErrorCode::TIMEOUT);
    }

    EXPECT_LT(std::chrono::steady_clock::now() - start, milliseconds{900});
}

TEST_F(BusServiceTest, RelayWithoutService)
{
    /* the service is not started, but its name is owned; release
       it so the bus daemon has nobody to deliver to */
    service.reset();

    BusRelay relay{milliseconds{1000}, bus.GetAddress()};

    try {
        relay.GetAccounts("0.1", "c", "{}");
        FAIL();
    } catch (const Error &e) {
        EXPECT_EQ(e.GetCode(), ErrorCode::FAILED);
    }
}
