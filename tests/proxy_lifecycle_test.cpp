#include "address_resolver.h"
#include "bacnet_proxy.h"

#include "support/simulated_network.h"

#include <gtest/gtest.h>

#include <thread>

using namespace bacproxy;
using namespace std::chrono_literals;

namespace {

ProxyConfig fastConfig() {
    ProxyConfig config;
    config.idleInterval = 10ms;
    config.apduTimeout = 200ms;
    config.scanWindow = 200ms;
    return config;
}

class ProxyLifecycleTest : public ::testing::Test {
  protected:
    std::shared_ptr<test::SimulatedNetwork> network = std::make_shared<test::SimulatedNetwork>();
    BacnetProxy proxy{fastConfig(), network->factory()};
};

} // namespace

TEST_F(ProxyLifecycleTest, StartsOnRequestedAddress) {
    auto started = proxy.start(std::string("127.0.0.1"));
    ASSERT_TRUE(started) << started.error().describe();
    EXPECT_EQ(started.value(), "127.0.0.1");
    EXPECT_TRUE(proxy.isRunning());

    const auto options = network->lastOptions();
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(formatIp(options->address), "127.0.0.1");
    EXPECT_EQ(options->port, kDefaultBacnetPort);
    EXPECT_TRUE(options->bindWildcard);

    const auto status = proxy.status();
    EXPECT_TRUE(status.running);
    EXPECT_EQ(status.address, "127.0.0.1");
    EXPECT_EQ(status.port, kDefaultBacnetPort);
    EXPECT_EQ(status.pendingExchanges, 0U);
    EXPECT_FALSE(status.scanInProgress);
}

TEST_F(ProxyLifecycleTest, SecondStartIsRejected) {
    ASSERT_TRUE(proxy.start(std::string("127.0.0.1")));
    auto again = proxy.start(std::string("127.0.0.1"));
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().kind, ErrorKind::AlreadyRunning);
    EXPECT_TRUE(proxy.isRunning());
}

TEST_F(ProxyLifecycleTest, StopIsIdempotentAndAllowsRestart) {
    proxy.stop();
    ASSERT_TRUE(proxy.start(std::string("127.0.0.1")));
    proxy.stop();
    EXPECT_FALSE(proxy.isRunning());
    EXPECT_TRUE(network->isClosed());
    proxy.stop();

    EXPECT_FALSE(proxy.status().running);
    EXPECT_EQ(proxy.session().error().kind, ErrorKind::ProxyNotRunning);

    ASSERT_TRUE(proxy.start(std::string("127.0.0.1")));
    EXPECT_FALSE(network->isClosed());
}

TEST_F(ProxyLifecycleTest, RejectsUnusableAddresses) {
    auto malformed = proxy.start(std::string("10.0.0"));
    ASSERT_FALSE(malformed);
    EXPECT_EQ(malformed.error().kind, ErrorKind::BindError);

    // TEST-NET-3, never assigned to a local interface.
    auto foreign = proxy.start(std::string("203.0.113.7"));
    ASSERT_FALSE(foreign);
    EXPECT_EQ(foreign.error().kind, ErrorKind::BindError);

    auto unspecified = proxy.start(std::string("0.0.0.0"));
    ASSERT_FALSE(unspecified);
    EXPECT_EQ(unspecified.error().kind, ErrorKind::BindError);

    EXPECT_FALSE(proxy.isRunning());
    EXPECT_FALSE(network->lastOptions().has_value());
}

TEST_F(ProxyLifecycleTest, FallsBackToConfiguredAddressThenInterface) {
    auto config = fastConfig();
    config.bindAddress = "127.0.0.1";
    config.port = 47809;
    proxy.configure(config);
    auto started = proxy.start();
    ASSERT_TRUE(started) << started.error().describe();
    EXPECT_EQ(started.value(), "127.0.0.1");
    EXPECT_EQ(proxy.status().port, 47809);
    proxy.stop();

    config.bindAddress.clear();
    config.interfaceName = "lo";
    proxy.configure(config);
    started = proxy.start();
    ASSERT_TRUE(started) << started.error().describe();
    EXPECT_EQ(started.value(), "127.0.0.1");
    proxy.stop();

    config.interfaceName = "nosuch0";
    proxy.configure(config);
    started = proxy.start();
    ASSERT_FALSE(started);
    EXPECT_EQ(started.error().kind, ErrorKind::BindError);
}

TEST_F(ProxyLifecycleTest, ReconfigureLeavesRunningSessionAlone) {
    ASSERT_TRUE(proxy.start(std::string("127.0.0.1")));
    auto config = fastConfig();
    config.apduTimeout = 5s;
    proxy.configure(config);

    auto session = proxy.session();
    ASSERT_TRUE(session);
    EXPECT_EQ(session.value()->config().apduTimeout, 200ms);
    EXPECT_EQ(proxy.configuration().apduTimeout, 5s);
}

TEST(ProxyLifecycle, TransportFailureIsReported) {
    BacnetProxy proxy(fastConfig(), [](const TransportOptions &) -> Result<std::shared_ptr<Transport>> {
        return makeError(ErrorKind::BindError, "port in use");
    });
    auto started = proxy.start(std::string("127.0.0.1"));
    ASSERT_FALSE(started);
    EXPECT_EQ(started.error().kind, ErrorKind::BindError);
    EXPECT_FALSE(proxy.isRunning());
}

TEST_F(ProxyLifecycleTest, IgnoresGarbageAndUnmatchedReplies) {
    ASSERT_TRUE(proxy.start(std::string("127.0.0.1")));
    network->inject(test::endpoint("10.0.0.9"), codec::Frame{0x01, 0x02, 0x03});
    network->inject(test::endpoint("10.0.0.9"), codec::encodeSimpleAck(9, codec::ConfirmedService::WriteProperty));
    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(proxy.isRunning());
    EXPECT_EQ(proxy.status().pendingExchanges, 0U);
}
