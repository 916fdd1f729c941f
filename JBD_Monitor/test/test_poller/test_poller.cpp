
// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------

#include <unity.h>

#include "../../src/ProgramInterfaceSerialJBDBMS.hpp"
#include "../MockTransport.hpp"

using namespace jbd_bms;
using Bytes = std::vector<uint8_t>;

static const Session::Config configSession{ 9600, 100, 1, 10, 10, 0, 0, 0 };
static const ProgramInterfaceSerialJBDBMS::Config configFast{ 20 };
static const ProgramInterfaceSerialJBDBMS::Config configSlow{ 10000 };

class RecordingHandler : public ProgramInterfaceSerialJBDBMS::Handler {
public:
    std::atomic<int> snapshots = 0, errors = 0, stopped = 0;
    void onTelemetry(const TelemetrySnapshot&) override {
        snapshots++;
    }
    void onTelemetryError(const std::exception&) override {
        errors++;
    }
    void onStopped() override {
        stopped++;
    }
};

template<typename F>
static bool waitUntil(F&& condition, const interval_t timeout = 2000) {
    for (const interval_t started = millis(); millis() - started < timeout; delay(5))
        if (condition())
            return true;
    return condition();
}

// -----------------------------------------------------------------------------------------------

void test_poller_delivers_snapshots() {
    auto mock = std::make_shared<MockTransport>(MockDevice::healthy);
    Session session(configSession);
    session.connect(mock);
    RecordingHandler handler;
    ProgramInterfaceSerialJBDBMS poller(configFast, session, handler);
    poller.start();
    TEST_ASSERT_TRUE(poller.running());
    TEST_ASSERT_TRUE(waitUntil([&] { return handler.snapshots >= 3; }));
    poller.stop();
    TEST_ASSERT_FALSE(poller.running());
    TEST_ASSERT_EQUAL(1, handler.stopped.load());
    TEST_ASSERT_EQUAL(0, handler.errors.load());
    TEST_ASSERT_TRUE(poller.polls() >= 3);
    TEST_ASSERT_EQUAL(0, poller.failures());
    TEST_ASSERT_TRUE(poller.latest().has_value());
    TEST_ASSERT_FLOAT_WITHIN(0.001, 13.0, poller.latest()->hardware.voltage);
    TEST_ASSERT_FALSE(mock->overlapped());
}

void test_poller_requires_connected_session() {
    Session session(configSession);
    RecordingHandler handler;
    ProgramInterfaceSerialJBDBMS poller(configFast, session, handler);
    TEST_ASSERT_TRUE(throwsError<TransportError>([&] {
        poller.start();
    }));
    TEST_ASSERT_FALSE(poller.running());
}

void test_poller_stops_on_disconnect() {
    auto mock = std::make_shared<MockTransport>(MockDevice::healthy);
    Session session(configSession);
    session.connect(mock);
    RecordingHandler handler;
    ProgramInterfaceSerialJBDBMS poller(configFast, session, handler);
    poller.start();
    TEST_ASSERT_TRUE(waitUntil([&] { return handler.snapshots >= 1; }));
    session.disconnect();
    TEST_ASSERT_TRUE(waitUntil([&] { return !poller.running(); }));
    TEST_ASSERT_EQUAL(1, handler.stopped.load());
}

void test_poller_counts_failures() {
    auto mock = std::make_shared<MockTransport>([](const Bytes&) { return Bytes(); });
    Session session(configSession);
    session.connect(mock);
    RecordingHandler handler;
    ProgramInterfaceSerialJBDBMS poller(configFast, session, handler);
    poller.start();
    TEST_ASSERT_TRUE(waitUntil([&] { return handler.errors >= 2; }));
    poller.stop();
    TEST_ASSERT_EQUAL(0, handler.snapshots.load());
    TEST_ASSERT_TRUE(poller.failures() >= 2);
    TEST_ASSERT_EQUAL(poller.polls(), poller.failures());
    TEST_ASSERT_FALSE(poller.latest().has_value());
    TEST_ASSERT_TRUE(session.isConnected());
}

void test_poller_stop_wakes_wait() {
    auto mock = std::make_shared<MockTransport>(MockDevice::healthy);
    Session session(configSession);
    session.connect(mock);
    RecordingHandler handler;
    ProgramInterfaceSerialJBDBMS poller(configSlow, session, handler);
    poller.start();
    TEST_ASSERT_TRUE(waitUntil([&] { return handler.snapshots >= 1; }));
    const interval_t started = millis();
    poller.stop();
    TEST_ASSERT_TRUE(millis() - started < 1000);
    TEST_ASSERT_EQUAL(1, handler.snapshots.load());
    // restartable
    poller.start();
    TEST_ASSERT_TRUE(waitUntil([&] { return handler.snapshots >= 2; }));
    poller.stop();
    TEST_ASSERT_EQUAL(2, handler.stopped.load());
}

// -----------------------------------------------------------------------------------------------

void setUp(void) {
}

void tearDown(void) {
}

int main(void) {
    UNITY_BEGIN();

    RUN_TEST(test_poller_delivers_snapshots);
    RUN_TEST(test_poller_requires_connected_session);
    RUN_TEST(test_poller_stops_on_disconnect);
    RUN_TEST(test_poller_counts_failures);
    RUN_TEST(test_poller_stop_wakes_wait);

    return UNITY_END();
}

// -----------------------------------------------------------------------------------------------
// -----------------------------------------------------------------------------------------------
