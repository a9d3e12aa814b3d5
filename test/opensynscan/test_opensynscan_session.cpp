#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>
#include <string.h>
#include <stdint.h>
#include <chrono>
#include <atomic>
#include <thread>
#include "opensynscandriver.h"


using namespace OpenSynscan;


// A UDP socket on the loopback interface playing the controller
class FakeController {
    public:
        FakeController() {
            fd = socket(AF_INET, SOCK_DGRAM, 0);

            sockaddr_in addr;
            memset(&addr, 0, sizeof(addr));
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = 0;
            bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));

            socklen_t len = sizeof(addr);
            getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len);
            port = ntohs(addr.sin_port);

            timeval tv;
            tv.tv_sec = 2;
            tv.tv_usec = 0;
            setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        }

        ~FakeController() {
            if (fd >= 0)
                close(fd);
        }

        void send_to(uint16_t destPort, const uint8_t *data, size_t len) {
            sockaddr_in dest;
            memset(&dest, 0, sizeof(dest));
            dest.sin_family = AF_INET;
            dest.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            dest.sin_port = htons(destPort);
            sendto(fd, data, len, 0, reinterpret_cast<sockaddr *>(&dest), sizeof(dest));
        }

        ssize_t receive(uint8_t *buffer, size_t len) {
            return recv(fd, buffer, len, 0);
        }

        int fd { -1 };
        uint16_t port { 0 };
};

static bool wait_for_discovery(OpenSynscanDriver &driver) {
    for (int i = 0; i < 300; i++) {
        if (driver.is_discovered())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}


TEST(OpenSynscanSessionTest, discoversControllerOnLoopback) {
    OpenSynscanDriver driver;
    FakeController controller;
    ASSERT_GE(controller.fd, 0);

    ASSERT_TRUE(driver.open_session(0, 0));
    ASSERT_NE(0, driver.bound_rx_port());
    ASSERT_NE(0, driver.bound_tx_port());

    const uint8_t noise[] = { 0x00, 0x00 };
    const uint8_t beacon[OPENSYNSCAN_BEACON_PKT_LEN] = { OPENSYNSCAN_BEACON_PKT_START, 0x00 };
    controller.send_to(driver.bound_rx_port(), noise, sizeof(noise));
    controller.send_to(driver.bound_rx_port(), beacon, sizeof(beacon));

    ASSERT_TRUE(wait_for_discovery(driver));

    sockaddr_in endpoint;
    ASSERT_TRUE(driver.get_device_endpoint(&endpoint));
    EXPECT_EQ(htonl(INADDR_LOOPBACK), endpoint.sin_addr.s_addr);
    EXPECT_EQ(controller.port, ntohs(endpoint.sin_port));

    EXPECT_TRUE(driver.pulse_guide(GUIDE_DEC_NEG, 250));
    EXPECT_TRUE(driver.is_guiding());

    for (int i = 0; i < 3; i++) {
        uint8_t buffer[32];
        ASSERT_EQ(OPENSYNSCAN_PULSE_PKT_LEN, controller.receive(buffer, sizeof(buffer)));

        GuideCommand command;
        ASSERT_TRUE(decodeGuideCommand(buffer, OPENSYNSCAN_PULSE_PKT_LEN, &command));
        EXPECT_EQ(1, command.sequence);
        EXPECT_EQ(GUIDE_DEC_NEG, command.direction);
        EXPECT_EQ(250u, command.durationMsec);
    }

    driver.close_session();
    EXPECT_FALSE(driver.is_session_open());
    EXPECT_FALSE(driver.is_discovered());
}

TEST(OpenSynscanSessionTest, reconnectStartsUndiscovered) {
    OpenSynscanDriver driver;
    FakeController controller;
    const uint8_t beacon[OPENSYNSCAN_BEACON_PKT_LEN] = { OPENSYNSCAN_BEACON_PKT_START, 0x00 };

    ASSERT_TRUE(driver.open_session(0, 0));
    controller.send_to(driver.bound_rx_port(), beacon, sizeof(beacon));
    ASSERT_TRUE(wait_for_discovery(driver));
    driver.close_session();

    ASSERT_TRUE(driver.open_session(0, 0));
    EXPECT_FALSE(driver.is_discovered());
    EXPECT_EQ(1, driver.get_sequence());

    // The listener is armed again for the new session
    controller.send_to(driver.bound_rx_port(), beacon, sizeof(beacon));
    EXPECT_TRUE(wait_for_discovery(driver));
    driver.close_session();
}

TEST(OpenSynscanSessionTest, failsWhenPortIsTaken) {
    // Bound without SO_REUSEADDR, so the driver cannot share it
    FakeController blocker;
    ASSERT_GE(blocker.fd, 0);

    OpenSynscanDriver driver;
    EXPECT_FALSE(driver.open_session(blocker.port, 0));
    EXPECT_FALSE(driver.is_session_open());

    EXPECT_FALSE(driver.open_session(0, blocker.port));
    EXPECT_FALSE(driver.is_session_open());

    EXPECT_FALSE(driver.pulse_guide(GUIDE_RA_POS, 100));
}

TEST(OpenSynscanSessionTest, closeIsIdempotent) {
    OpenSynscanDriver driver;

    driver.close_session();
    ASSERT_TRUE(driver.open_session(0, 0));
    driver.close_session();
    driver.close_session();
    EXPECT_FALSE(driver.is_session_open());
}

TEST(OpenSynscanSessionTest, secondSessionCannotShareThePorts) {
    OpenSynscanDriver first;
    ASSERT_TRUE(first.open_session(0, 0));

    OpenSynscanDriver second;
    EXPECT_FALSE(second.open_session(first.bound_tx_port(), first.bound_rx_port()));
    EXPECT_FALSE(second.is_session_open());

    EXPECT_FALSE(second.open_session(first.bound_tx_port(), 0));
    EXPECT_FALSE(second.open_session(0, first.bound_rx_port()));
    EXPECT_FALSE(second.is_session_open());

    EXPECT_TRUE(first.is_session_open());
    first.close_session();

    // Free again once the first session is gone
    EXPECT_TRUE(second.open_session(0, 0));
    second.close_session();
}

TEST(OpenSynscanSessionTest, failedStartReportsNoBoundPorts) {
    OpenSynscanDriver first;
    ASSERT_TRUE(first.open_session(0, 0));

    // Command socket binds, discovery port is taken
    OpenSynscanDriver second;
    ASSERT_FALSE(second.open_session(0, first.bound_rx_port()));
    EXPECT_EQ(0, second.bound_tx_port());
    EXPECT_EQ(0, second.bound_rx_port());

    ASSERT_FALSE(second.open_session(first.bound_tx_port(), 0));
    EXPECT_EQ(0, second.bound_tx_port());
    EXPECT_EQ(0, second.bound_rx_port());

    first.close_session();
    EXPECT_EQ(0, first.bound_tx_port());
    EXPECT_EQ(0, first.bound_rx_port());
}

TEST(OpenSynscanSessionTest, closeWhileGuiding) {
    OpenSynscanDriver driver;
    FakeController controller;
    const uint8_t beacon[OPENSYNSCAN_BEACON_PKT_LEN] = { OPENSYNSCAN_BEACON_PKT_START, 0x00 };

    ASSERT_TRUE(driver.open_session(0, 0));
    controller.send_to(driver.bound_rx_port(), beacon, sizeof(beacon));
    ASSERT_TRUE(wait_for_discovery(driver));

    std::atomic<bool> running { true };
    std::thread guider([&driver, &running]() {
        while (running)
            driver.pulse_guide(GUIDE_RA_POS, 10);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    driver.close_session();
    running = false;
    guider.join();

    EXPECT_FALSE(driver.is_session_open());
    EXPECT_FALSE(driver.pulse_guide(GUIDE_RA_POS, 10));
    EXPECT_FALSE(driver.is_guiding());
}
