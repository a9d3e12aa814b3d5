/*
    OpenSynscan pulse guide driver
    Copyright (C) 2026 OpenSynscan contributors

    This library is free software; you can redistribute it and/or
    modify it under the terms of the GNU Lesser General Public
    License as published by the Free Software Foundation; either
    version 2.1 of the License, or (at your option) any later version.

    This library is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
    Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public
    License along with this library; if not, write to the Free Software
    Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
*/

#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

#include <stdint.h>
#include <stddef.h>
#include <netinet/in.h>

// Well known ports of the OpenSynscan controller
#define OPENSYNSCAN_TX_PORT 5002
#define OPENSYNSCAN_RX_PORT 5003

// Packet sizes
#define OPENSYNSCAN_PULSE_PKT_LEN  8
#define OPENSYNSCAN_BEACON_PKT_LEN 2

// Marker bytes, first byte of every packet
#define OPENSYNSCAN_PULSE_PKT_START  0x35
#define OPENSYNSCAN_BEACON_PKT_START 0x36

// Guide rate limits in deg/s. The rate travels as rate x 10 in one byte.
#define OPENSYNSCAN_DEFAULT_GUIDE_RATE 0.7
#define OPENSYNSCAN_MAX_GUIDE_RATE     25.5

/**************************************************************************
 Packet codec

 Guide command packet (8 bytes):
   0      PULSE_PKT_START
   1      sequence
   2      direction: +DEC = 0, -DEC = 1, +RA = 2, -RA = 3
   3..6   duration in msec, little endian
   7      rate x 10, truncated

 Beacon packet (2 bytes): only byte 0 (BEACON_PKT_START) is meaningful.
**************************************************************************/
namespace OpenSynscan
{

typedef enum { GUIDE_DEC_POS = 0, GUIDE_DEC_NEG = 1, GUIDE_RA_POS = 2, GUIDE_RA_NEG = 3 } GUIDE_DIRECTION;
typedef enum { RA_AXIS, DEC_AXIS } GUIDE_AXIS;

typedef struct
{
    uint8_t sequence;
    GUIDE_DIRECTION direction;
    uint32_t durationMsec;
    uint8_t rateTenths;
} GuideCommand;

typedef enum { PKT_UNKNOWN, PKT_PULSE, PKT_BEACON } PACKET_TYPE;

GUIDE_AXIS axisOf(GUIDE_DIRECTION direction);
const char *directionStr(GUIDE_DIRECTION direction);

// rate (deg/s) to wire byte, truncating. Out of range values wrap like a plain byte cast.
uint8_t rateToTenths(double rate);
double tenthsToRate(uint8_t tenths);

void encodeGuideCommand(const GuideCommand &command, uint8_t packet[OPENSYNSCAN_PULSE_PKT_LEN]);
bool decodeGuideCommand(const uint8_t *packet, size_t len, GuideCommand *command);

PACKET_TYPE classifyPacket(const uint8_t *packet, size_t len);

std::string endpointToString(const sockaddr_in &endpoint);
}

/**
 * @brief OpenSynscanDriver owns the UDP session with an OpenSynscan controller.
 *
 * A listener thread waits on the discovery port for the controller beacon. The sender of the
 * first beacon becomes the device endpoint and the command socket is connected to it. Guide
 * commands are sent three times to the device once discovered, or broadcast once on the
 * command port while it is not. There is no acknowledgment; guiding state is derived from
 * the duration of the last command.
 *
 * The endpoint and the command socket destination are guarded by a single mutex, taken by
 * both the listener and pulse_guide().
 */
class OpenSynscanDriver
{
    public:
        OpenSynscanDriver();
        virtual ~OpenSynscanDriver();

        // Required by the logging macros
        const char *getDeviceName();
        void set_device(const char *name);

        // Session
        bool open_session(uint16_t txPort = OPENSYNSCAN_TX_PORT, uint16_t rxPort = OPENSYNSCAN_RX_PORT);
        void close_session();
        bool is_session_open() const
        {
            return m_SessionOpen;
        }
        uint16_t bound_tx_port() const
        {
            return m_BoundTxPort;
        }
        uint16_t bound_rx_port() const
        {
            return m_BoundRxPort;
        }

        // Discovery
        bool is_discovered();
        bool get_device_endpoint(sockaddr_in *endpoint);

        /**
         * @brief handle_datagram Receive callback of the discovery listener. Never throws.
         * @param data datagram payload
         * @param len payload length
         * @param from sender address
         * @return true if the datagram bound the device endpoint, false if it was discarded.
         */
        bool handle_datagram(const uint8_t *data, size_t len, const sockaddr_in &from);

        // Pulse guide
        bool pulse_guide(OpenSynscan::GUIDE_DIRECTION direction, uint32_t durationMsec);
        bool is_guiding();
        // Sequence carried by the next guide command
        uint8_t get_sequence();

        // Guide rates in deg/s
        double get_guide_rate(OpenSynscan::GUIDE_AXIS axis) const;
        void set_guide_rate(OpenSynscan::GUIDE_AXIS axis, double rate);

    protected:
        // Virtual methods for testing
        virtual int udp_send(const uint8_t *packet, size_t len, const sockaddr_in *destination);
        virtual bool udp_connect(const sockaddr_in &endpoint);
        virtual std::chrono::steady_clock::time_point now();

        void listener_loop();

        std::string m_DeviceName { "OpenSynscan" };

        int m_TxFd { -1 };
        int m_RxFd { -1 };
        uint16_t m_TxPort { OPENSYNSCAN_TX_PORT };
        uint16_t m_BoundTxPort { 0 };
        uint16_t m_BoundRxPort { 0 };

        std::atomic<bool> m_SessionOpen { false };
        std::atomic<bool> m_StopRequested { false };
        std::thread m_ListenerThread;

        // Guards m_Device, m_Discovered and the command socket destination
        std::mutex m_EndpointMutex;
        sockaddr_in m_Device;
        bool m_Discovered { false };

        uint8_t m_Sequence { 1 };
        uint8_t m_Packet[OPENSYNSCAN_PULSE_PKT_LEN];
        std::mutex m_GuideMutex;
        std::chrono::steady_clock::time_point m_GuideDeadline;

        const double m_GuideRateRA { OPENSYNSCAN_DEFAULT_GUIDE_RATE };
        const double m_GuideRateDEC { OPENSYNSCAN_DEFAULT_GUIDE_RATE };

    private:
        int open_socket(uint16_t port, bool broadcast, uint16_t *boundPort);
};
