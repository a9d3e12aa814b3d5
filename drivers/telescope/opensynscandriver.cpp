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

#include "indilogger.h"
#include "opensynscandriver.h"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

// Listener wakes up this often to check for session close
#define OPENSYNSCAN_POLL_MS 250
// Unicast sends per guide command. No ack exists, this is the only loss protection.
#define OPENSYNSCAN_REPEAT  3
// Large enough to read any stray datagram in one go, only byte 0 is inspected
#define OPENSYNSCAN_RX_BUFFER_SIZE 64

using namespace OpenSynscan;

GUIDE_AXIS OpenSynscan::axisOf(GUIDE_DIRECTION direction)
{
    return (direction == GUIDE_RA_POS || direction == GUIDE_RA_NEG) ? RA_AXIS : DEC_AXIS;
}

const char *OpenSynscan::directionStr(GUIDE_DIRECTION direction)
{
    switch (direction)
    {
        case GUIDE_DEC_POS:
            return "+DEC";
        case GUIDE_DEC_NEG:
            return "-DEC";
        case GUIDE_RA_POS:
            return "+RA";
        case GUIDE_RA_NEG:
            return "-RA";
    }

    return "?";
}

uint8_t OpenSynscan::rateToTenths(double rate)
{
    // Go through a wide integer so out of range rates wrap instead of being undefined
    return static_cast<uint8_t>(static_cast<int64_t>(rate * 10.0));
}

double OpenSynscan::tenthsToRate(uint8_t tenths)
{
    return tenths / 10.0;
}

void OpenSynscan::encodeGuideCommand(const GuideCommand &command, uint8_t packet[OPENSYNSCAN_PULSE_PKT_LEN])
{
    packet[0] = OPENSYNSCAN_PULSE_PKT_START;
    packet[1] = command.sequence;
    packet[2] = static_cast<uint8_t>(command.direction);
    for (int i = 0; i < 4; i++)
        packet[3 + i] = static_cast<uint8_t>((command.durationMsec >> (8 * i)) & 0xFF);
    packet[7] = command.rateTenths;
}

bool OpenSynscan::decodeGuideCommand(const uint8_t *packet, size_t len, GuideCommand *command)
{
    if (packet == nullptr || len < OPENSYNSCAN_PULSE_PKT_LEN || packet[0] != OPENSYNSCAN_PULSE_PKT_START)
        return false;

    if (packet[2] > GUIDE_RA_NEG)
        return false;

    command->sequence  = packet[1];
    command->direction = static_cast<GUIDE_DIRECTION>(packet[2]);
    command->durationMsec = 0;
    for (int i = 0; i < 4; i++)
        command->durationMsec |= static_cast<uint32_t>(packet[3 + i]) << (8 * i);
    command->rateTenths = packet[7];
    return true;
}

PACKET_TYPE OpenSynscan::classifyPacket(const uint8_t *packet, size_t len)
{
    if (packet == nullptr || len == 0)
        return PKT_UNKNOWN;

    switch (packet[0])
    {
        case OPENSYNSCAN_BEACON_PKT_START:
            return PKT_BEACON;
        case OPENSYNSCAN_PULSE_PKT_START:
            return PKT_PULSE;
        default:
            return PKT_UNKNOWN;
    }
}

std::string OpenSynscan::endpointToString(const sockaddr_in &endpoint)
{
    char address[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &endpoint.sin_addr, address, sizeof(address)) == nullptr)
        return "invalid";

    return std::string(address) + ":" + std::to_string(ntohs(endpoint.sin_port));
}

/**************************************************************************
 OpenSynscanDriver
**************************************************************************/
OpenSynscanDriver::OpenSynscanDriver()
{
    memset(&m_Device, 0, sizeof(m_Device));
    memset(m_Packet, 0, sizeof(m_Packet));
}

OpenSynscanDriver::~OpenSynscanDriver()
{
    close_session();
}

// This method is required by the logging macros
const char *OpenSynscanDriver::getDeviceName()
{
    return m_DeviceName.c_str();
}

void OpenSynscanDriver::set_device(const char *name)
{
    m_DeviceName = name;
}

/*****************************************************************
    Open the command and discovery sockets and start listening
    for the controller beacon. Fails if either socket cannot be
    bound, nothing is left open in that case.
******************************************************************/
bool OpenSynscanDriver::open_session(uint16_t txPort, uint16_t rxPort)
{
    if (m_SessionOpen)
    {
        LOG_WARN("OpenSynscan session is already open.");
        return true;
    }

    m_TxFd = open_socket(txPort, true, &m_BoundTxPort);
    if (m_TxFd < 0)
    {
        LOGF_ERROR("Failed to open command port %u.", txPort);
        m_BoundTxPort = 0;
        return false;
    }

    m_RxFd = open_socket(rxPort, false, &m_BoundRxPort);
    if (m_RxFd < 0)
    {
        LOGF_ERROR("Failed to open discovery port %u.", rxPort);
        close(m_TxFd);
        m_TxFd = -1;
        m_BoundTxPort = 0;
        m_BoundRxPort = 0;
        return false;
    }

    m_TxPort = m_BoundTxPort;

    {
        std::lock_guard<std::mutex> lock(m_EndpointMutex);
        memset(&m_Device, 0, sizeof(m_Device));
        m_Discovered = false;
    }

    {
        std::lock_guard<std::mutex> lock(m_GuideMutex);
        m_Sequence = 1;
        m_GuideDeadline = std::chrono::steady_clock::time_point();
    }

    m_StopRequested = false;
    m_SessionOpen = true;
    m_ListenerThread = std::thread(&OpenSynscanDriver::listener_loop, this);

    LOGF_INFO("Listening for OpenSynscan on UDP port %u, guide commands on port %u.", m_BoundRxPort, m_BoundTxPort);
    return true;
}

void OpenSynscanDriver::close_session()
{
    {
        // Late datagrams see a closed session and are dropped
        std::lock_guard<std::mutex> lock(m_EndpointMutex);
        m_SessionOpen = false;
        m_Discovered = false;
        memset(&m_Device, 0, sizeof(m_Device));
    }

    m_StopRequested = true;
    if (m_ListenerThread.joinable())
        m_ListenerThread.join();

    if (m_RxFd >= 0)
    {
        close(m_RxFd);
        m_RxFd = -1;
        LOG_DEBUG("Discovery socket closed.");
    }

    // Not while a guide command is using it
    std::lock_guard<std::mutex> lock(m_GuideMutex);

    if (m_TxFd >= 0)
    {
        close(m_TxFd);
        m_TxFd = -1;
        LOG_DEBUG("Command socket closed.");
    }

    m_BoundTxPort = 0;
    m_BoundRxPort = 0;
    m_GuideDeadline = std::chrono::steady_clock::time_point();
}

int OpenSynscanDriver::open_socket(uint16_t port, bool broadcast, uint16_t *boundPort)
{
    int sock = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (sock < 0)
    {
        LOGF_ERROR("Failed to create UDP socket: %s", strerror(errno));
        return -1;
    }

    // No SO_REUSEADDR, the ports belong to a single session
    int optval = 1;
    if (broadcast && setsockopt(sock, SOL_SOCKET, SO_BROADCAST, &optval, sizeof(optval)) < 0)
    {
        LOGF_ERROR("Failed to set SO_BROADCAST: %s", strerror(errno));
        close(sock);
        return -1;
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    if (bind(sock, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) < 0)
    {
        LOGF_ERROR("Failed to bind UDP port %u: %s", port, strerror(errno));
        close(sock);
        return -1;
    }

    socklen_t addrLen = sizeof(addr);
    if (getsockname(sock, reinterpret_cast<struct sockaddr *>(&addr), &addrLen) < 0)
    {
        LOGF_ERROR("Failed to read bound port: %s", strerror(errno));
        close(sock);
        return -1;
    }

    *boundPort = ntohs(addr.sin_port);
    return sock;
}

/*****************************************************************
    Discovery listener. Every datagram is inspected and the loop
    is re-armed, whatever the outcome. Only a session close ends it.
******************************************************************/
void OpenSynscanDriver::listener_loop()
{
    uint8_t buffer[OPENSYNSCAN_RX_BUFFER_SIZE];

    LOG_DEBUG("Discovery listener started.");

    while (!m_StopRequested)
    {
        struct pollfd pfd;
        pfd.fd = m_RxFd;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int result = poll(&pfd, 1, OPENSYNSCAN_POLL_MS);
        if (result == 0)
            continue;

        if (result < 0)
        {
            if (errno != EINTR)
            {
                LOGF_DEBUG("Discovery poll error: %s", strerror(errno));
                std::this_thread::sleep_for(std::chrono::milliseconds(OPENSYNSCAN_POLL_MS));
            }
            continue;
        }

        struct sockaddr_in from;
        socklen_t fromLen = sizeof(from);
        memset(&from, 0, sizeof(from));

        ssize_t bytesRead = recvfrom(m_RxFd, buffer, sizeof(buffer), 0, reinterpret_cast<struct sockaddr *>(&from),
                                     &fromLen);
        if (bytesRead < 0)
        {
            LOGF_DEBUG("Discovery receive error: %s", strerror(errno));
            continue;
        }

        handle_datagram(buffer, static_cast<size_t>(bytesRead), from);
    }

    LOG_DEBUG("Discovery listener stopped.");
}

bool OpenSynscanDriver::handle_datagram(const uint8_t *data, size_t len, const sockaddr_in &from)
{
    std::lock_guard<std::mutex> lock(m_EndpointMutex);

    if (!m_SessionOpen)
    {
        LOG_DEBUG("Datagram received while closing session, discarded.");
        return false;
    }

    if (m_Discovered)
        return false;

    if (classifyPacket(data, len) != PKT_BEACON)
    {
        LOGF_DEBUG("Discarded %zu byte datagram from %s.", len, endpointToString(from).c_str());
        return false;
    }

    if (!udp_connect(from))
        return false;

    m_Device = from;
    m_Discovered = true;
    LOGF_INFO("OpenSynscan discovered at %s.", endpointToString(from).c_str());
    return true;
}

bool OpenSynscanDriver::is_discovered()
{
    std::lock_guard<std::mutex> lock(m_EndpointMutex);
    return m_Discovered;
}

bool OpenSynscanDriver::get_device_endpoint(sockaddr_in *endpoint)
{
    std::lock_guard<std::mutex> lock(m_EndpointMutex);
    if (!m_Discovered)
        return false;

    *endpoint = m_Device;
    return true;
}

/*****************************************************************
    Send a guide pulse. The call returns as soon as the datagrams
    are handed to the network. False means at least one send
    failed; the guide deadline is updated in any case.
******************************************************************/
bool OpenSynscanDriver::pulse_guide(GUIDE_DIRECTION direction, uint32_t durationMsec)
{
    std::lock_guard<std::mutex> guideLock(m_GuideMutex);

    if (!m_SessionOpen)
    {
        LOG_ERROR("Cannot send guide command, OpenSynscan session is not open.");
        return false;
    }

    GuideCommand command;
    command.sequence = m_Sequence++;
    command.direction = direction;
    command.durationMsec = durationMsec;
    command.rateTenths = rateToTenths(get_guide_rate(axisOf(direction)));
    encodeGuideCommand(command, m_Packet);

    LOGF_DEBUG("Pulse guide %s %u ms, seq %u, rate %.1f deg/s.", directionStr(direction), durationMsec,
               command.sequence, tenthsToRate(command.rateTenths));

    bool rc = true;
    {
        std::lock_guard<std::mutex> lock(m_EndpointMutex);

        if (m_Discovered)
        {
            for (int i = 0; i < OPENSYNSCAN_REPEAT; i++)
            {
                if (udp_send(m_Packet, OPENSYNSCAN_PULSE_PKT_LEN, nullptr) < 0)
                    rc = false;
            }
        }
        else
        {
            struct sockaddr_in broadcast;
            memset(&broadcast, 0, sizeof(broadcast));
            broadcast.sin_family = AF_INET;
            broadcast.sin_addr.s_addr = htonl(INADDR_BROADCAST);
            broadcast.sin_port = htons(m_TxPort);

            if (udp_send(m_Packet, OPENSYNSCAN_PULSE_PKT_LEN, &broadcast) < 0)
                rc = false;
            LOG_WARN("OpenSynscan not discovered yet, guide command broadcast.");
        }
    }

    m_GuideDeadline = now() + std::chrono::milliseconds(durationMsec);
    return rc;
}

uint8_t OpenSynscanDriver::get_sequence()
{
    std::lock_guard<std::mutex> lock(m_GuideMutex);
    return m_Sequence;
}

// Purely time based, the controller never reports completion.
bool OpenSynscanDriver::is_guiding()
{
    std::lock_guard<std::mutex> lock(m_GuideMutex);
    return now() < m_GuideDeadline;
}

double OpenSynscanDriver::get_guide_rate(GUIDE_AXIS axis) const
{
    return axis == RA_AXIS ? m_GuideRateRA : m_GuideRateDEC;
}

// The controller keeps the session default. Requests are logged only.
void OpenSynscanDriver::set_guide_rate(GUIDE_AXIS axis, double rate)
{
    LOGF_INFO("Guide rate %s %.2f => %.2f deg/s requested, keeping %.2f.", axis == RA_AXIS ? "RA" : "DEC",
              get_guide_rate(axis), rate, get_guide_rate(axis));
}

// Virtual method for testing
int OpenSynscanDriver::udp_send(const uint8_t *packet, size_t len, const sockaddr_in *destination)
{
    ssize_t sent;

    if (destination != nullptr)
        sent = sendto(m_TxFd, packet, len, 0, reinterpret_cast<const struct sockaddr *>(destination),
                      sizeof(*destination));
    else
        sent = send(m_TxFd, packet, len, 0);

    if (sent < 0)
    {
        LOGF_ERROR("Failed to send guide command: %s", strerror(errno));
        return -1;
    }

    return static_cast<int>(sent);
}

// Virtual method for testing
bool OpenSynscanDriver::udp_connect(const sockaddr_in &endpoint)
{
    if (connect(m_TxFd, reinterpret_cast<const struct sockaddr *>(&endpoint), sizeof(endpoint)) < 0)
    {
        LOGF_ERROR("Failed to bind command socket to %s: %s", endpointToString(endpoint).c_str(), strerror(errno));
        return false;
    }

    return true;
}

// Virtual method for testing
std::chrono::steady_clock::time_point OpenSynscanDriver::now()
{
    return std::chrono::steady_clock::now();
}
