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

#include "opensynscan.h"
#include "config.h"

#include <cstring>
#include <memory>

// We declare an auto pointer to OpenSynscanTelescope.
static std::unique_ptr<OpenSynscanTelescope> opensynscan(new OpenSynscanTelescope());

using namespace OpenSynscan;

OpenSynscanTelescope::OpenSynscanTelescope(): OpenSynscanTelescope(new OpenSynscanDriver())
{
}

OpenSynscanTelescope::OpenSynscanTelescope(OpenSynscanDriver *protocolDriver): GI(this), driver(protocolDriver)
{
    setVersion(OPENSYNSCAN_VERSION_MAJOR, OPENSYNSCAN_VERSION_MINOR);

    // Guide pulses only, no slew rates either
    SetTelescopeCapability(0, 0);
    setTelescopeConnection(CONNECTION_NONE);
}

const char *OpenSynscanTelescope::getDefaultName()
{
    return "OpenSynscan";
}

bool OpenSynscanTelescope::initProperties()
{
    /* Make sure to init parent properties first */
    INDI::Telescope::initProperties();

    UdpPortsNP[PORT_TX].fill("TX_PORT", "Command port", "%.f", 0, 65535, 1, OPENSYNSCAN_TX_PORT);
    UdpPortsNP[PORT_RX].fill("RX_PORT", "Discovery port", "%.f", 0, 65535, 1, OPENSYNSCAN_RX_PORT);
    UdpPortsNP.fill(getDeviceName(), "UDP_PORTS", "UDP Ports", OPTIONS_TAB, IP_RW, 60, IPS_IDLE);

    /* Controller guide rates, deg/s */
    GuideRateNP[GUIDE_RATE_WE].fill("GUIDE_RATE_WE", "W/E Rate", "%.1f", 0, OPENSYNSCAN_MAX_GUIDE_RATE, 0.1,
                                    driver->get_guide_rate(OpenSynscan::RA_AXIS));
    GuideRateNP[GUIDE_RATE_NS].fill("GUIDE_RATE_NS", "N/S Rate", "%.1f", 0, OPENSYNSCAN_MAX_GUIDE_RATE, 0.1,
                                    driver->get_guide_rate(OpenSynscan::DEC_AXIS));
    GuideRateNP.fill(getDeviceName(), "GUIDE_RATE", "Guiding Rate", MOTION_TAB, IP_RW, 0, IPS_IDLE);

    DeviceAddressTP[0].fill("ADDRESS", "Address", "Not discovered");
    DeviceAddressTP.fill(getDeviceName(), "DEVICE_ADDRESS", "Controller", CONNECTION_TAB, IP_RO, 60, IPS_IDLE);

    GI::initProperties(MOTION_TAB);

    /* Add debug controls so we may debug driver if necessary */
    addDebugControl();

    setDriverInterface(getDriverInterface() | GUIDER_INTERFACE);

    setDefaultPollingPeriod(250);

    return true;
}

void OpenSynscanTelescope::ISGetProperties(const char *dev)
{
    /* First we let our parent populate */
    INDI::Telescope::ISGetProperties(dev);

    defineProperty(UdpPortsNP);
    UdpPortsNP.load();
}

bool OpenSynscanTelescope::updateProperties()
{
    INDI::Telescope::updateProperties();

    if (isConnected())
    {
        defineProperty(GuideRateNP);

        lastDiscovered = false;
        DeviceAddressTP[0].setText("Not discovered");
        DeviceAddressTP.setState(IPS_IDLE);
        defineProperty(DeviceAddressTP);
    }
    else
    {
        deleteProperty(GuideRateNP);
        deleteProperty(DeviceAddressTP);
    }

    GI::updateProperties();

    return true;
}

bool OpenSynscanTelescope::Connect()
{
    driver->set_device(getDeviceName());

    uint16_t txPort = static_cast<uint16_t>(UdpPortsNP[PORT_TX].getValue());
    uint16_t rxPort = static_cast<uint16_t>(UdpPortsNP[PORT_RX].getValue());

    if (!driver->open_session(txPort, rxPort))
    {
        LOGF_ERROR("Failed to start OpenSynscan session on UDP ports %u/%u. Check that they are not in use.",
                   txPort, rxPort);
        return false;
    }

    guidingNS = false;
    guidingWE = false;

    LOGF_INFO("%s session started, waiting for controller beacon.", OPENSYNSCAN_DESCRIPTION);
    SetTimer(getCurrentPollingPeriod());

    return true;
}

bool OpenSynscanTelescope::Disconnect()
{
    driver->close_session();
    guidingNS = false;
    guidingWE = false;

    LOG_INFO("OpenSynscan session closed.");
    return true;
}

bool OpenSynscanTelescope::ReadScopeStatus()
{
    updateDeviceAddress();

    // A single deadline covers both axes, the last command decides
    if ((guidingNS || guidingWE) && !driver->is_guiding())
    {
        if (guidingWE)
        {
            GuideWENP[0].setValue(0);
            GuideWENP[1].setValue(0);
            GuideComplete(INDI_EQ_AXIS::AXIS_RA);
            guidingWE = false;
        }

        if (guidingNS)
        {
            GuideNSNP[0].setValue(0);
            GuideNSNP[1].setValue(0);
            GuideComplete(INDI_EQ_AXIS::AXIS_DE);
            guidingNS = false;
        }
    }

    return true;
}

void OpenSynscanTelescope::updateDeviceAddress()
{
    sockaddr_in endpoint;
    bool discovered = driver->get_device_endpoint(&endpoint);

    if (discovered == lastDiscovered)
        return;

    lastDiscovered = discovered;

    if (discovered)
    {
        DeviceAddressTP[0].setText(endpointToString(endpoint).c_str());
        DeviceAddressTP.setState(IPS_OK);
    }
    else
    {
        DeviceAddressTP[0].setText("Not discovered");
        DeviceAddressTP.setState(IPS_IDLE);
    }

    DeviceAddressTP.apply();
}

bool OpenSynscanTelescope::ISNewNumber(const char *dev, const char *name, double values[], char *names[], int n)
{
    // Check guider interface
    if (GI::processNumber(dev, name, values, names, n))
        return true;

    if (dev != nullptr && strcmp(dev, getDeviceName()) == 0)
    {
        if (UdpPortsNP.isNameMatch(name))
        {
            if (isConnected())
            {
                LOG_ERROR("Disconnect before changing the UDP ports.");
                UdpPortsNP.setState(IPS_ALERT);
                UdpPortsNP.apply();
                return true;
            }

            UdpPortsNP.update(values, names, n);
            UdpPortsNP.setState(IPS_OK);
            UdpPortsNP.apply();
            saveConfig(true, UdpPortsNP.getName());
            return true;
        }

        // Rate changes are accepted but the controller keeps its session default.
        if (GuideRateNP.isNameMatch(name))
        {
            for (int i = 0; i < n; i++)
            {
                if (GuideRateNP[GUIDE_RATE_WE].isNameMatch(names[i]))
                    driver->set_guide_rate(OpenSynscan::RA_AXIS, values[i]);
                else if (GuideRateNP[GUIDE_RATE_NS].isNameMatch(names[i]))
                    driver->set_guide_rate(OpenSynscan::DEC_AXIS, values[i]);
            }

            GuideRateNP[GUIDE_RATE_WE].setValue(driver->get_guide_rate(OpenSynscan::RA_AXIS));
            GuideRateNP[GUIDE_RATE_NS].setValue(driver->get_guide_rate(OpenSynscan::DEC_AXIS));
            GuideRateNP.setState(IPS_OK);
            GuideRateNP.apply();
            return true;
        }
    }

    return INDI::Telescope::ISNewNumber(dev, name, values, names, n);
}

IPState OpenSynscanTelescope::GuideNorth(uint32_t ms)
{
    return Guide(GUIDE_DEC_POS, ms);
}

IPState OpenSynscanTelescope::GuideSouth(uint32_t ms)
{
    return Guide(GUIDE_DEC_NEG, ms);
}

IPState OpenSynscanTelescope::GuideEast(uint32_t ms)
{
    return Guide(GUIDE_RA_POS, ms);
}

IPState OpenSynscanTelescope::GuideWest(uint32_t ms)
{
    return Guide(GUIDE_RA_NEG, ms);
}

// common function to start guiding for all axes.
IPState OpenSynscanTelescope::Guide(GUIDE_DIRECTION direction, uint32_t ms)
{
    LOGF_DEBUG("GUIDE CMD: %s %u ms", directionStr(direction), ms);

    if (!driver->is_session_open())
    {
        LOG_ERROR("Cannot guide, OpenSynscan session is not open.");
        return IPS_ALERT;
    }

    // Send failures are logged by the driver, guiding carries on regardless
    if (!driver->pulse_guide(direction, ms))
        LOG_WARN("Guide command may not have reached the controller.");

    if (axisOf(direction) == OpenSynscan::RA_AXIS)
        guidingWE = true;
    else
        guidingNS = true;

    return IPS_BUSY;
}

bool OpenSynscanTelescope::saveConfigItems(FILE *fp)
{
    INDI::Telescope::saveConfigItems(fp);

    UdpPortsNP.save(fp);

    return true;
}
