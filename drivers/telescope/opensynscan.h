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

#include "indiguiderinterface.h"
#include "inditelescope.h"
#include "opensynscandriver.h"

#include <memory>

/**
 * @brief The OpenSynscanTelescope class exposes an OpenSynscan controller as an INDI guider.
 *
 * The controller is found on the local network from its UDP beacon, no serial or TCP
 * connection is involved. Only timed guide pulses are supported: the mount has no goto,
 * sync, park or tracking control through this driver.
 *
 * Guide pulses are reported busy until their duration elapses, the controller does not
 * send any completion notice.
 */
class OpenSynscanTelescope : public INDI::Telescope, public INDI::GuiderInterface
{
    public:
        OpenSynscanTelescope();
        virtual ~OpenSynscanTelescope() = default;

        virtual const char *getDefaultName() override;
        virtual bool Connect() override;
        virtual bool Disconnect() override;
        virtual bool ReadScopeStatus() override;
        virtual bool initProperties() override;
        virtual void ISGetProperties(const char *dev) override;
        virtual bool updateProperties() override;
        virtual bool ISNewNumber(const char *dev, const char *name, double values[], char *names[], int n) override;

    protected:
        // Takes ownership of the protocol driver
        explicit OpenSynscanTelescope(OpenSynscanDriver *protocolDriver);

        virtual IPState GuideNorth(uint32_t ms) override;
        virtual IPState GuideSouth(uint32_t ms) override;
        virtual IPState GuideEast(uint32_t ms) override;
        virtual IPState GuideWest(uint32_t ms) override;

        virtual bool saveConfigItems(FILE *fp) override;

        std::unique_ptr<OpenSynscanDriver> driver;

        INDI::PropertyNumber UdpPortsNP {2};
        enum
        {
            PORT_TX,
            PORT_RX
        };

        INDI::PropertyNumber GuideRateNP {2};
        enum
        {
            GUIDE_RATE_WE,
            GUIDE_RATE_NS
        };

        INDI::PropertyText DeviceAddressTP {1};

    private:
        IPState Guide(OpenSynscan::GUIDE_DIRECTION direction, uint32_t ms);
        void updateDeviceAddress();

        bool guidingNS { false };
        bool guidingWE { false };
        bool lastDiscovered { false };
};
