// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

/* well-known names, object paths and interfaces of the broker bus
   objects */

namespace Broker::SystemBroker {

static constexpr const char *NAME = "org.samba.himmelblau";
static constexpr const char *PATH = "/org/samba/himmelblau";
static constexpr const char *INTERFACE = "org.samba.himmelblau";

} // namespace Broker::SystemBroker

namespace Broker::SessionBroker {

static constexpr const char *NAME = "com.microsoft.identity.broker1";
static constexpr const char *PATH = "/com/microsoft/identity/broker1";
static constexpr const char *INTERFACE = "com.microsoft.identity.Broker1";

} // namespace Broker::SessionBroker

namespace Broker::DeviceBroker {

static constexpr const char *NAME = "com.microsoft.identity.DeviceBroker1";
static constexpr const char *PATH = "/com/microsoft/identity/devicebroker1";
static constexpr const char *INTERFACE = "com.microsoft.identity.DeviceBroker1";

} // namespace Broker::DeviceBroker
