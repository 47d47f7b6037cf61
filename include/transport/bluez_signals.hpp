// include/transport/bluez_signals.hpp
#pragma once

#if LIFTRR_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace transport
{

// sd-bus handlers; userdata is the BluezRadio::Impl. They run on the radio host
// thread inside process(), with bus_mu held.
int bluez_on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_props_changed(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);
int bluez_on_connect_reply(sd_bus_message *m, void *userdata, sd_bus_error *ret_error);

}  // namespace transport
#endif  // LIFTRR_HAVE_SDBUS
