#ifndef RUNTIME_MODULE_OPTIONS_H
#define RUNTIME_MODULE_OPTIONS_H

// Compile-time toggles for the control plane. Set these via build flags or
// by defining them before including this header.
// Example: add -DRADIO_ENABLE_SHUTDOWN_COMMAND=1 for kiosk builds that let
// the web UI power the appliance off.

#ifndef RADIO_ENABLE_CLI
#define RADIO_ENABLE_CLI 1
#endif

// Admits "sudo shutdown -h now" through the command whitelist.
#ifndef RADIO_ENABLE_SHUTDOWN_COMMAND
#define RADIO_ENABLE_SHUTDOWN_COMMAND 0
#endif

// Used when neither the settings file nor RADIO_HARDWARE_VARIANT names one.
#ifndef RADIO_DEFAULT_HARDWARE_VARIANT
#define RADIO_DEFAULT_HARDWARE_VARIANT "rotary"
#endif

#endif  // RUNTIME_MODULE_OPTIONS_H
