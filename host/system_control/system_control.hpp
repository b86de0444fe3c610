#pragma once
#include <chrono>
#include <string>

// sd_notify wrappers. Outside systemd (no NOTIFY_SOCKET) every call is a no-op.
namespace system_control {

void notify_ready(const std::string& status);
void notify_status(const std::string& msg);
void notify_stopping();
void notify_watchdog();

// interval the unit asked for, zero when the watchdog is off
std::chrono::microseconds watchdog_interval();

} // namespace system_control
