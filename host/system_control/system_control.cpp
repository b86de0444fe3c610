#include "system_control.hpp"

#include <systemd/sd-daemon.h>

#include <cstdint>
#include <cstring>

#include "logging/logging.hpp"

namespace system_control {

namespace {
constexpr const char* TAG = "SystemControl";

void check(int rc, const char* what) {
    if (rc < 0) LOG_WARN(TAG, "sd_notify({}) failed: {}", what, std::strerror(-rc));
}
} // namespace

void notify_ready(const std::string& status) {
    check(sd_notifyf(0, "READY=1\nSTATUS=%s", status.c_str()), "READY");
}

void notify_status(const std::string& msg) {
    check(sd_notifyf(0, "STATUS=%s", msg.c_str()), "STATUS");
}

void notify_stopping() {
    check(sd_notify(0, "STOPPING=1"), "STOPPING");
}

void notify_watchdog() {
    check(sd_notify(0, "WATCHDOG=1"), "WATCHDOG");
}

std::chrono::microseconds watchdog_interval() {
    uint64_t usec = 0;
    if (sd_watchdog_enabled(0, &usec) <= 0) return std::chrono::microseconds::zero();
    return std::chrono::microseconds(usec);
}

} // namespace system_control
