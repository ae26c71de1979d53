// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#include <ISerialPort.hpp>

#include <csignal>
#include <exception>

#include <signal.h>

#include <spdlog/spdlog.h>

namespace {
volatile sig_atomic_t s_interrupted = 0;

void catch_signals(int sig) {
  s_interrupted = 1;
  signal(sig, catch_signals);
}

void register_signal_handler(int sig, sighandler_t handler) {
  if (::signal(sig, handler) == SIG_ERR) {
    spdlog::warn("Can't register signal handler for {}!", sig);
  }
}

} // namespace

void ISerialPort::install_signal_handlers() {
  register_signal_handler(SIGINT, catch_signals);
  register_signal_handler(SIGTERM, catch_signals);
}

void ISerialPort::request_stop() noexcept { s_interrupted = 1; }

void ISerialPort::ensure_running() {
  // Don't throw if there's already an exception in-flight
  if (s_interrupted && std::uncaught_exceptions() == 0) {
    // reset back interrupt flag
    s_interrupted = 0;
    throw Interrupted{};
  }
}
