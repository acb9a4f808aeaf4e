// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#include "shutdown_signals.hpp"

#include <glog/logging.h>

#include <csignal>

namespace prefcol::pipeline {

bool install_shutdown_handler(SignalHandler handler) {
    struct sigaction action {};
    action.sa_handler = handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;  // no SA_RESTART: blocking reads return EINTR

    bool ok = true;
    for (int sig : {SIGINT, SIGTERM}) {
        if (sigaction(sig, &action, nullptr) != 0) {
            PLOG(ERROR) << "Failed to install handler for signal " << sig;
            ok = false;
        }
    }
    return ok;
}

}  // namespace prefcol::pipeline
