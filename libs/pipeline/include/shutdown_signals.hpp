// Copyright 2025 Preference Collector Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file shutdown_signals.hpp
/// @brief SIGINT/SIGTERM installation for tools that block on input
///
/// Handlers are installed without SA_RESTART, so a read() blocked on an idle
/// pipe or terminal fails with EINTR when the signal arrives and the reading
/// loop can observe its shutdown flag.

namespace prefcol::pipeline {

using SignalHandler = void (*)(int);

/// Install handler for SIGINT and SIGTERM
/// @return false if sigaction failed for either signal (logged)
bool install_shutdown_handler(SignalHandler handler);

}  // namespace prefcol::pipeline
