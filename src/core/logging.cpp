// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace PlasmaBaskets {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "plasmabaskets.core", QtInfoMsg)

// Daemon module categories
Q_LOGGING_CATEGORY(lcDaemon, "plasmabaskets.daemon", QtInfoMsg)
Q_LOGGING_CATEGORY(lcBasket, "plasmabaskets.daemon.basket", QtInfoMsg)
Q_LOGGING_CATEGORY(lcAutoHide, "plasmabaskets.daemon.autohide", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRouting, "plasmabaskets.daemon.routing", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRegistry, "plasmabaskets.daemon.registry", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPresentation, "plasmabaskets.daemon.presentation", QtInfoMsg)

// D-Bus module categories
Q_LOGGING_CATEGORY(lcDbus, "plasmabaskets.dbus", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "plasmabaskets.config", QtInfoMsg)

} // namespace PlasmaBaskets
