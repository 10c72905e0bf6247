// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "plasmabaskets_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for PlasmaBaskets
 *
 * Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcBasket) << "Debug message";
 *   qCInfo(lcRegistry) << "Info message";
 *   qCWarning(lcDbus) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="plasmabaskets.*=true"                 # Enable all
 *   QT_LOGGING_RULES="plasmabaskets.*.debug=false"          # Disable debug only
 *   QT_LOGGING_RULES="plasmabaskets.daemon.autohide=true"   # Auto-hide ticks only
 *
 * Severity Guidelines:
 *   qCDebug    - Guard rejections, per-tick tracing
 *   qCInfo     - Lifecycle events (spawn, merge, auto-hide commit, close-all)
 *   qCWarning  - Invalid external input, missing collaborators
 *   qCCritical - Failures preventing the daemon from running
 */

namespace PlasmaBaskets {

// Core module - item model, collections, display resolution
PLASMABASKETS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)

// Daemon module - baskets, scheduler, routing, registry, presentation
PLASMABASKETS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDaemon)
PLASMABASKETS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcBasket)
PLASMABASKETS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcAutoHide)
PLASMABASKETS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcRouting)
PLASMABASKETS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcRegistry)
PLASMABASKETS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcPresentation)

// D-Bus module
PLASMABASKETS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDbus)

// Configuration module - settings loading/saving
PLASMABASKETS_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

} // namespace PlasmaBaskets
