// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interfaces.h"

namespace PlasmaBaskets {

// Key functions for interface classes to anchor vtables to this translation unit
// This prevents ODR violations when interfaces are used across shared library boundaries

ISettings::~ISettings() = default;

IBasketSurfaceEvents::~IBasketSurfaceEvents() = default;

IBasketSurface::~IBasketSurface() = default;

ISwitcherEvents::~ISwitcherEvents() = default;

IPresentationLayer::~IPresentationLayer() = default;

IOperationGuards::~IOperationGuards() = default;

IPointerSource::~IPointerSource() = default;

IDisplayTopology::~IDisplayTopology() = default;

} // namespace PlasmaBaskets
