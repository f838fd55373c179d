// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ribbon/RibbonGlobal.hpp"

#include <QtCore/QMargins>

namespace Ribbon {

struct RIBBON_EXPORT PanelMetrics final {
    QMargins contentMargins{5, 2, 5, 2};
    int contentSpacing = 5;
    int titleHeight = 20;
    QMargins gridMargins{5, 0, 5, 0};
    int gridSpacing = 5;
};

class RIBBON_EXPORT PanelGeometry final
{
public:
    // Height of a single grid row for a panel of the given total height.
    static int rowHeight(const PanelMetrics& metrics, int panelHeight, int rows);

    // Height available to an item spanning rowSpan rows.
    static int itemMaximumHeight(const PanelMetrics& metrics, int rowHeight, int rowSpan);

    // Height of the grid area once title and margins are removed.
    static int gridHeight(const PanelMetrics& metrics, int panelHeight);
};

} // namespace Ribbon
