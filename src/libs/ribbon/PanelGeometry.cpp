// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ribbon/PanelGeometry.hpp"

#include <QtCore/QtMath>

namespace Ribbon {

int PanelGeometry::gridHeight(const PanelMetrics& metrics, int panelHeight)
{
    const int h = panelHeight
                  - metrics.contentMargins.top()
                  - metrics.contentMargins.bottom()
                  - metrics.contentSpacing
                  - metrics.titleHeight
                  - metrics.gridMargins.top()
                  - metrics.gridMargins.bottom();
    return qMax(0, h);
}

int PanelGeometry::rowHeight(const PanelMetrics& metrics, int panelHeight, int rows)
{
    if (rows <= 0)
        return 0;

    const int spacing = qMax(0, metrics.gridSpacing);
    const int avail = gridHeight(metrics, panelHeight) - spacing * (rows - 1);
    if (avail <= 0)
        return 0;

    return avail / rows;
}

int PanelGeometry::itemMaximumHeight(const PanelMetrics& metrics, int rowHeight, int rowSpan)
{
    if (rowHeight <= 0 || rowSpan <= 0)
        return 0;

    return rowHeight * rowSpan + qMax(0, metrics.gridSpacing) * (rowSpan - 1);
}

} // namespace Ribbon
