// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "ribbon/PanelGeometry.hpp"

using Ribbon::PanelGeometry;
using Ribbon::PanelMetrics;

TEST(PanelGeometryTests, GridHeightExcludesTitleAndMargins)
{
    const PanelMetrics metrics;
    EXPECT_EQ(PanelGeometry::gridHeight(metrics, 200), 171);
    EXPECT_EQ(PanelGeometry::gridHeight(metrics, 10), 0);
}

TEST(PanelGeometryTests, RowHeightSharesGridAfterSpacing)
{
    const PanelMetrics metrics;
    EXPECT_EQ(PanelGeometry::rowHeight(metrics, 200, 6), 24);
    EXPECT_EQ(PanelGeometry::rowHeight(metrics, 200, 1), 171);
    EXPECT_EQ(PanelGeometry::rowHeight(metrics, 200, 0), 0);
    EXPECT_EQ(PanelGeometry::rowHeight(metrics, 30, 3), 0);
}

TEST(PanelGeometryTests, ItemHeightIncludesInnerSpacing)
{
    const PanelMetrics metrics;
    EXPECT_EQ(PanelGeometry::itemMaximumHeight(metrics, 24, 1), 24);
    EXPECT_EQ(PanelGeometry::itemMaximumHeight(metrics, 24, 2), 53);
    EXPECT_EQ(PanelGeometry::itemMaximumHeight(metrics, 24, 6), 169);
    EXPECT_EQ(PanelGeometry::itemMaximumHeight(metrics, 0, 2), 0);
}

TEST(PanelGeometryTests, CustomMetricsAreHonoured)
{
    PanelMetrics metrics;
    metrics.contentMargins = QMargins(0, 0, 0, 0);
    metrics.contentSpacing = 0;
    metrics.titleHeight = 0;
    metrics.gridSpacing = 0;

    EXPECT_EQ(PanelGeometry::rowHeight(metrics, 90, 3), 30);
    EXPECT_EQ(PanelGeometry::itemMaximumHeight(metrics, 30, 3), 90);
}
