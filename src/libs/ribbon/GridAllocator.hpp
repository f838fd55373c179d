// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ribbon/RibbonError.hpp"
#include "ribbon/RibbonGlobal.hpp"
#include "ribbon/RibbonTypes.hpp"

#include <QtCore/QList>

#include <optional>

namespace Ribbon {

// Row-major boolean grid with a fixed row count and a growing column count.
// A cell is true while free.
class RIBBON_EXPORT OccupancyGrid final
{
public:
    explicit OccupancyGrid(int rows = 1);

    int rows() const noexcept { return m_rows; }
    int columns() const noexcept { return m_columns; }

    bool isFree(int row, int column) const;
    bool isRegionFree(const CellRect& rect) const;
    bool isColumnFree(int column) const;
    int freeCount() const;

    // Marks every cell of rect occupied. rect must lie inside the grid.
    void occupy(const CellRect& rect);

    // False when count more columns would not fit in an int cell index.
    bool canAppendColumns(int count) const;

    // Appends count all-free columns on the right edge.
    void appendColumns(int count);

private:
    int index(int row, int column) const { return row * m_columns + column; }

    int m_rows = 1;
    int m_columns = 1;
    QList<bool> m_cells;
};

class RIBBON_EXPORT GridAllocator final
{
public:
    static RibbonExpected<GridAllocator> create(int rowCount);

    int rowCount() const noexcept { return m_grid.rows(); }
    int columnCount() const noexcept { return m_grid.columns(); }
    bool isFree(int row, int column) const { return m_grid.isFree(row, column); }
    bool hasPlacements() const noexcept { return m_placements > 0; }
    int freeCellCount() const { return m_grid.freeCount(); }
    const OccupancyGrid& grid() const noexcept { return m_grid; }

    RibbonExpected<CellPlacement> requestCells(int rowSpan = 1,
                                               int colSpan = 1,
                                               SpaceFindMode mode = SpaceFindMode::ColumnWise);

    // Only allowed while nothing has been placed yet.
    RibbonResult setRowCount(int rowCount);

private:
    explicit GridAllocator(int rowCount);

    std::optional<CellPlacement> findColumnWise(int rowSpan, int colSpan) const;
    std::optional<CellPlacement> placeRowWise(int colSpan);
    CellPlacement growAndPlace(int rowSpan, int colSpan);

    OccupancyGrid m_grid;
    int m_placements = 0;
};

} // namespace Ribbon
