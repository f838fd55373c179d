// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ribbon/GridAllocator.hpp"

#include <QtCore/QDebug>

#include <limits>

namespace Ribbon {

OccupancyGrid::OccupancyGrid(int rows)
    : m_rows(qMax(1, rows))
    , m_columns(1)
    , m_cells(m_rows * m_columns, true)
{
}

bool OccupancyGrid::isFree(int row, int column) const
{
    if (row < 0 || row >= m_rows || column < 0 || column >= m_columns)
        return false;
    return m_cells.at(index(row, column));
}

bool OccupancyGrid::isRegionFree(const CellRect& rect) const
{
    if (!rect.isValid())
        return false;
    if (rect.row < 0 || rect.column < 0)
        return false;
    if (rect.row + rect.rowSpan > m_rows || rect.column + rect.columnSpan > m_columns)
        return false;

    for (int r = rect.row; r < rect.row + rect.rowSpan; ++r) {
        for (int c = rect.column; c < rect.column + rect.columnSpan; ++c) {
            if (!m_cells.at(index(r, c)))
                return false;
        }
    }
    return true;
}

bool OccupancyGrid::canAppendColumns(int count) const
{
    if (count < 0)
        return false;
    const qint64 cells = qint64(m_rows) * (qint64(m_columns) + count);
    return cells <= std::numeric_limits<int>::max();
}

bool OccupancyGrid::isColumnFree(int column) const
{
    return isRegionFree(CellRect{0, column, m_rows, 1});
}

int OccupancyGrid::freeCount() const
{
    return static_cast<int>(m_cells.count(true));
}

void OccupancyGrid::occupy(const CellRect& rect)
{
    Q_ASSERT(rect.row >= 0 && rect.row + rect.rowSpan <= m_rows);
    Q_ASSERT(rect.column >= 0 && rect.column + rect.columnSpan <= m_columns);

    for (int r = rect.row; r < rect.row + rect.rowSpan; ++r) {
        for (int c = rect.column; c < rect.column + rect.columnSpan; ++c)
            m_cells[index(r, c)] = false;
    }
}

void OccupancyGrid::appendColumns(int count)
{
    if (count <= 0)
        return;
    Q_ASSERT(canAppendColumns(count));

    const int newColumns = m_columns + count;
    QList<bool> grown(m_rows * newColumns, true);
    for (int r = 0; r < m_rows; ++r) {
        for (int c = 0; c < m_columns; ++c)
            grown[r * newColumns + c] = m_cells.at(index(r, c));
    }

    m_cells = std::move(grown);
    m_columns = newColumns;
}

GridAllocator::GridAllocator(int rowCount)
    : m_grid(rowCount)
{
}

RibbonExpected<GridAllocator> GridAllocator::create(int rowCount)
{
    if (rowCount <= 0) {
        return ribbonFailure(RibbonErrorCode::InvalidArgument,
                             QString("Grid allocator: row count must be positive, got %1.").arg(rowCount));
    }
    return GridAllocator(rowCount);
}

RibbonResult GridAllocator::setRowCount(int rowCount)
{
    if (hasPlacements()) {
        return RibbonResult::failure(RibbonErrorCode::Configuration,
                                     "Grid allocator: the row count cannot change after cells have been placed.");
    }
    if (rowCount <= 0) {
        return RibbonResult::failure(RibbonErrorCode::InvalidArgument,
                                     QString("Grid allocator: row count must be positive, got %1.").arg(rowCount));
    }

    m_grid = OccupancyGrid(rowCount);
    return RibbonResult::success();
}

RibbonExpected<CellPlacement> GridAllocator::requestCells(int rowSpan, int colSpan, SpaceFindMode mode)
{
    if (rowSpan > rowCount()) {
        qCDebug(ribbonlog) << "requestCells: row span" << rowSpan << "exceeds row count" << rowCount();
        return ribbonFailure(RibbonErrorCode::InvalidSpan,
                             QString("Grid allocator: row span %1 exceeds the row count %2.")
                                 .arg(rowSpan).arg(rowCount()));
    }
    if (rowSpan < 1 || colSpan < 1) {
        return ribbonFailure(RibbonErrorCode::InvalidSpan,
                             QString("Grid allocator: invalid span %1x%2.").arg(rowSpan).arg(colSpan));
    }
    // Growth appends at most colSpan columns; the grown grid must stay addressable.
    if (!m_grid.canAppendColumns(colSpan)) {
        qCWarning(ribbonlog) << "requestCells: column span" << colSpan << "would overflow the grid";
        return ribbonFailure(RibbonErrorCode::InvalidSpan,
                             QString("Grid allocator: column span %1 is too large for %2 rows.")
                                 .arg(colSpan).arg(rowCount()));
    }

    std::optional<CellPlacement> placed;
    if (mode == SpaceFindMode::ColumnWise) {
        placed = findColumnWise(rowSpan, colSpan);
        if (placed)
            m_grid.occupy(CellRect{placed->row, placed->column, rowSpan, colSpan});
    } else {
        placed = placeRowWise(colSpan);
    }

    if (!placed)
        placed = growAndPlace(rowSpan, colSpan);

    ++m_placements;
    return *placed;
}

std::optional<CellPlacement> GridAllocator::findColumnWise(int rowSpan, int colSpan) const
{
    const int lastRow = rowCount() - rowSpan;
    const int lastColumn = columnCount() - colSpan;

    for (int r = 0; r <= lastRow; ++r) {
        for (int c = 0; c <= lastColumn; ++c) {
            if (m_grid.isRegionFree(CellRect{r, c, rowSpan, colSpan}))
                return CellPlacement{r, c};
        }
    }
    return std::nullopt;
}

std::optional<CellPlacement> GridAllocator::placeRowWise(int colSpan)
{
    // Only row 0 is reserved here while growAndPlace reserves the full row span.
    // The asymmetry is intentional.
    const int columns = columnCount();

    // First column from which row 0 stays free up to the right edge.
    int start = -1;
    for (int c = columns - 1; c >= 0 && m_grid.isFree(0, c); --c)
        start = c;

    if (start < 0)
        return std::nullopt;

    const int freeRun = columns - start;
    if (freeRun < colSpan)
        m_grid.appendColumns(colSpan - freeRun);

    m_grid.occupy(CellRect{0, start, 1, colSpan});
    return CellPlacement{0, start};
}

CellPlacement GridAllocator::growAndPlace(int rowSpan, int colSpan)
{
    int start = columnCount();
    int appended = colSpan;

    // A fully free trailing column is reused as the first column of the block.
    if (m_grid.isColumnFree(columnCount() - 1)) {
        start -= 1;
        appended -= 1;
    }

    m_grid.appendColumns(appended);
    m_grid.occupy(CellRect{0, start, rowSpan, colSpan});
    return CellPlacement{0, start};
}

} // namespace Ribbon
