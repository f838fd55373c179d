// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "ribbon/GridAllocator.hpp"

#include <QtCore/QList>

#include <limits>
#include <vector>

using Ribbon::CellPlacement;
using Ribbon::CellRect;
using Ribbon::GridAllocator;
using Ribbon::RibbonErrorCode;
using Ribbon::SpaceFindMode;

namespace {

GridAllocator makeAllocator(int rows)
{
    auto allocator = GridAllocator::create(rows);
    EXPECT_TRUE(allocator.has_value());
    return std::move(*allocator);
}

CellPlacement place(GridAllocator& allocator, int rowSpan, int colSpan,
                    SpaceFindMode mode = SpaceFindMode::ColumnWise)
{
    const auto placed = allocator.requestCells(rowSpan, colSpan, mode);
    EXPECT_TRUE(placed.has_value()) << (placed ? "" : placed.error().message().toStdString());
    return placed.value_or(CellPlacement{-1, -1});
}

} // namespace

TEST(GridAllocatorTests, FreshAllocatorHasOneFreeColumn)
{
    GridAllocator allocator = makeAllocator(6);
    EXPECT_EQ(allocator.rowCount(), 6);
    EXPECT_EQ(allocator.columnCount(), 1);
    EXPECT_EQ(allocator.freeCellCount(), 6);
    EXPECT_FALSE(allocator.hasPlacements());
}

TEST(GridAllocatorTests, CreateRejectsNonPositiveRowCount)
{
    const auto zero = GridAllocator::create(0);
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().code(), RibbonErrorCode::InvalidArgument);

    EXPECT_FALSE(GridAllocator::create(-3).has_value());
}

TEST(GridAllocatorTests, ColumnWiseFillsRowsBeforeGrowing)
{
    GridAllocator allocator = makeAllocator(6);

    EXPECT_EQ(place(allocator, 2, 1), (CellPlacement{0, 0}));
    EXPECT_EQ(place(allocator, 2, 1), (CellPlacement{2, 0}));
    EXPECT_EQ(place(allocator, 2, 1), (CellPlacement{4, 0}));
    EXPECT_EQ(place(allocator, 2, 1), (CellPlacement{0, 1}));
    EXPECT_EQ(allocator.columnCount(), 2);

    EXPECT_FALSE(allocator.isFree(1, 1));
    EXPECT_TRUE(allocator.isFree(2, 1));
}

TEST(GridAllocatorTests, ColumnWiseReusesHolesInEarlierColumns)
{
    GridAllocator allocator = makeAllocator(6);

    EXPECT_EQ(place(allocator, 6, 1), (CellPlacement{0, 0}));
    EXPECT_EQ(place(allocator, 2, 1), (CellPlacement{0, 1}));
    EXPECT_EQ(place(allocator, 3, 2), (CellPlacement{0, 2}));
    EXPECT_EQ(allocator.columnCount(), 4);

    EXPECT_EQ(place(allocator, 2, 1), (CellPlacement{2, 1}));
    EXPECT_EQ(place(allocator, 3, 1), (CellPlacement{3, 2}));
    EXPECT_EQ(allocator.columnCount(), 4);
}

TEST(GridAllocatorTests, RowWiseAdvancesAlongTheFirstRow)
{
    GridAllocator allocator = makeAllocator(6);

    EXPECT_EQ(place(allocator, 1, 2, SpaceFindMode::RowWise), (CellPlacement{0, 0}));
    EXPECT_EQ(place(allocator, 1, 2, SpaceFindMode::RowWise), (CellPlacement{0, 2}));
    EXPECT_EQ(place(allocator, 1, 2, SpaceFindMode::RowWise), (CellPlacement{0, 4}));
    EXPECT_EQ(allocator.columnCount(), 6);

    for (int c = 0; c < 6; ++c) {
        EXPECT_FALSE(allocator.isFree(0, c));
        EXPECT_TRUE(allocator.isFree(1, c));
    }
}

TEST(GridAllocatorTests, RowWiseExtendsAShortFreeRun)
{
    GridAllocator allocator = makeAllocator(3);

    EXPECT_EQ(place(allocator, 1, 3, SpaceFindMode::RowWise), (CellPlacement{0, 0}));
    EXPECT_EQ(allocator.columnCount(), 3);

    EXPECT_EQ(place(allocator, 2, 1), (CellPlacement{1, 0}));
    EXPECT_EQ(place(allocator, 1, 1, SpaceFindMode::RowWise), (CellPlacement{0, 3}));
    EXPECT_EQ(allocator.columnCount(), 4);
}

TEST(GridAllocatorTests, GrowthReusesFullyFreeTrailingColumn)
{
    GridAllocator allocator = makeAllocator(3);

    EXPECT_EQ(place(allocator, 1, 3), (CellPlacement{0, 0}));
    EXPECT_EQ(allocator.columnCount(), 3);
}

TEST(GridAllocatorTests, GrowthAppendsFullSpanWhenTrailingColumnIsUsed)
{
    GridAllocator allocator = makeAllocator(3);

    EXPECT_EQ(place(allocator, 1, 1), (CellPlacement{0, 0}));
    EXPECT_EQ(place(allocator, 3, 1), (CellPlacement{0, 1}));
    EXPECT_EQ(allocator.columnCount(), 2);
    EXPECT_EQ(place(allocator, 3, 2), (CellPlacement{0, 2}));
    EXPECT_EQ(allocator.columnCount(), 4);
}

TEST(GridAllocatorTests, RowSpanLargerThanRowCountFailsWithoutMutation)
{
    GridAllocator allocator = makeAllocator(6);
    place(allocator, 2, 1);
    const int columns = allocator.columnCount();
    const int freeCells = allocator.freeCellCount();

    const auto rejected = allocator.requestCells(7, 1, SpaceFindMode::ColumnWise);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code(), RibbonErrorCode::InvalidSpan);
    EXPECT_FALSE(rejected.error().message().isEmpty());

    EXPECT_EQ(allocator.columnCount(), columns);
    EXPECT_EQ(allocator.freeCellCount(), freeCells);
}

TEST(GridAllocatorTests, NonPositiveSpansAreRejected)
{
    GridAllocator allocator = makeAllocator(3);

    const auto zeroRows = allocator.requestCells(0, 1);
    ASSERT_FALSE(zeroRows.has_value());
    EXPECT_EQ(zeroRows.error().code(), RibbonErrorCode::InvalidSpan);

    const auto zeroColumns = allocator.requestCells(1, 0, SpaceFindMode::RowWise);
    ASSERT_FALSE(zeroColumns.has_value());
    EXPECT_EQ(zeroColumns.error().code(), RibbonErrorCode::InvalidSpan);

    EXPECT_FALSE(allocator.hasPlacements());
}

TEST(GridAllocatorTests, OversizedColumnSpanFailsWithoutMutation)
{
    GridAllocator allocator = makeAllocator(1);
    place(allocator, 1, 1);
    ASSERT_FALSE(allocator.isFree(0, 0));

    const auto huge = allocator.requestCells(1, std::numeric_limits<int>::max());
    ASSERT_FALSE(huge.has_value());
    EXPECT_EQ(huge.error().code(), RibbonErrorCode::InvalidSpan);

    const auto rowWise = allocator.requestCells(1, std::numeric_limits<int>::max(), SpaceFindMode::RowWise);
    ASSERT_FALSE(rowWise.has_value());
    EXPECT_EQ(rowWise.error().code(), RibbonErrorCode::InvalidSpan);

    EXPECT_EQ(allocator.columnCount(), 1);
    EXPECT_EQ(allocator.freeCellCount(), 0);

    GridAllocator twoRows = makeAllocator(2);
    const auto wrapped = twoRows.requestCells(1, 1 << 30);
    ASSERT_FALSE(wrapped.has_value());
    EXPECT_EQ(wrapped.error().code(), RibbonErrorCode::InvalidSpan);
    EXPECT_EQ(twoRows.columnCount(), 1);
    EXPECT_FALSE(twoRows.hasPlacements());

    EXPECT_EQ(place(allocator, 1, 2), (CellPlacement{0, 1}));
    EXPECT_EQ(allocator.columnCount(), 3);
}

TEST(GridAllocatorTests, ColumnWisePlacementsNeverOverlapAndColumnsOnlyGrow)
{
    GridAllocator allocator = makeAllocator(6);

    const std::vector<std::pair<int, int>> requests = {
        {6, 1}, {2, 1}, {3, 2}, {1, 1}, {2, 3}, {4, 1}, {1, 2}, {6, 2}, {3, 1}, {2, 2}, {1, 1}, {5, 1},
    };

    QList<CellRect> rects;
    int lastColumns = allocator.columnCount();
    for (const auto& [rows, cols] : requests) {
        const CellPlacement at = place(allocator, rows, cols);
        const CellRect rect{at.row, at.column, rows, cols};

        EXPECT_GE(allocator.columnCount(), lastColumns);
        lastColumns = allocator.columnCount();

        EXPECT_GE(rect.row, 0);
        EXPECT_LE(rect.row + rect.rowSpan, allocator.rowCount());
        EXPECT_LE(rect.column + rect.columnSpan, allocator.columnCount());

        for (const CellRect& other : std::as_const(rects))
            EXPECT_FALSE(rect.intersects(other)) << "overlap at " << rect.row << "," << rect.column;
        rects.push_back(rect);
    }
}

TEST(GridAllocatorTests, RowCountIsReconfigurableOnlyBeforePlacement)
{
    GridAllocator allocator = makeAllocator(6);
    EXPECT_TRUE(allocator.setRowCount(3));
    EXPECT_EQ(allocator.rowCount(), 3);

    const auto invalid = allocator.setRowCount(0);
    EXPECT_EQ(invalid.code(), RibbonErrorCode::InvalidArgument);

    place(allocator, 1, 1);
    const auto rejected = allocator.setRowCount(4);
    EXPECT_FALSE(rejected.ok());
    EXPECT_EQ(rejected.code(), RibbonErrorCode::Configuration);
    EXPECT_EQ(allocator.rowCount(), 3);
}

TEST(GridAllocatorTests, OccupancyGridAppendsFreeColumns)
{
    Ribbon::OccupancyGrid grid(2);
    grid.occupy(CellRect{0, 0, 2, 1});
    EXPECT_FALSE(grid.isColumnFree(0));

    grid.appendColumns(2);
    EXPECT_EQ(grid.columns(), 3);
    EXPECT_FALSE(grid.isFree(1, 0));
    EXPECT_TRUE(grid.isColumnFree(1));
    EXPECT_TRUE(grid.isRegionFree(CellRect{0, 1, 2, 2}));
    EXPECT_EQ(grid.freeCount(), 4);

    EXPECT_TRUE(grid.canAppendColumns(1));
    EXPECT_FALSE(grid.canAppendColumns(std::numeric_limits<int>::max()));
    EXPECT_FALSE(grid.canAppendColumns(-1));
}
