// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ribbon/RibbonError.hpp"
#include "ribbon/RibbonGlobal.hpp"

#include <QtCore/QString>
#include <QtCore/QVariant>

namespace Ribbon {

enum class SpaceFindMode : unsigned char {
    ColumnWise,
    RowWise
};

enum class ItemSize : unsigned char {
    Small,
    Medium,
    Large
};

struct RIBBON_EXPORT CellPlacement final {
    int row = 0;
    int column = 0;

    bool operator==(const CellPlacement&) const = default;
};

struct RIBBON_EXPORT CellRect final {
    int row = 0;
    int column = 0;
    int rowSpan = 1;
    int columnSpan = 1;

    bool isValid() const { return rowSpan > 0 && columnSpan > 0; }

    bool intersects(const CellRect& other) const
    {
        return row < other.row + other.rowSpan && other.row < row + rowSpan
            && column < other.column + other.columnSpan && other.column < column + columnSpan;
    }

    bool operator==(const CellRect&) const = default;
};

RIBBON_EXPORT QString toString(SpaceFindMode mode);
RIBBON_EXPORT QString toString(ItemSize size);

// Accepts the enumerator name (case-insensitive) or its integer value.
RIBBON_EXPORT RibbonExpected<SpaceFindMode> spaceFindModeFromVariant(const QVariant& value);
RIBBON_EXPORT RibbonExpected<ItemSize> itemSizeFromVariant(const QVariant& value);

} // namespace Ribbon
