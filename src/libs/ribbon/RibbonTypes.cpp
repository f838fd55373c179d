// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ribbon/RibbonTypes.hpp"

namespace Ribbon {

QString toString(SpaceFindMode mode)
{
    switch (mode) {
    case SpaceFindMode::ColumnWise: return QStringLiteral("ColumnWise");
    case SpaceFindMode::RowWise: return QStringLiteral("RowWise");
    }
    return QStringLiteral("ColumnWise");
}

QString toString(ItemSize size)
{
    switch (size) {
    case ItemSize::Small: return QStringLiteral("Small");
    case ItemSize::Medium: return QStringLiteral("Medium");
    case ItemSize::Large: return QStringLiteral("Large");
    }
    return QStringLiteral("Small");
}

RibbonExpected<SpaceFindMode> spaceFindModeFromVariant(const QVariant& value)
{
    if (value.typeId() == QMetaType::QString) {
        const QString s = value.toString().trimmed();
        if (s.compare(u"ColumnWise", Qt::CaseInsensitive) == 0)
            return SpaceFindMode::ColumnWise;
        if (s.compare(u"RowWise", Qt::CaseInsensitive) == 0)
            return SpaceFindMode::RowWise;
        return ribbonFailure(RibbonErrorCode::InvalidArgument, QString("Unknown space find mode '%1'.").arg(s));
    }

    bool ok = false;
    const int v = value.toInt(&ok);
    if (ok && v == 0)
        return SpaceFindMode::ColumnWise;
    if (ok && v == 1)
        return SpaceFindMode::RowWise;

    return ribbonFailure(RibbonErrorCode::InvalidArgument,
                         QString("Unknown space find mode '%1'.").arg(value.toString()));
}

RibbonExpected<ItemSize> itemSizeFromVariant(const QVariant& value)
{
    if (value.typeId() == QMetaType::QString) {
        const QString s = value.toString().trimmed();
        if (s.compare(u"Small", Qt::CaseInsensitive) == 0)
            return ItemSize::Small;
        if (s.compare(u"Medium", Qt::CaseInsensitive) == 0)
            return ItemSize::Medium;
        if (s.compare(u"Large", Qt::CaseInsensitive) == 0)
            return ItemSize::Large;
        return ribbonFailure(RibbonErrorCode::InvalidArgument, QString("Unknown item size '%1'.").arg(s));
    }

    bool ok = false;
    const int v = value.toInt(&ok);
    if (ok && v >= 0 && v <= static_cast<int>(ItemSize::Large))
        return static_cast<ItemSize>(v);

    return ribbonFailure(RibbonErrorCode::InvalidArgument,
                         QString("Unknown item size '%1'.").arg(value.toString()));
}

} // namespace Ribbon
