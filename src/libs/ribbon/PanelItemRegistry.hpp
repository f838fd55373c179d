// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ribbon/RibbonError.hpp"
#include "ribbon/RibbonGlobal.hpp"
#include "ribbon/RibbonTypes.hpp"

#include <QtCore/QString>
#include <QtCore/QStringList>

#include <cstddef>

namespace Ribbon {

enum class PanelItemKind : quint8 {
    Button,
    SmallButton,
    MediumButton,
    LargeButton,
    ToggleButton,
    SmallToggleButton,
    MediumToggleButton,
    LargeToggleButton,
    ComboBox,
    FontComboBox,
    LineEdit,
    TextEdit,
    PlainTextEdit,
    Label,
    ProgressBar,
    Slider,
    SpinBox,
    DoubleSpinBox,
    DateEdit,
    TimeEdit,
    DateTimeEdit,
    TableWidget,
    TreeWidget,
    ListWidget,
    CalendarWidget,
    Separator,
    HorizontalSeparator,
    VerticalSeparator,
    Gallery,
    Custom
};

inline constexpr std::size_t kPanelItemKindCount = static_cast<std::size_t>(PanelItemKind::Custom) + 1;

struct RIBBON_EXPORT PanelItemTraits final
{
    PanelItemKind kind = PanelItemKind::Custom;
    const char* typeName = "";
    ItemSize defaultSize = ItemSize::Small;
    // Fixed row span that overrides defaultSize; 0 means "use the size".
    int fixedRowSpan = 0;
    int defaultColumnSpan = 1;
    bool hasAction = false;
    bool checkable = false;
};

// Closed table of the stock panel controls, indexed by PanelItemKind.
class RIBBON_EXPORT PanelItemRegistry final
{
public:
    static const PanelItemTraits& traits(PanelItemKind kind);
    static QString typeName(PanelItemKind kind);
    static RibbonExpected<PanelItemKind> kindFromTypeName(const QString& typeName);
    static QStringList typeNames();
};

} // namespace Ribbon
