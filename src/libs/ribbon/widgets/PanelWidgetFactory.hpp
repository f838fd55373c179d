// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ribbon/PanelItemRegistry.hpp"
#include "ribbon/RibbonGlobal.hpp"
#include "ribbon/RibbonPanel.hpp"

class QWidget;

namespace Ribbon {

// Turns panel items into concrete Qt widgets. Returns nullptr when an item
// cannot be materialized (a custom item without a factory, a button whose
// action is gone).
class RIBBON_EXPORT PanelWidgetFactory final
{
public:
    using Builder = QWidget* (*)(const PanelItem& item, QWidget* parent);

    static QWidget* create(const PanelItem& item, QWidget* parent);
    static Builder builderFor(PanelItemKind kind);
};

} // namespace Ribbon
