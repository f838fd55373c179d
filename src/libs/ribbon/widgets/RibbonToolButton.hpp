// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ribbon/RibbonGlobal.hpp"
#include "ribbon/RibbonTypes.hpp"

#include <QtWidgets/QToolButton>

namespace Ribbon {

class RIBBON_EXPORT RibbonToolButton final : public QToolButton
{
    Q_OBJECT

public:
    explicit RibbonToolButton(QWidget* parent = nullptr);

    ItemSize buttonSize() const { return m_size; }
    void setButtonSize(ItemSize size);

    bool showText() const { return m_showText; }
    void setShowText(bool show);

    // Caps the icon edge for large buttons; 0 restores the style default.
    void setMaximumIconSize(int px);

private:
    void applyPresentation();

    ItemSize m_size = ItemSize::Large;
    bool m_showText = true;
    int m_maximumIconPx = 0;
};

} // namespace Ribbon
