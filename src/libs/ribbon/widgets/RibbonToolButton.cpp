// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ribbon/widgets/RibbonToolButton.hpp"

#include "ribbon/widgets/RibbonStyle.hpp"

#include <QtWidgets/QSizePolicy>

namespace Ribbon {

RibbonToolButton::RibbonToolButton(QWidget* parent)
    : QToolButton(parent)
{
    setObjectName("RibbonToolButton");
    setAutoRaise(true);
    applyPresentation();
}

void RibbonToolButton::setButtonSize(ItemSize size)
{
    if (m_size == size)
        return;
    m_size = size;
    applyPresentation();
}

void RibbonToolButton::setShowText(bool show)
{
    if (m_showText == show)
        return;
    m_showText = show;
    applyPresentation();
}

void RibbonToolButton::setMaximumIconSize(int px)
{
    m_maximumIconPx = qMax(0, px);
    applyPresentation();
}

void RibbonToolButton::applyPresentation()
{
    int iconPx = RibbonStyle::iconPxFor(m_size);
    if (m_size == ItemSize::Large && m_maximumIconPx > 0)
        iconPx = qMin(iconPx, m_maximumIconPx);
    setIconSize(QSize(iconPx, iconPx));

    if (!m_showText)
        setToolButtonStyle(Qt::ToolButtonIconOnly);
    else if (m_size == ItemSize::Large)
        setToolButtonStyle(Qt::ToolButtonTextUnderIcon);
    else
        setToolButtonStyle(Qt::ToolButtonTextBesideIcon);

    if (m_size == ItemSize::Large) {
        setSizePolicy(QSizePolicy::Preferred, QSizePolicy::Expanding);
        setMinimumWidth(RibbonStyle::LargeButtonMinWidth);
    } else {
        setSizePolicy(QSizePolicy::Preferred, QSizePolicy::Fixed);
        setMinimumWidth(RibbonStyle::SmallButtonMinWidth);
    }

    setProperty("ribbonVisualSize", toString(m_size).toLower());
}

} // namespace Ribbon
