// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ribbon/widgets/RibbonCategoryWidget.hpp"

#include "ribbon/RibbonCategory.hpp"
#include "ribbon/RibbonPanel.hpp"
#include "ribbon/widgets/RibbonPanelWidget.hpp"
#include "ribbon/widgets/RibbonStyle.hpp"

#include <QtWidgets/QHBoxLayout>
#include <QtWidgets/QMenu>
#include <QtWidgets/QScrollArea>
#include <QtWidgets/QStyle>

namespace Ribbon {

RibbonCategoryWidget::RibbonCategoryWidget(RibbonCategory* category, QWidget* parent)
    : QFrame(parent)
    , m_category(category)
{
    setObjectName("RibbonCategory");
    setFrameShape(QFrame::NoFrame);
    setAttribute(Qt::WA_StyledBackground, true);

    auto* root = new QHBoxLayout(this);
    root->setContentsMargins(0, 0, 0, 0);
    root->setSpacing(0);

    m_scroll = new QScrollArea(this);
    m_scroll->setObjectName("RibbonCategoryScroll");
    m_scroll->setFrameShape(QFrame::NoFrame);
    m_scroll->setWidgetResizable(true);
    m_scroll->setHorizontalScrollBarPolicy(Qt::ScrollBarAsNeeded);
    m_scroll->setVerticalScrollBarPolicy(Qt::ScrollBarAlwaysOff);

    m_content = new QWidget(m_scroll);
    m_content->setObjectName("RibbonCategoryContent");
    m_row = new QHBoxLayout(m_content);
    m_row->setContentsMargins(0, 0, 0, 0);
    m_row->setSpacing(RibbonStyle::PanelSpacingPx);
    m_row->addStretch(1);
    m_scroll->setWidget(m_content);
    root->addWidget(m_scroll, 1);

    m_displayOptions = new QToolButton(this);
    m_displayOptions->setObjectName("RibbonDisplayOptionsButton");
    m_displayOptions->setAutoRaise(true);
    m_displayOptions->setIcon(style()->standardIcon(QStyle::SP_ArrowDown));
    m_displayOptions->setIconSize(QSize(RibbonStyle::DisplayOptionsIconPx, RibbonStyle::DisplayOptionsIconPx));
    m_displayOptions->setToolTip(tr("Ribbon display options"));
    root->addWidget(m_displayOptions, 0, Qt::AlignBottom);

    if (m_category) {
        connect(m_displayOptions, &QToolButton::clicked, m_category, &RibbonCategory::triggerDisplayOptions);
        connect(m_category, &RibbonCategory::changed, this, [this] {
            syncAppearance();
            rebuildPanels();
        });
    }

    syncAppearance();
    rebuildPanels();
}

RibbonPanelWidget* RibbonCategoryWidget::panelWidget(const QString& title) const
{
    for (auto* pw : m_panelWidgets) {
        if (pw->panel() && pw->panel()->title() == title)
            return pw;
    }
    return nullptr;
}

void RibbonCategoryWidget::setDisplayOptionsMenu(QMenu* menu)
{
    m_displayOptions->setMenu(menu);
    m_displayOptions->setPopupMode(menu ? QToolButton::InstantPopup : QToolButton::DelayedPopup);
}

void RibbonCategoryWidget::setDisplayOptionsPopupMode(QToolButton::ToolButtonPopupMode mode)
{
    m_displayOptions->setPopupMode(mode);
}

void RibbonCategoryWidget::setPanelHeight(int height)
{
    m_panelHeight = qMax(0, height);
    for (auto* pw : std::as_const(m_panelWidgets)) {
        if (m_panelHeight > 0)
            pw->setFixedHeight(m_panelHeight);
        else
            pw->setMaximumHeight(QWIDGETSIZE_MAX);
    }
}

void RibbonCategoryWidget::syncAppearance()
{
    if (!m_category)
        return;

    setProperty("ribbonCategoryTitle", m_category->title());
    setProperty("ribbonContextual", m_category->isContextual());

    if (m_category->isContextual() && m_category->color().isValid())
        setStyleSheet(QString("#RibbonCategory { border-top: 3px solid %1; }").arg(m_category->color().name()));
    else
        setStyleSheet(QString());
}

void RibbonCategoryWidget::rebuildPanels()
{
    // Panels are rebuilt only when the set changes; a panel widget tracks its own items.
    QVector<RibbonPanel*> current;
    if (m_category)
        current = m_category->panels();

    QVector<RibbonPanel*> shown;
    shown.reserve(m_panelWidgets.size());
    for (auto* pw : std::as_const(m_panelWidgets))
        shown.push_back(pw->panel());
    if (shown == current)
        return;

    for (auto* pw : std::as_const(m_panelWidgets)) {
        m_row->removeWidget(pw);
        pw->hide();
        pw->deleteLater();
    }
    for (auto* sep : std::as_const(m_separators)) {
        m_row->removeWidget(sep);
        sep->deleteLater();
    }
    m_panelWidgets.clear();
    m_separators.clear();

    int insertAt = 0;
    for (auto* panel : std::as_const(current)) {
        auto* pw = new RibbonPanelWidget(panel, m_content);
        if (m_panelHeight > 0)
            pw->setFixedHeight(m_panelHeight);
        m_row->insertWidget(insertAt++, pw);
        m_panelWidgets.push_back(pw);

        auto* sep = new QFrame(m_content);
        sep->setObjectName("RibbonPanelSeparator");
        sep->setFrameShape(QFrame::VLine);
        sep->setFrameShadow(QFrame::Sunken);
        sep->setFixedWidth(RibbonStyle::SeparatorWidthPx);
        m_row->insertWidget(insertAt++, sep);
        m_separators.push_back(sep);
    }
}

} // namespace Ribbon
