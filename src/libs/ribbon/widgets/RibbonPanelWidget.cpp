// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ribbon/widgets/RibbonPanelWidget.hpp"

#include "ribbon/RibbonPanel.hpp"
#include "ribbon/widgets/PanelWidgetFactory.hpp"
#include "ribbon/widgets/RibbonStyle.hpp"

#include <QtCore/QLoggingCategory>
#include <QtCore/QSet>
#include <QtGui/QResizeEvent>
#include <QtWidgets/QGridLayout>
#include <QtWidgets/QHBoxLayout>
#include <QtWidgets/QLabel>
#include <QtWidgets/QStyle>
#include <QtWidgets/QToolButton>
#include <QtWidgets/QVBoxLayout>

#include <algorithm>

Q_LOGGING_CATEGORY(panelwidgetlog, "qtribbon.widgets.panel")

namespace Ribbon {

RibbonPanelWidget::RibbonPanelWidget(RibbonPanel* panel, QWidget* parent)
    : QFrame(parent)
    , m_panel(panel)
{
    setObjectName("RibbonPanel");
    setFrameShape(QFrame::NoFrame);
    setAttribute(Qt::WA_StyledBackground, true);
    setSizePolicy(QSizePolicy::Preferred, QSizePolicy::Expanding);

    auto* col = new QVBoxLayout(this);
    col->setContentsMargins(m_metrics.contentMargins);
    col->setSpacing(m_metrics.contentSpacing);

    m_gridHost = new QWidget(this);
    m_gridHost->setObjectName("RibbonPanelContent");
    m_grid = new QGridLayout(m_gridHost);
    m_grid->setContentsMargins(m_metrics.gridMargins);
    m_grid->setSpacing(m_metrics.gridSpacing);
    col->addWidget(m_gridHost, 1);

    auto* footer = new QWidget(this);
    footer->setObjectName("RibbonPanelFooter");
    footer->setFixedHeight(m_metrics.titleHeight);
    auto* row = new QHBoxLayout(footer);
    row->setContentsMargins(0, 0, 0, 0);
    row->setSpacing(0);

    m_title = new QLabel(footer);
    m_title->setObjectName("RibbonPanelTitle");
    m_title->setAlignment(Qt::AlignHCenter | Qt::AlignVCenter);
    m_title->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Fixed);
    row->addWidget(m_title, 1);

    m_optionButton = new QToolButton(footer);
    m_optionButton->setObjectName("RibbonPanelOptionButton");
    m_optionButton->setAutoRaise(true);
    m_optionButton->setIcon(style()->standardIcon(QStyle::SP_TitleBarNormalButton));
    m_optionButton->setIconSize(QSize(RibbonStyle::PanelOptionIconPx, RibbonStyle::PanelOptionIconPx));
    row->addWidget(m_optionButton, 0);

    col->addWidget(footer, 0);

    if (m_panel) {
        connect(m_optionButton, &QToolButton::clicked, m_panel, &RibbonPanel::triggerOption);
        connect(m_panel, &RibbonPanel::changed, this, [this] {
            syncHeader();
            syncItems();
        });
    }

    syncHeader();
    syncItems();
}

QWidget* RibbonPanelWidget::itemWidget(const QString& name) const
{
    const auto it = m_placedByName.constFind(name);
    if (it == m_placedByName.constEnd())
        return nullptr;
    return m_placed.at(it.value()).widget;
}

int RibbonPanelWidget::itemWidgetCount() const
{
    return static_cast<int>(std::count_if(m_placed.cbegin(), m_placed.cend(),
                                          [](const PlacedWidget& placed) { return !placed.widget.isNull(); }));
}

int RibbonPanelWidget::rowHeight() const
{
    if (!m_panel)
        return 0;
    return PanelGeometry::rowHeight(m_metrics, height(), m_panel->maximumRows());
}

void RibbonPanelWidget::resizeEvent(QResizeEvent* event)
{
    QFrame::resizeEvent(event);
    applyItemHeights();
}

void RibbonPanelWidget::syncHeader()
{
    if (!m_panel)
        return;

    m_title->setText(m_panel->title());
    m_optionButton->setVisible(m_panel->showOptionButton());
    m_optionButton->setToolTip(m_panel->optionToolTip());
}

void RibbonPanelWidget::removePlaced(const PlacedWidget& placed)
{
    if (!placed.widget)
        return;
    m_grid->removeWidget(placed.widget);
    placed.widget->hide();
    placed.widget->deleteLater();
}

void RibbonPanelWidget::reindexNames()
{
    m_placedByName.clear();
    for (int i = 0; i < m_placed.size(); ++i) {
        const PlacedWidget& placed = m_placed.at(i);
        if (!placed.name.isEmpty() && placed.widget)
            m_placedByName.insert(placed.name, i);
    }
}

void RibbonPanelWidget::syncItems()
{
    if (!m_panel) {
        for (const PlacedWidget& placed : std::as_const(m_placed))
            removePlaced(placed);
        m_placed.clear();
        m_placedByName.clear();
        return;
    }

    QSet<quint64> live;
    for (const PanelItem& item : m_panel->items())
        live.insert(item.id);

    int removed = 0;
    for (auto it = m_placed.begin(); it != m_placed.end();) {
        if (live.contains(it->id)) {
            ++it;
            continue;
        }
        removePlaced(*it);
        it = m_placed.erase(it);
        ++removed;
    }

    QSet<quint64> present;
    for (const PlacedWidget& placed : std::as_const(m_placed))
        present.insert(placed.id);

    for (int r = 0; r < m_panel->maximumRows(); ++r)
        m_grid->setRowStretch(r, 1);

    int added = 0;
    for (const PanelItem& item : m_panel->items()) {
        if (present.contains(item.id))
            continue;

        // Failed items keep an empty entry so they are not retried on every change.
        QWidget* w = PanelWidgetFactory::create(item, m_gridHost);
        if (!w) {
            qCWarning(panelwidgetlog).noquote() << "Skipping item" << item.name << "in panel" << m_panel->title();
        } else {
            m_grid->addWidget(w, item.cells.row, item.cells.column, item.cells.rowSpan, item.cells.columnSpan,
                              item.alignment);
            ++added;
        }
        m_placed.push_back({item.id, item.name, w, item.cells.rowSpan});
    }

    reindexNames();

    if (added > 0 || removed > 0) {
        qCDebug(panelwidgetlog) << "Panel" << m_panel->title() << "synced:" << added << "added," << removed
                                << "removed";
        applyItemHeights();
    }
}

void RibbonPanelWidget::applyItemHeights()
{
    const int rh = rowHeight();
    if (rh <= 0)
        return;

    for (const PlacedWidget& placed : std::as_const(m_placed)) {
        if (placed.widget)
            placed.widget->setMaximumHeight(PanelGeometry::itemMaximumHeight(m_metrics, rh, placed.rowSpan));
    }
}

} // namespace Ribbon
