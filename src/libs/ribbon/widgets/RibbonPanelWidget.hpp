// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ribbon/PanelGeometry.hpp"
#include "ribbon/RibbonGlobal.hpp"

#include <QtCore/QHash>
#include <QtCore/QPointer>
#include <QtCore/QVector>
#include <QtWidgets/QFrame>

class QGridLayout;
class QLabel;
class QResizeEvent;
class QToolButton;

namespace Ribbon {

class RibbonPanel;

class RIBBON_EXPORT RibbonPanelWidget final : public QFrame
{
    Q_OBJECT

public:
    explicit RibbonPanelWidget(RibbonPanel* panel, QWidget* parent = nullptr);

    RibbonPanel* panel() const { return m_panel; }

    QWidget* itemWidget(const QString& name) const;
    int itemWidgetCount() const;

    QLabel* titleLabel() const { return m_title; }
    QToolButton* optionButton() const { return m_optionButton; }
    QGridLayout* gridLayout() const { return m_grid; }

    const PanelMetrics& metrics() const { return m_metrics; }
    int rowHeight() const;

protected:
    void resizeEvent(QResizeEvent* event) override;

private:
    struct PlacedWidget {
        quint64 id = 0;
        QString name;
        QPointer<QWidget> widget;
        int rowSpan = 1;
    };

    // Drops widgets of removed items and creates widgets for new ones only.
    void syncItems();
    void removePlaced(const PlacedWidget& placed);
    void reindexNames();
    void syncHeader();
    void applyItemHeights();

    QPointer<RibbonPanel> m_panel;
    PanelMetrics m_metrics;

    QWidget* m_gridHost = nullptr;
    QGridLayout* m_grid = nullptr;
    QLabel* m_title = nullptr;
    QToolButton* m_optionButton = nullptr;

    QVector<PlacedWidget> m_placed;
    QHash<QString, int> m_placedByName;
};

} // namespace Ribbon
