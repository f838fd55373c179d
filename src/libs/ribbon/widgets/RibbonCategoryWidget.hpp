// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ribbon/RibbonGlobal.hpp"

#include <QtCore/QPointer>
#include <QtCore/QVector>
#include <QtWidgets/QFrame>
#include <QtWidgets/QToolButton>

class QHBoxLayout;
class QMenu;
class QScrollArea;

namespace Ribbon {

class RibbonCategory;
class RibbonPanelWidget;

class RIBBON_EXPORT RibbonCategoryWidget final : public QFrame
{
    Q_OBJECT

public:
    explicit RibbonCategoryWidget(RibbonCategory* category, QWidget* parent = nullptr);

    RibbonCategory* category() const { return m_category; }

    QVector<RibbonPanelWidget*> panelWidgets() const { return m_panelWidgets; }
    RibbonPanelWidget* panelWidget(const QString& title) const;

    QToolButton* displayOptionsButton() const { return m_displayOptions; }
    void setDisplayOptionsMenu(QMenu* menu);
    void setDisplayOptionsPopupMode(QToolButton::ToolButtonPopupMode mode);

    // Height handed to every panel; 0 lets the layout decide.
    int panelHeight() const { return m_panelHeight; }
    void setPanelHeight(int height);

private:
    void rebuildPanels();
    void syncAppearance();

    QPointer<RibbonCategory> m_category;
    int m_panelHeight = 0;

    QScrollArea* m_scroll = nullptr;
    QWidget* m_content = nullptr;
    QHBoxLayout* m_row = nullptr;
    QToolButton* m_displayOptions = nullptr;

    QVector<RibbonPanelWidget*> m_panelWidgets;
    QVector<QWidget*> m_separators;
};

} // namespace Ribbon
