// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ribbon/RibbonGlobal.hpp"

#include <QtCore/QHash>
#include <QtCore/QPointer>
#include <QtWidgets/QWidget>

class QHBoxLayout;
class QIcon;
class QMenu;
class QStackedWidget;
class QTabBar;
class QToolButton;

namespace Ribbon {

class RibbonCategory;
class RibbonCategoryWidget;
class RibbonModel;

class RIBBON_EXPORT RibbonWidget final : public QWidget
{
    Q_OBJECT

public:
    explicit RibbonWidget(QWidget* parent = nullptr);

    void setModel(RibbonModel* model);
    RibbonModel* model() const { return m_model; }

    QTabBar* tabBar() const { return m_tabBar; }
    QStackedWidget* stack() const { return m_stack; }
    RibbonCategoryWidget* categoryWidget(const RibbonCategory* category) const;

    QToolButton* applicationButton() const { return m_applicationButton; }
    QString fileTitle() const;
    void setFileTitle(const QString& title);
    void setFileIcon(const QIcon& icon);
    QMenu* fileMenu() const;
    void setFileMenu(QMenu* menu);

    QToolButton* addQuickAccessButton(QAction* action);
    void addRightButton(QToolButton* button);

    QToolButton* helpButton() const { return m_helpButton; }
    void setHelpButtonIcon(const QIcon& icon);
    void removeHelpButton();

    QToolButton* collapseButton() const { return m_collapseButton; }
    void removeCollapseButton();

signals:
    void helpButtonClicked();

private:
    void rebuildTabs();
    void syncCurrentCategory();
    void syncCollapsed();
    void syncHeight();
    void onTabChanged(int index);
    RibbonCategoryWidget* ensureCategoryWidget(RibbonCategory* category);
    void clearCategoryWidgets();
    int tabStripHeight() const;

    QPointer<RibbonModel> m_model;

    QToolButton* m_applicationButton = nullptr;
    QHBoxLayout* m_quickAccess = nullptr;
    QTabBar* m_tabBar = nullptr;
    QHBoxLayout* m_rightButtons = nullptr;
    QToolButton* m_helpButton = nullptr;
    QToolButton* m_collapseButton = nullptr;
    QStackedWidget* m_stack = nullptr;

    QHash<const RibbonCategory*, RibbonCategoryWidget*> m_categoryWidgets;
};

} // namespace Ribbon
