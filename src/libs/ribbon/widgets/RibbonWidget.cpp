// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ribbon/widgets/RibbonWidget.hpp"

#include "ribbon/RibbonCategory.hpp"
#include "ribbon/RibbonModel.hpp"
#include "ribbon/widgets/RibbonCategoryWidget.hpp"
#include "ribbon/widgets/RibbonStyle.hpp"

#include <QtCore/QLoggingCategory>
#include <QtCore/QSignalBlocker>
#include <QtGui/QAction>
#include <QtGui/QFont>
#include <QtGui/QIcon>
#include <QtWidgets/QHBoxLayout>
#include <QtWidgets/QMenu>
#include <QtWidgets/QStackedWidget>
#include <QtWidgets/QStyle>
#include <QtWidgets/QTabBar>
#include <QtWidgets/QToolButton>
#include <QtWidgets/QVBoxLayout>

Q_LOGGING_CATEGORY(ribbonwidgetlog, "qtribbon.widgets")

namespace Ribbon {

namespace {

QToolButton* makeTitleBarButton(const QString& objectName, QWidget* parent)
{
    auto* button = new QToolButton(parent);
    button->setObjectName(objectName);
    button->setAutoRaise(true);
    button->setIconSize(QSize(RibbonStyle::TitleBarIconPx / 2, RibbonStyle::TitleBarIconPx / 2));
    return button;
}

} // namespace

RibbonWidget::RibbonWidget(QWidget* parent)
    : QWidget(parent)
{
    setObjectName("Ribbon");
    setAttribute(Qt::WA_StyledBackground, true);

    auto* root = new QVBoxLayout(this);
    root->setContentsMargins(0, 0, 0, 0);
    root->setSpacing(RibbonStyle::MainSpacingPx);

    auto* titleBar = new QWidget(this);
    titleBar->setObjectName("RibbonTitleBar");
    auto* bar = new QHBoxLayout(titleBar);
    bar->setContentsMargins(0, 0, 0, 0);
    bar->setSpacing(RibbonStyle::MainSpacingPx);

    m_applicationButton = new QToolButton(titleBar);
    m_applicationButton->setObjectName("RibbonApplicationButton");
    m_applicationButton->setText(tr("File"));
    m_applicationButton->setToolButtonStyle(Qt::ToolButtonTextBesideIcon);
    m_applicationButton->setPopupMode(QToolButton::InstantPopup);
    m_applicationButton->setAutoRaise(true);
    bar->addWidget(m_applicationButton, 0);

    m_quickAccess = new QHBoxLayout();
    m_quickAccess->setContentsMargins(0, 0, 0, 0);
    m_quickAccess->setSpacing(0);
    bar->addLayout(m_quickAccess, 0);

    m_tabBar = new QTabBar(titleBar);
    m_tabBar->setObjectName("RibbonTabBar");
    m_tabBar->setDrawBase(false);
    m_tabBar->setExpanding(false);
    QFont tabFont = m_tabBar->font();
    tabFont.setPointSize(RibbonStyle::TabFontPointSize);
    m_tabBar->setFont(tabFont);
    bar->addWidget(m_tabBar, 1);

    m_rightButtons = new QHBoxLayout();
    m_rightButtons->setContentsMargins(0, 0, 0, 0);
    m_rightButtons->setSpacing(0);
    bar->addLayout(m_rightButtons, 0);

    m_helpButton = makeTitleBarButton("RibbonHelpButton", titleBar);
    m_helpButton->setIcon(style()->standardIcon(QStyle::SP_DialogHelpButton));
    m_helpButton->setToolTip(tr("Help"));
    m_rightButtons->addWidget(m_helpButton);

    m_collapseButton = makeTitleBarButton("RibbonCollapseButton", titleBar);
    m_rightButtons->addWidget(m_collapseButton);

    root->addWidget(titleBar, 0);

    m_stack = new QStackedWidget(this);
    m_stack->setObjectName("RibbonCategoryStack");
    root->addWidget(m_stack, 1);

    connect(m_helpButton, &QToolButton::clicked, this, &RibbonWidget::helpButtonClicked);
    connect(m_collapseButton, &QToolButton::clicked, this, [this] {
        if (m_model)
            m_model->setCollapsed(!m_model->isCollapsed());
    });
    connect(m_tabBar, &QTabBar::currentChanged, this, &RibbonWidget::onTabChanged);

    syncCollapsed();
}

void RibbonWidget::setModel(RibbonModel* model)
{
    if (m_model == model)
        return;

    if (m_model)
        disconnect(m_model, nullptr, this, nullptr);

    clearCategoryWidgets();
    m_model = model;

    if (m_model) {
        connect(m_model, &RibbonModel::structureChanged, this, &RibbonWidget::rebuildTabs);
        connect(m_model, &RibbonModel::currentCategoryChanged, this, &RibbonWidget::syncCurrentCategory);
        connect(m_model, &RibbonModel::collapsedChanged, this, &RibbonWidget::syncCollapsed);
        connect(m_model, &RibbonModel::ribbonHeightChanged, this, &RibbonWidget::syncHeight);
        connect(m_model, &QObject::destroyed, this, [this] {
            m_model = nullptr;
            clearCategoryWidgets();
            rebuildTabs();
        });
    }

    rebuildTabs();
    syncCollapsed();
}

RibbonCategoryWidget* RibbonWidget::categoryWidget(const RibbonCategory* category) const
{
    return m_categoryWidgets.value(category, nullptr);
}

QString RibbonWidget::fileTitle() const
{
    return m_applicationButton->text();
}

void RibbonWidget::setFileTitle(const QString& title)
{
    m_applicationButton->setText(title);
}

void RibbonWidget::setFileIcon(const QIcon& icon)
{
    m_applicationButton->setIcon(icon);
}

QMenu* RibbonWidget::fileMenu() const
{
    return m_applicationButton->menu();
}

void RibbonWidget::setFileMenu(QMenu* menu)
{
    m_applicationButton->setMenu(menu);
}

QToolButton* RibbonWidget::addQuickAccessButton(QAction* action)
{
    auto* button = makeTitleBarButton("RibbonQuickAccessButton", this);
    button->setDefaultAction(action);
    m_quickAccess->addWidget(button);
    return button;
}

void RibbonWidget::addRightButton(QToolButton* button)
{
    if (!button)
        return;
    button->setAutoRaise(true);
    m_rightButtons->insertWidget(0, button);
}

void RibbonWidget::setHelpButtonIcon(const QIcon& icon)
{
    if (m_helpButton)
        m_helpButton->setIcon(icon);
}

void RibbonWidget::removeHelpButton()
{
    if (!m_helpButton)
        return;
    m_rightButtons->removeWidget(m_helpButton);
    m_helpButton->deleteLater();
    m_helpButton = nullptr;
}

void RibbonWidget::removeCollapseButton()
{
    if (!m_collapseButton)
        return;
    m_rightButtons->removeWidget(m_collapseButton);
    m_collapseButton->deleteLater();
    m_collapseButton = nullptr;
}

void RibbonWidget::clearCategoryWidgets()
{
    for (auto* w : std::as_const(m_categoryWidgets)) {
        m_stack->removeWidget(w);
        w->deleteLater();
    }
    m_categoryWidgets.clear();
}

RibbonCategoryWidget* RibbonWidget::ensureCategoryWidget(RibbonCategory* category)
{
    if (auto* existing = m_categoryWidgets.value(category, nullptr))
        return existing;

    auto* w = new RibbonCategoryWidget(category, m_stack);
    m_categoryWidgets.insert(category, w);
    return w;
}

void RibbonWidget::rebuildTabs()
{
    const QSignalBlocker blockTabs(m_tabBar);

    while (m_tabBar->count() > 0)
        m_tabBar->removeTab(0);
    while (m_stack->count() > 0)
        m_stack->removeWidget(m_stack->widget(0));

    const QVector<RibbonCategory*> all = m_model ? m_model->categories() : QVector<RibbonCategory*>{};
    for (auto it = m_categoryWidgets.begin(); it != m_categoryWidgets.end();) {
        if (!all.contains(it.key())) {
            it.value()->deleteLater();
            it = m_categoryWidgets.erase(it);
        } else {
            it.value()->hide();
            ++it;
        }
    }

    if (m_model) {
        for (auto* category : m_model->shownCategories()) {
            const int index = m_tabBar->addTab(category->title());
            if (category->isContextual() && category->color().isValid())
                m_tabBar->setTabTextColor(index, category->color());
            m_stack->addWidget(ensureCategoryWidget(category));
        }
    }


    qCDebug(ribbonwidgetlog) << "Ribbon rebuilt with" << m_tabBar->count() << "tabs";
    syncCurrentCategory();
    syncHeight();
}

void RibbonWidget::syncCurrentCategory()
{
    if (!m_model)
        return;

    const int index = m_model->currentIndex();
    if (index < 0 || index >= m_stack->count())
        return;

    const QSignalBlocker blockTabs(m_tabBar);
    m_tabBar->setCurrentIndex(index);
    m_stack->setCurrentIndex(index);
}

void RibbonWidget::onTabChanged(int index)
{
    if (!m_model || index < 0)
        return;

    const RibbonResult r = m_model->setCurrentIndex(index);
    if (!r)
        qCWarning(ribbonwidgetlog).noquote() << "Tab selection rejected:" << r.error.message();
}

void RibbonWidget::syncCollapsed()
{
    const bool collapsed = m_model && m_model->isCollapsed();
    m_stack->setVisible(!collapsed);

    if (m_collapseButton) {
        m_collapseButton->setIcon(style()->standardIcon(collapsed ? QStyle::SP_TitleBarUnshadeButton
                                                                  : QStyle::SP_TitleBarShadeButton));
        m_collapseButton->setToolTip(collapsed ? tr("Expand Ribbon") : tr("Collapse Ribbon"));
    }

    syncHeight();
}

int RibbonWidget::tabStripHeight() const
{
    return qMax(m_tabBar->sizeHint().height(), m_applicationButton->sizeHint().height());
}

void RibbonWidget::syncHeight()
{
    const int ribbonHeight = m_model ? m_model->ribbonHeight() : RibbonModel::DefaultRibbonHeight;
    const bool collapsed = m_model && m_model->isCollapsed();
    const int strip = tabStripHeight();

    if (collapsed) {
        setFixedHeight(strip);
        return;
    }

    setFixedHeight(ribbonHeight);

    const int panelHeight = qMax(0, ribbonHeight - strip - RibbonStyle::MainSpacingPx);
    for (auto* w : std::as_const(m_categoryWidgets))
        w->setPanelHeight(panelHeight);
}

} // namespace Ribbon
