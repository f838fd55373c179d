// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ribbon/RibbonCategory.hpp"

#include "ribbon/RibbonModel.hpp"

#include <QtCore/QDebug>

namespace Ribbon {

const QVector<QColor>& contextualColors()
{
    static const QVector<QColor> colors = {
        QColor(201, 89, 156),  // rose
        QColor(242, 203, 29),  // yellow
        QColor(255, 157, 0),   // orange
        QColor(14, 81, 167),   // blue
        QColor(228, 0, 69),    // red
        QColor(67, 148, 0),    // green
    };
    return colors;
}

RibbonCategory::RibbonCategory(QString title, CategoryStyle style, QColor color, QObject* parent)
    : QObject(parent)
    , m_title(std::move(title))
    , m_style(style)
    , m_color(std::move(color))
{
}

void RibbonCategory::setTitle(QString title)
{
    if (m_title == title)
        return;
    m_title = std::move(title);
    emit changed();
}

void RibbonCategory::setCategoryStyle(CategoryStyle style)
{
    if (m_style == style)
        return;
    m_style = style;
    emit changed();
}

void RibbonCategory::setColor(QColor color)
{
    if (m_color == color)
        return;
    m_color = std::move(color);
    emit changed();
}

RibbonResult RibbonCategory::showContextCategory()
{
    if (!m_ribbon) {
        return RibbonResult::failure(RibbonErrorCode::NotFound,
                                     QString("Ribbon category '%1' is not part of a ribbon.").arg(m_title));
    }
    return m_ribbon->showContextCategory(this);
}

RibbonResult RibbonCategory::hideContextCategory()
{
    if (!m_ribbon) {
        return RibbonResult::failure(RibbonErrorCode::NotFound,
                                     QString("Ribbon category '%1' is not part of a ribbon.").arg(m_title));
    }
    return m_ribbon->hideContextCategory(this);
}

RibbonResult RibbonCategory::setCategoryState(bool shown)
{
    return shown ? showContextCategory() : hideContextCategory();
}

bool RibbonCategory::isShown() const
{
    return m_ribbon && m_ribbon->isCategoryShown(this);
}

RibbonExpected<RibbonPanel*> RibbonCategory::addPanel(const QString& title, int maxRows, bool showOptionButton)
{
    if (m_panelsByTitle.contains(title)) {
        return ribbonFailure(RibbonErrorCode::Duplicate,
                             QString("Ribbon category '%1': duplicate panel title '%2'.").arg(m_title, title));
    }

    auto allocator = GridAllocator::create(maxRows);
    if (!allocator)
        return std::unexpected(allocator.error());

    auto* panel = new RibbonPanel(title, std::move(*allocator), showOptionButton, this);
    m_panels.push_back(panel);
    m_panelsByTitle.insert(title, panel);

    emit changed();
    return panel;
}

RibbonPanel* RibbonCategory::detachPanel(const QString& title)
{
    RibbonPanel* panel = m_panelsByTitle.value(title, nullptr);
    if (!panel)
        return nullptr;

    m_panelsByTitle.remove(title);
    m_panels.removeOne(panel);
    return panel;
}

RibbonResult RibbonCategory::removePanel(const QString& title)
{
    RibbonPanel* panel = detachPanel(title);
    if (!panel) {
        return RibbonResult::failure(RibbonErrorCode::NotFound,
                                     QString("Ribbon category '%1': no panel titled '%2'.").arg(m_title, title));
    }

    panel->deleteLater();
    emit changed();
    return RibbonResult::success();
}

RibbonExpected<std::unique_ptr<RibbonPanel>> RibbonCategory::takePanel(const QString& title)
{
    RibbonPanel* panel = detachPanel(title);
    if (!panel) {
        return ribbonFailure(RibbonErrorCode::NotFound,
                             QString("Ribbon category '%1': no panel titled '%2'.").arg(m_title, title));
    }

    panel->setParent(nullptr);
    emit changed();
    return std::unique_ptr<RibbonPanel>(panel);
}

RibbonExpected<RibbonPanel*> RibbonCategory::panel(const QString& title) const
{
    RibbonPanel* panel = m_panelsByTitle.value(title, nullptr);
    if (!panel) {
        return ribbonFailure(RibbonErrorCode::NotFound,
                             QString("Ribbon category '%1': no panel titled '%2'.").arg(m_title, title));
    }
    return panel;
}

RibbonResult RibbonCategory::renamePanel(const QString& title, const QString& newTitle)
{
    RibbonPanel* panel = m_panelsByTitle.value(title, nullptr);
    if (!panel) {
        return RibbonResult::failure(RibbonErrorCode::NotFound,
                                     QString("Ribbon category '%1': no panel titled '%2'.").arg(m_title, title));
    }
    if (title == newTitle)
        return RibbonResult::success();
    if (m_panelsByTitle.contains(newTitle)) {
        return RibbonResult::failure(RibbonErrorCode::Duplicate,
                                     QString("Ribbon category '%1': duplicate panel title '%2'.").arg(m_title, newTitle));
    }

    m_panelsByTitle.remove(title);
    m_panelsByTitle.insert(newTitle, panel);
    panel->applyTitle(newTitle);

    emit changed();
    return RibbonResult::success();
}

void RibbonCategory::triggerDisplayOptions()
{
    emit displayOptionsTriggered();
}

} // namespace Ribbon
