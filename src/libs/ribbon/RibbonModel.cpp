// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ribbon/RibbonModel.hpp"

#include <QtCore/QDebug>

namespace Ribbon {

RibbonModel::RibbonModel(QObject* parent)
    : QObject(parent)
{
}

QVector<RibbonCategory*> RibbonModel::shownCategories() const
{
    QVector<RibbonCategory*> out;
    out.reserve(m_categories.size());
    for (auto* c : m_categories) {
        if (isCategoryShown(c))
            out.push_back(c);
    }
    return out;
}

bool RibbonModel::isCategoryShown(const RibbonCategory* category) const
{
    if (!category || !m_categories.contains(category))
        return false;
    if (!category->isContextual())
        return true;
    return m_shownContextCategories.contains(category);
}

RibbonCategory* RibbonModel::insertCategory(RibbonCategory* category)
{
    category->setRibbon(this);
    m_categories.push_back(category);
    connect(category, &RibbonCategory::changed, this, &RibbonModel::notifyStructureChanged);

    notifyStructureChanged();

    if (!m_current && isCategoryShown(category))
        setCurrent(category);

    return category;
}

RibbonCategory* RibbonModel::addCategory(const QString& title)
{
    return insertCategory(new RibbonCategory(title, CategoryStyle::Normal, {}, this));
}

RibbonCategory* RibbonModel::addContextCategory(const QString& title, const QColor& color)
{
    QColor tint = color;
    if (!tint.isValid()) {
        const auto& palette = contextualColors();
        tint = palette.at(m_nextContextColor % palette.size());
        ++m_nextContextColor;
    }

    return insertCategory(new RibbonCategory(title, CategoryStyle::Contextual, tint, this));
}

RibbonResult RibbonModel::checkOwned(const RibbonCategory* category, const char* operation) const
{
    if (category && m_categories.contains(category))
        return RibbonResult::success();

    return RibbonResult::failure(RibbonErrorCode::NotFound,
                                 QString("Ribbon: %1: category is not part of this ribbon.")
                                     .arg(QLatin1String(operation)));
}

RibbonResult RibbonModel::removeCategory(RibbonCategory* category)
{
    const RibbonResult owned = checkOwned(category, "removeCategory");
    if (!owned)
        return owned;

    disconnect(category, nullptr, this, nullptr);
    m_categories.removeOne(category);
    m_shownContextCategories.remove(category);
    category->setRibbon(nullptr);
    category->deleteLater();

    notifyStructureChanged();

    if (m_current == category)
        setCurrent(firstShownCategory());

    return RibbonResult::success();
}

void RibbonModel::clearCategories()
{
    if (m_categories.isEmpty())
        return;

    for (auto* c : m_categories) {
        disconnect(c, nullptr, this, nullptr);
        c->setRibbon(nullptr);
        c->deleteLater();
    }
    m_categories.clear();
    m_shownContextCategories.clear();

    notifyStructureChanged();
    setCurrent(nullptr);
}

int RibbonModel::currentIndex() const
{
    if (!m_current)
        return -1;
    return static_cast<int>(shownCategories().indexOf(m_current));
}

RibbonResult RibbonModel::setCurrentCategory(RibbonCategory* category)
{
    const RibbonResult owned = checkOwned(category, "setCurrentCategory");
    if (!owned)
        return owned;

    if (!isCategoryShown(category)) {
        return RibbonResult::failure(RibbonErrorCode::InvalidArgument,
                                     QString("Ribbon: category '%1' is hidden.").arg(category->title()));
    }

    setCurrent(category);
    return RibbonResult::success();
}

RibbonResult RibbonModel::setCurrentIndex(int index)
{
    const auto shown = shownCategories();
    if (index < 0 || index >= shown.size()) {
        return RibbonResult::failure(RibbonErrorCode::NotFound,
                                     QString("Ribbon: tab index %1 out of range.").arg(index));
    }

    setCurrent(shown.at(index));
    return RibbonResult::success();
}

RibbonResult RibbonModel::showContextCategory(RibbonCategory* category)
{
    const RibbonResult owned = checkOwned(category, "showContextCategory");
    if (!owned)
        return owned;

    if (!category->isContextual()) {
        return RibbonResult::failure(RibbonErrorCode::InvalidArgument,
                                     QString("Ribbon: category '%1' is not contextual.").arg(category->title()));
    }

    if (m_shownContextCategories.contains(category))
        return RibbonResult::success();

    m_shownContextCategories.insert(category);
    notifyStructureChanged();

    if (!m_current)
        setCurrent(category);

    return RibbonResult::success();
}

RibbonResult RibbonModel::hideContextCategory(RibbonCategory* category)
{
    const RibbonResult owned = checkOwned(category, "hideContextCategory");
    if (!owned)
        return owned;

    if (!category->isContextual()) {
        return RibbonResult::failure(RibbonErrorCode::InvalidArgument,
                                     QString("Ribbon: category '%1' is not contextual.").arg(category->title()));
    }

    if (!m_shownContextCategories.remove(category))
        return RibbonResult::success();

    notifyStructureChanged();

    if (m_current == category)
        setCurrent(firstShownCategory());

    return RibbonResult::success();
}

RibbonCategory* RibbonModel::firstShownCategory() const
{
    for (auto* c : m_categories) {
        if (isCategoryShown(c))
            return c;
    }
    return nullptr;
}

void RibbonModel::setCurrent(RibbonCategory* category)
{
    if (m_current == category)
        return;

    m_current = category;
    if (isInUpdateBatch())
        return;

    emit currentCategoryChanged(m_current);
}

RibbonResult RibbonModel::setRibbonHeight(int height)
{
    if (height <= 0) {
        return RibbonResult::failure(RibbonErrorCode::InvalidArgument,
                                     QString("Ribbon: invalid height %1.").arg(height));
    }
    if (m_ribbonHeight == height)
        return RibbonResult::success();

    m_ribbonHeight = height;
    emit ribbonHeightChanged(m_ribbonHeight);
    return RibbonResult::success();
}

void RibbonModel::setCollapsed(bool collapsed)
{
    if (m_collapsed == collapsed)
        return;
    m_collapsed = collapsed;
    emit collapsedChanged(m_collapsed);
}

void RibbonModel::notifyStructureChanged()
{
    if (isInUpdateBatch()) {
        m_structureChangePending = true;
        return;
    }
    emit structureChanged();
}

void RibbonModel::beginUpdateBatch()
{
    if (m_updateBatchDepth == 0) {
        m_structureChangePending = false;
        m_currentAtBatchStart = m_current;
    }
    ++m_updateBatchDepth;
}

void RibbonModel::endUpdateBatch()
{
    if (m_updateBatchDepth == 0) {
        qCWarning(ribbonlog) << "RibbonModel: endUpdateBatch without matching beginUpdateBatch.";
        return;
    }

    --m_updateBatchDepth;
    if (m_updateBatchDepth > 0)
        return;

    if (m_structureChangePending) {
        m_structureChangePending = false;
        emit structureChanged();
    }

    if (m_current != m_currentAtBatchStart)
        emit currentCategoryChanged(m_current);
    m_currentAtBatchStart = nullptr;
}

} // namespace Ribbon
