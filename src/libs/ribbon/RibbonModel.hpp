// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ribbon/RibbonCategory.hpp"
#include "ribbon/RibbonError.hpp"
#include "ribbon/RibbonGlobal.hpp"

#include <QtCore/QObject>
#include <QtCore/QSet>
#include <QtCore/QString>
#include <QtCore/QVector>
#include <QtGui/QColor>

namespace Ribbon {

// Ordered categories plus the tab selection. Normal categories are always
// shown; contextual ones only between showContextCategory() and
// hideContextCategory(). Exactly one shown category is current.
class RIBBON_EXPORT RibbonModel final : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultRibbonHeight = 270;

    explicit RibbonModel(QObject* parent = nullptr);

    QVector<RibbonCategory*> categories() const { return m_categories; }
    QVector<RibbonCategory*> shownCategories() const;
    int categoryCount() const { return static_cast<int>(m_categories.size()); }

    RibbonCategory* addCategory(const QString& title);
    RibbonCategory* addContextCategory(const QString& title, const QColor& color = {});
    RibbonResult removeCategory(RibbonCategory* category);
    void clearCategories();

    RibbonCategory* currentCategory() const { return m_current; }
    int currentIndex() const;
    RibbonResult setCurrentCategory(RibbonCategory* category);
    RibbonResult setCurrentIndex(int index);

    RibbonResult showContextCategory(RibbonCategory* category);
    RibbonResult hideContextCategory(RibbonCategory* category);
    bool isCategoryShown(const RibbonCategory* category) const;

    int ribbonHeight() const { return m_ribbonHeight; }
    RibbonResult setRibbonHeight(int height);

    bool isCollapsed() const { return m_collapsed; }
    void setCollapsed(bool collapsed);

    void beginUpdateBatch();
    void endUpdateBatch();
    bool isInUpdateBatch() const { return m_updateBatchDepth > 0; }

signals:
    void structureChanged();
    void currentCategoryChanged(Ribbon::RibbonCategory* category);
    void collapsedChanged(bool collapsed);
    void ribbonHeightChanged(int height);

private:
    RibbonCategory* insertCategory(RibbonCategory* category);
    RibbonResult checkOwned(const RibbonCategory* category, const char* operation) const;
    RibbonCategory* firstShownCategory() const;
    void setCurrent(RibbonCategory* category);
    void notifyStructureChanged();

    QVector<RibbonCategory*> m_categories;
    QSet<const RibbonCategory*> m_shownContextCategories;
    RibbonCategory* m_current = nullptr;
    int m_nextContextColor = 0;

    int m_ribbonHeight = DefaultRibbonHeight;
    bool m_collapsed = false;

    int m_updateBatchDepth = 0;
    bool m_structureChangePending = false;
    RibbonCategory* m_currentAtBatchStart = nullptr;
};

} // namespace Ribbon
