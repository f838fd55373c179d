// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ribbon/RibbonError.hpp"
#include "ribbon/RibbonGlobal.hpp"
#include "ribbon/RibbonPanel.hpp"

#include <QtCore/QHash>
#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QString>
#include <QtCore/QVector>
#include <QtGui/QColor>

#include <memory>

namespace Ribbon {

class RibbonModel;

enum class CategoryStyle : unsigned char {
    Normal,
    Contextual
};

// Fixed tint palette for contextual categories.
RIBBON_EXPORT const QVector<QColor>& contextualColors();

class RIBBON_EXPORT RibbonCategory final : public QObject
{
    Q_OBJECT

public:
    explicit RibbonCategory(QString title,
                            CategoryStyle style = CategoryStyle::Normal,
                            QColor color = {},
                            QObject* parent = nullptr);

    const QString& title() const { return m_title; }
    void setTitle(QString title);

    CategoryStyle categoryStyle() const { return m_style; }
    void setCategoryStyle(CategoryStyle style);
    bool isContextual() const { return m_style == CategoryStyle::Contextual; }

    const QColor& color() const { return m_color; }
    void setColor(QColor color);

    RibbonModel* ribbon() const { return m_ribbon; }

    RibbonResult showContextCategory();
    RibbonResult hideContextCategory();
    RibbonResult setCategoryState(bool shown);
    bool isShown() const;

    RibbonExpected<RibbonPanel*> addPanel(const QString& title,
                                          int maxRows = RibbonPanel::DefaultMaximumRows,
                                          bool showOptionButton = true);
    RibbonResult removePanel(const QString& title);
    RibbonExpected<std::unique_ptr<RibbonPanel>> takePanel(const QString& title);
    RibbonExpected<RibbonPanel*> panel(const QString& title) const;
    RibbonResult renamePanel(const QString& title, const QString& newTitle);

    QVector<RibbonPanel*> panels() const { return m_panels; }
    int panelCount() const { return static_cast<int>(m_panels.size()); }

    void triggerDisplayOptions();

signals:
    void changed();
    void displayOptionsTriggered();

private:
    friend class RibbonModel;
    void setRibbon(RibbonModel* ribbon) { m_ribbon = ribbon; }
    RibbonPanel* detachPanel(const QString& title);

    QString m_title;
    CategoryStyle m_style = CategoryStyle::Normal;
    QColor m_color;
    QPointer<RibbonModel> m_ribbon;

    QVector<RibbonPanel*> m_panels;
    QHash<QString, RibbonPanel*> m_panelsByTitle;
};

} // namespace Ribbon
