// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ribbon/GridAllocator.hpp"
#include "ribbon/PanelItemRegistry.hpp"
#include "ribbon/RibbonError.hpp"
#include "ribbon/RibbonGlobal.hpp"
#include "ribbon/RibbonTypes.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariantMap>
#include <QtGui/QAction>
#include <QtGui/QIcon>
#include <QtGui/QKeySequence>

#include <functional>
#include <vector>

class QWidget;

namespace Ribbon {

using PanelWidgetFactoryFn = std::function<QWidget*(QWidget* parent)>;

// One entry of a bulk construction request.
struct RIBBON_EXPORT PanelItemSpec final
{
    QString name;
    QString type;
    QVariantMap arguments;

    // Parses [{"name": ..., "type": ..., "arguments": {...}}, ...].
    static RibbonExpected<QList<PanelItemSpec>> listFromJson(const QJsonArray& array);
};

struct RIBBON_EXPORT PanelItem final
{
    // Unique within the panel for its lifetime, assigned on placement.
    quint64 id = 0;
    QString name;
    PanelItemKind kind = PanelItemKind::Custom;
    QVariantMap arguments;
    CellRect cells;
    SpaceFindMode mode = SpaceFindMode::ColumnWise;
    Qt::Alignment alignment = Qt::AlignCenter;
    ItemSize size = ItemSize::Small;

    QPointer<QAction> action;
    PanelWidgetFactoryFn factory;
};

struct RIBBON_EXPORT ButtonOptions final
{
    QString text;
    QIcon icon;
    ItemSize size = ItemSize::Large;
    bool showText = true;
    int columnSpan = 1;
    QKeySequence shortcut;
    QString toolTip;
    QString statusTip;
    SpaceFindMode mode = SpaceFindMode::ColumnWise;
    Qt::Alignment alignment = Qt::AlignCenter;
};

class RIBBON_EXPORT RibbonPanel final : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultMaximumRows = 6;

    RibbonPanel(QString title, GridAllocator allocator, bool showOptionButton = true, QObject* parent = nullptr);

    const QString& title() const { return m_title; }
    // Inside a category the new title must be unique there (Duplicate otherwise).
    RibbonResult setTitle(QString title);

    int maximumRows() const { return m_allocator.rowCount(); }
    int smallRows() const { return m_smallRows; }
    int mediumRows() const { return m_mediumRows; }
    int largeRows() const { return m_largeRows; }
    int rowsFor(ItemSize size) const;

    RibbonResult setMaximumRows(int rows);
    RibbonResult setSmallRows(int rows);
    RibbonResult setMediumRows(int rows);
    RibbonResult setLargeRows(int rows);

    bool showOptionButton() const { return m_showOptionButton; }
    const QString& optionToolTip() const { return m_optionToolTip; }
    void setOptionToolTip(QString text);
    void triggerOption();

    const GridAllocator& allocator() const { return m_allocator; }
    int columnCount() const { return m_allocator.columnCount(); }

    const std::vector<PanelItem>& items() const { return m_items; }
    int itemCount() const { return static_cast<int>(m_items.size()); }
    RibbonExpected<PanelItem> item(const QString& name) const;
    RibbonExpected<PanelItem> itemAt(int index) const;

    // Drops the item from the panel. Its grid cells stay reserved.
    RibbonResult removeItem(const QString& name);

    RibbonExpected<PanelItem> addWidget(const QString& name,
                                        PanelWidgetFactoryFn factory,
                                        int rowSpan,
                                        int colSpan = 1,
                                        SpaceFindMode mode = SpaceFindMode::ColumnWise,
                                        Qt::Alignment alignment = Qt::AlignCenter);
    RibbonExpected<PanelItem> addSmallWidget(const QString& name, PanelWidgetFactoryFn factory,
                                             SpaceFindMode mode = SpaceFindMode::ColumnWise);
    RibbonExpected<PanelItem> addMediumWidget(const QString& name, PanelWidgetFactoryFn factory,
                                              SpaceFindMode mode = SpaceFindMode::ColumnWise);
    RibbonExpected<PanelItem> addLargeWidget(const QString& name, PanelWidgetFactoryFn factory,
                                             SpaceFindMode mode = SpaceFindMode::ColumnWise);

    RibbonExpected<PanelItem> addControl(PanelItemKind kind, const QString& name, const QVariantMap& arguments = {});

    RibbonExpected<QAction*> addButton(const QString& name, const ButtonOptions& options);
    RibbonExpected<QAction*> addSmallButton(const QString& name, ButtonOptions options);
    RibbonExpected<QAction*> addMediumButton(const QString& name, ButtonOptions options);
    RibbonExpected<QAction*> addLargeButton(const QString& name, ButtonOptions options);
    RibbonExpected<QAction*> addToggleButton(const QString& name, const ButtonOptions& options);
    RibbonExpected<QAction*> addSmallToggleButton(const QString& name, ButtonOptions options);
    RibbonExpected<QAction*> addMediumToggleButton(const QString& name, ButtonOptions options);
    RibbonExpected<QAction*> addLargeToggleButton(const QString& name, ButtonOptions options);

    RibbonExpected<PanelItem> addComboBox(const QString& name, const QStringList& entries, int rowSpan = 0);
    RibbonExpected<PanelItem> addSlider(const QString& name, Qt::Orientation orientation = Qt::Horizontal);
    RibbonExpected<PanelItem> addLabel(const QString& name, const QString& text);
    RibbonExpected<PanelItem> addSeparator(const QString& name, Qt::Orientation orientation = Qt::Vertical);
    RibbonExpected<PanelItem> addHorizontalSeparator(const QString& name);
    RibbonExpected<PanelItem> addVerticalSeparator(const QString& name);
    RibbonExpected<PanelItem> addGallery(const QString& name, const QStringList& entries);

    // Validates the whole batch first; nothing is placed if any spec is invalid.
    RibbonExpected<QStringList> addItemsBy(const QList<PanelItemSpec>& specs);

signals:
    void changed();
    void optionTriggered();

private:
    friend class RibbonCategory;
    void applyTitle(QString title);

    struct PlacementRequest {
        PanelItemKind kind = PanelItemKind::Custom;
        ItemSize size = ItemSize::Small;
        int rowSpan = 1;
        int colSpan = 1;
        SpaceFindMode mode = SpaceFindMode::ColumnWise;
        Qt::Alignment alignment = Qt::AlignCenter;
    };

    RibbonExpected<PlacementRequest> resolveRequest(PanelItemKind kind, const QVariantMap& arguments) const;
    RibbonExpected<PanelItem> place(PanelItem item, const PlacementRequest& request);
    RibbonExpected<QAction*> addButtonOfKind(PanelItemKind kind, const QString& name, const ButtonOptions& options);
    QAction* makeAction(const PanelItemTraits& traits, const QVariantMap& arguments);
    bool nameTaken(const QString& name) const;
    RibbonResult checkRows(const char* what, int rows) const;
    void resetSizeRows();

    QString m_title;
    GridAllocator m_allocator;
    bool m_showOptionButton = true;
    QString m_optionToolTip;

    int m_smallRows = 2;
    int m_mediumRows = 3;
    int m_largeRows = DefaultMaximumRows;

    std::vector<PanelItem> m_items;
    quint64 m_lastItemId = 0;
};

} // namespace Ribbon
