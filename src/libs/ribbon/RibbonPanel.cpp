// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ribbon/RibbonPanel.hpp"

#include "ribbon/RibbonCategory.hpp"

#include <QtCore/QDebug>
#include <QtCore/QJsonObject>
#include <QtCore/QSet>

#include <algorithm>

namespace Ribbon {

namespace {

using namespace Qt::StringLiterals;

const QString kRowSpanKey = u"rowSpan"_s;
const QString kColSpanKey = u"colSpan"_s;
const QString kModeKey = u"mode"_s;
const QString kAlignmentKey = u"alignment"_s;
const QString kSizeKey = u"size"_s;

RibbonExpected<int> spanArgument(const QVariantMap& arguments, const QString& key, int fallback)
{
    const auto it = arguments.constFind(key);
    if (it == arguments.constEnd())
        return fallback;

    bool ok = false;
    const int value = it.value().toInt(&ok);
    if (!ok) {
        return ribbonFailure(RibbonErrorCode::InvalidArgument,
                             QString("Panel item argument '%1' is not an integer.").arg(key));
    }
    return value;
}

QIcon iconArgument(const QVariant& value)
{
    if (value.metaType() == QMetaType::fromType<QIcon>())
        return value.value<QIcon>();
    const QString path = value.toString();
    return path.isEmpty() ? QIcon() : QIcon(path);
}

QKeySequence shortcutArgument(const QVariant& value)
{
    if (value.metaType() == QMetaType::fromType<QKeySequence>())
        return value.value<QKeySequence>();
    return QKeySequence(value.toString());
}

QVariantMap buttonArguments(const ButtonOptions& options)
{
    QVariantMap args;
    args.insert(u"text"_s, options.text);
    if (!options.icon.isNull())
        args.insert(u"icon"_s, QVariant::fromValue(options.icon));
    args.insert(kSizeKey, toString(options.size));
    args.insert(u"showText"_s, options.showText);
    args.insert(kColSpanKey, options.columnSpan);
    if (!options.shortcut.isEmpty())
        args.insert(u"shortcut"_s, QVariant::fromValue(options.shortcut));
    if (!options.toolTip.isEmpty())
        args.insert(u"toolTip"_s, options.toolTip);
    if (!options.statusTip.isEmpty())
        args.insert(u"statusTip"_s, options.statusTip);
    args.insert(kModeKey, toString(options.mode));
    args.insert(kAlignmentKey, static_cast<int>(options.alignment));
    return args;
}

} // namespace

RibbonExpected<QList<PanelItemSpec>> PanelItemSpec::listFromJson(const QJsonArray& array)
{
    QList<PanelItemSpec> out;
    out.reserve(array.size());

    for (qsizetype i = 0; i < array.size(); ++i) {
        const QJsonValue v = array.at(i);
        if (!v.isObject()) {
            return ribbonFailure(RibbonErrorCode::InvalidArgument,
                                 QString("Panel item spec #%1 is not an object.").arg(i));
        }

        const QJsonObject o = v.toObject();
        if (!o.value(u"type"_s).isString()) {
            return ribbonFailure(RibbonErrorCode::InvalidArgument,
                                 QString("Panel item spec #%1 has no type.").arg(i));
        }

        PanelItemSpec spec;
        spec.name = o.value(u"name"_s).toString();
        spec.type = o.value(u"type"_s).toString();
        spec.arguments = o.value(u"arguments"_s).toObject().toVariantMap();
        out.push_back(std::move(spec));
    }

    return out;
}

RibbonPanel::RibbonPanel(QString title, GridAllocator allocator, bool showOptionButton, QObject* parent)
    : QObject(parent)
    , m_title(std::move(title))
    , m_allocator(std::move(allocator))
    , m_showOptionButton(showOptionButton)
    , m_optionToolTip(QStringLiteral("Panel options"))
{
    resetSizeRows();
}

RibbonResult RibbonPanel::setTitle(QString title)
{
    if (m_title == title)
        return RibbonResult::success();

    if (auto* category = qobject_cast<RibbonCategory*>(parent()))
        return category->renamePanel(m_title, title);

    applyTitle(std::move(title));
    return RibbonResult::success();
}

void RibbonPanel::applyTitle(QString title)
{
    m_title = std::move(title);
    emit changed();
}

void RibbonPanel::resetSizeRows()
{
    const int rows = m_allocator.rowCount();
    m_largeRows = rows;
    m_mediumRows = std::max((rows + 1) / 2, 1);
    m_smallRows = std::max(qRound(rows / 3.0), 1);
}

int RibbonPanel::rowsFor(ItemSize size) const
{
    switch (size) {
    case ItemSize::Small: return m_smallRows;
    case ItemSize::Medium: return m_mediumRows;
    case ItemSize::Large: return m_largeRows;
    }
    return m_smallRows;
}

RibbonResult RibbonPanel::setMaximumRows(int rows)
{
    if (m_allocator.hasPlacements()) {
        return RibbonResult::failure(RibbonErrorCode::Configuration,
                                     QString("Ribbon panel '%1': set the maximum rows when creating the panel, "
                                             "it cannot change after items have been added.").arg(m_title));
    }

    const RibbonResult res = m_allocator.setRowCount(rows);
    if (!res)
        return res;

    resetSizeRows();
    emit changed();
    return RibbonResult::success();
}

RibbonResult RibbonPanel::checkRows(const char* what, int rows) const
{
    if (rows > 0 && rows <= maximumRows())
        return RibbonResult::success();

    return RibbonResult::failure(RibbonErrorCode::InvalidArgument,
                                 QString("Ribbon panel '%1': invalid %2 row count %3 (maximum %4).")
                                     .arg(m_title, QLatin1String(what)).arg(rows).arg(maximumRows()));
}

RibbonResult RibbonPanel::setSmallRows(int rows)
{
    const RibbonResult res = checkRows("small", rows);
    if (res)
        m_smallRows = rows;
    return res;
}

RibbonResult RibbonPanel::setMediumRows(int rows)
{
    const RibbonResult res = checkRows("medium", rows);
    if (res)
        m_mediumRows = rows;
    return res;
}

RibbonResult RibbonPanel::setLargeRows(int rows)
{
    const RibbonResult res = checkRows("large", rows);
    if (res)
        m_largeRows = rows;
    return res;
}

void RibbonPanel::setOptionToolTip(QString text)
{
    if (m_optionToolTip == text)
        return;
    m_optionToolTip = std::move(text);
    emit changed();
}

void RibbonPanel::triggerOption()
{
    if (!m_showOptionButton)
        return;
    emit optionTriggered();
}

bool RibbonPanel::nameTaken(const QString& name) const
{
    if (name.isEmpty())
        return false;
    return std::any_of(m_items.begin(), m_items.end(),
                       [&name](const PanelItem& it) { return it.name == name; });
}

RibbonExpected<PanelItem> RibbonPanel::item(const QString& name) const
{
    const auto it = std::find_if(m_items.begin(), m_items.end(),
                                 [&name](const PanelItem& i) { return i.name == name; });
    if (name.isEmpty() || it == m_items.end()) {
        return ribbonFailure(RibbonErrorCode::NotFound,
                             QString("Ribbon panel '%1': no item named '%2'.").arg(m_title, name));
    }
    return *it;
}

RibbonExpected<PanelItem> RibbonPanel::itemAt(int index) const
{
    if (index < 0 || index >= itemCount()) {
        return ribbonFailure(RibbonErrorCode::NotFound,
                             QString("Ribbon panel '%1': item index %2 out of range.").arg(m_title).arg(index));
    }
    return m_items.at(static_cast<std::size_t>(index));
}

RibbonResult RibbonPanel::removeItem(const QString& name)
{
    const auto it = std::find_if(m_items.begin(), m_items.end(),
                                 [&name](const PanelItem& i) { return i.name == name; });
    if (name.isEmpty() || it == m_items.end()) {
        return RibbonResult::failure(RibbonErrorCode::NotFound,
                                     QString("Ribbon panel '%1': no item named '%2'.").arg(m_title, name));
    }

    if (it->action)
        it->action->deleteLater();
    m_items.erase(it);
    emit changed();
    return RibbonResult::success();
}

RibbonExpected<RibbonPanel::PlacementRequest> RibbonPanel::resolveRequest(PanelItemKind kind,
                                                                          const QVariantMap& arguments) const
{
    const PanelItemTraits& traits = PanelItemRegistry::traits(kind);

    PlacementRequest req;
    req.kind = kind;
    req.size = traits.defaultSize;

    if (arguments.contains(kSizeKey)) {
        const auto size = itemSizeFromVariant(arguments.value(kSizeKey));
        if (!size)
            return std::unexpected(size.error());
        req.size = *size;
    }

    const int defaultRows = traits.fixedRowSpan > 0 ? traits.fixedRowSpan : rowsFor(req.size);
    const auto rowSpan = spanArgument(arguments, kRowSpanKey, defaultRows);
    if (!rowSpan)
        return std::unexpected(rowSpan.error());
    const auto colSpan = spanArgument(arguments, kColSpanKey, traits.defaultColumnSpan);
    if (!colSpan)
        return std::unexpected(colSpan.error());

    req.rowSpan = *rowSpan;
    req.colSpan = *colSpan;

    if (req.rowSpan < 1 || req.rowSpan > maximumRows() || req.colSpan < 1) {
        return ribbonFailure(RibbonErrorCode::InvalidSpan,
                             QString("Ribbon panel '%1': span %2x%3 does not fit %4 rows.")
                                 .arg(m_title).arg(req.rowSpan).arg(req.colSpan).arg(maximumRows()));
    }

    if (arguments.contains(kModeKey)) {
        const auto mode = spaceFindModeFromVariant(arguments.value(kModeKey));
        if (!mode)
            return std::unexpected(mode.error());
        req.mode = *mode;
    }

    if (arguments.contains(kAlignmentKey))
        req.alignment = Qt::Alignment(arguments.value(kAlignmentKey).toInt());

    return req;
}

RibbonExpected<PanelItem> RibbonPanel::place(PanelItem item, const PlacementRequest& request)
{
    if (nameTaken(item.name)) {
        return ribbonFailure(RibbonErrorCode::Duplicate,
                             QString("Ribbon panel '%1': duplicate item name '%2'.").arg(m_title, item.name));
    }

    const auto placement = m_allocator.requestCells(request.rowSpan, request.colSpan, request.mode);
    if (!placement) {
        qCWarning(ribbonlog).noquote() << placement.error().message();
        return std::unexpected(placement.error());
    }

    item.id = ++m_lastItemId;
    item.cells = CellRect{placement->row, placement->column, request.rowSpan, request.colSpan};
    item.mode = request.mode;
    item.alignment = request.alignment;
    item.size = request.size;

    m_items.push_back(std::move(item));
    return m_items.back();
}

RibbonExpected<PanelItem> RibbonPanel::addWidget(const QString& name,
                                                 PanelWidgetFactoryFn factory,
                                                 int rowSpan,
                                                 int colSpan,
                                                 SpaceFindMode mode,
                                                 Qt::Alignment alignment)
{
    if (!factory) {
        return ribbonFailure(RibbonErrorCode::InvalidArgument,
                             QString("Ribbon panel '%1': widget factory is empty.").arg(m_title));
    }

    PlacementRequest req;
    req.rowSpan = rowSpan;
    req.colSpan = colSpan;
    req.mode = mode;
    req.alignment = alignment;

    PanelItem it;
    it.name = name;
    it.kind = PanelItemKind::Custom;
    it.factory = std::move(factory);

    auto placed = place(std::move(it), req);
    if (placed)
        emit changed();
    return placed;
}

RibbonExpected<PanelItem> RibbonPanel::addSmallWidget(const QString& name, PanelWidgetFactoryFn factory,
                                                      SpaceFindMode mode)
{
    return addWidget(name, std::move(factory), m_smallRows, 1, mode);
}

RibbonExpected<PanelItem> RibbonPanel::addMediumWidget(const QString& name, PanelWidgetFactoryFn factory,
                                                       SpaceFindMode mode)
{
    return addWidget(name, std::move(factory), m_mediumRows, 1, mode);
}

RibbonExpected<PanelItem> RibbonPanel::addLargeWidget(const QString& name, PanelWidgetFactoryFn factory,
                                                      SpaceFindMode mode)
{
    return addWidget(name, std::move(factory), m_largeRows, 1, mode);
}

QAction* RibbonPanel::makeAction(const PanelItemTraits& traits, const QVariantMap& arguments)
{
    auto* action = new QAction(this);
    action->setText(arguments.value(u"text"_s).toString());
    action->setIcon(iconArgument(arguments.value(u"icon"_s)));
    if (arguments.contains(u"shortcut"_s))
        action->setShortcut(shortcutArgument(arguments.value(u"shortcut"_s)));
    action->setToolTip(arguments.value(u"toolTip"_s).toString());
    action->setStatusTip(arguments.value(u"statusTip"_s).toString());
    action->setCheckable(traits.checkable);
    return action;
}

RibbonExpected<PanelItem> RibbonPanel::addControl(PanelItemKind kind, const QString& name, const QVariantMap& arguments)
{
    if (kind == PanelItemKind::Custom) {
        return ribbonFailure(RibbonErrorCode::InvalidArgument,
                             QString("Ribbon panel '%1': custom items need a widget factory.").arg(m_title));
    }

    const auto req = resolveRequest(kind, arguments);
    if (!req)
        return std::unexpected(req.error());

    PanelItem it;
    it.name = name;
    it.kind = kind;
    it.arguments = arguments;

    auto placed = place(std::move(it), *req);
    if (!placed)
        return placed;

    const PanelItemTraits& traits = PanelItemRegistry::traits(kind);
    if (traits.hasAction) {
        QAction* action = makeAction(traits, arguments);
        m_items.back().action = action;
        placed->action = action;
    }

    emit changed();
    return placed;
}

RibbonExpected<QAction*> RibbonPanel::addButtonOfKind(PanelItemKind kind, const QString& name,
                                                      const ButtonOptions& options)
{
    const auto placed = addControl(kind, name, buttonArguments(options));
    if (!placed)
        return std::unexpected(placed.error());
    return placed->action.data();
}

RibbonExpected<QAction*> RibbonPanel::addButton(const QString& name, const ButtonOptions& options)
{
    return addButtonOfKind(PanelItemKind::Button, name, options);
}

RibbonExpected<QAction*> RibbonPanel::addSmallButton(const QString& name, ButtonOptions options)
{
    options.size = ItemSize::Small;
    return addButtonOfKind(PanelItemKind::SmallButton, name, options);
}

RibbonExpected<QAction*> RibbonPanel::addMediumButton(const QString& name, ButtonOptions options)
{
    options.size = ItemSize::Medium;
    return addButtonOfKind(PanelItemKind::MediumButton, name, options);
}

RibbonExpected<QAction*> RibbonPanel::addLargeButton(const QString& name, ButtonOptions options)
{
    options.size = ItemSize::Large;
    return addButtonOfKind(PanelItemKind::LargeButton, name, options);
}

RibbonExpected<QAction*> RibbonPanel::addToggleButton(const QString& name, const ButtonOptions& options)
{
    return addButtonOfKind(PanelItemKind::ToggleButton, name, options);
}

RibbonExpected<QAction*> RibbonPanel::addSmallToggleButton(const QString& name, ButtonOptions options)
{
    options.size = ItemSize::Small;
    return addButtonOfKind(PanelItemKind::SmallToggleButton, name, options);
}

RibbonExpected<QAction*> RibbonPanel::addMediumToggleButton(const QString& name, ButtonOptions options)
{
    options.size = ItemSize::Medium;
    return addButtonOfKind(PanelItemKind::MediumToggleButton, name, options);
}

RibbonExpected<QAction*> RibbonPanel::addLargeToggleButton(const QString& name, ButtonOptions options)
{
    options.size = ItemSize::Large;
    return addButtonOfKind(PanelItemKind::LargeToggleButton, name, options);
}

RibbonExpected<PanelItem> RibbonPanel::addComboBox(const QString& name, const QStringList& entries, int rowSpan)
{
    QVariantMap args{{u"items"_s, entries}};
    if (rowSpan > 0)
        args.insert(kRowSpanKey, rowSpan);
    return addControl(PanelItemKind::ComboBox, name, args);
}

RibbonExpected<PanelItem> RibbonPanel::addSlider(const QString& name, Qt::Orientation orientation)
{
    return addControl(PanelItemKind::Slider, name, {{u"orientation"_s, static_cast<int>(orientation)}});
}

RibbonExpected<PanelItem> RibbonPanel::addLabel(const QString& name, const QString& text)
{
    return addControl(PanelItemKind::Label, name, {{u"text"_s, text}});
}

RibbonExpected<PanelItem> RibbonPanel::addSeparator(const QString& name, Qt::Orientation orientation)
{
    return addControl(PanelItemKind::Separator, name, {{u"orientation"_s, static_cast<int>(orientation)}});
}

RibbonExpected<PanelItem> RibbonPanel::addHorizontalSeparator(const QString& name)
{
    return addControl(PanelItemKind::HorizontalSeparator, name);
}

RibbonExpected<PanelItem> RibbonPanel::addVerticalSeparator(const QString& name)
{
    return addControl(PanelItemKind::VerticalSeparator, name);
}

RibbonExpected<PanelItem> RibbonPanel::addGallery(const QString& name, const QStringList& entries)
{
    return addControl(PanelItemKind::Gallery, name, {{u"items"_s, entries}});
}

RibbonExpected<QStringList> RibbonPanel::addItemsBy(const QList<PanelItemSpec>& specs)
{
    QList<PanelItemKind> kinds;
    kinds.reserve(specs.size());
    QSet<QString> batchNames;

    for (const PanelItemSpec& spec : specs) {
        const auto kind = PanelItemRegistry::kindFromTypeName(spec.type);
        if (!kind)
            return std::unexpected(kind.error());

        const auto req = resolveRequest(*kind, spec.arguments);
        if (!req)
            return std::unexpected(req.error());

        if (!spec.name.isEmpty()) {
            if (nameTaken(spec.name) || batchNames.contains(spec.name)) {
                return ribbonFailure(RibbonErrorCode::Duplicate,
                                     QString("Ribbon panel '%1': duplicate item name '%2'.").arg(m_title, spec.name));
            }
            batchNames.insert(spec.name);
        }

        kinds.push_back(*kind);
    }

    QStringList added;
    for (qsizetype i = 0; i < specs.size(); ++i) {
        const auto placed = addControl(kinds.at(i), specs.at(i).name, specs.at(i).arguments);
        if (!placed)
            return std::unexpected(placed.error());
        added.push_back(placed->name);
    }

    qCDebug(ribbonlog) << "addItemsBy:" << m_title << "added" << added.size() << "items";
    return added;
}

} // namespace Ribbon
