// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ribbon/widgets/PanelWidgetFactory.hpp"

#include "ribbon/widgets/RibbonStyle.hpp"
#include "ribbon/widgets/RibbonToolButton.hpp"

#include <QtCore/QLoggingCategory>
#include <QtCore/QStringList>
#include <QtWidgets/QCalendarWidget>
#include <QtWidgets/QComboBox>
#include <QtWidgets/QDateEdit>
#include <QtWidgets/QDateTimeEdit>
#include <QtWidgets/QDoubleSpinBox>
#include <QtWidgets/QFontComboBox>
#include <QtWidgets/QFrame>
#include <QtWidgets/QLabel>
#include <QtWidgets/QLineEdit>
#include <QtWidgets/QListWidget>
#include <QtWidgets/QPlainTextEdit>
#include <QtWidgets/QProgressBar>
#include <QtWidgets/QSlider>
#include <QtWidgets/QSpinBox>
#include <QtWidgets/QTableWidget>
#include <QtWidgets/QTextEdit>
#include <QtWidgets/QTimeEdit>
#include <QtWidgets/QTreeWidget>

#include <array>

Q_LOGGING_CATEGORY(panelfactorylog, "qtribbon.widgets.factory")

namespace Ribbon {

using namespace Qt::StringLiterals;

namespace {

QString textArg(const PanelItem& item)
{
    return item.arguments.value(u"text"_s).toString();
}

QStringList entriesArg(const PanelItem& item)
{
    return item.arguments.value(u"items"_s).toStringList();
}

int intArg(const PanelItem& item, const QString& key, int fallback)
{
    bool ok = false;
    const int value = item.arguments.value(key).toInt(&ok);
    return ok ? value : fallback;
}

Qt::Orientation orientationArg(const PanelItem& item, Qt::Orientation fallback)
{
    const QVariant value = item.arguments.value(u"orientation"_s);
    if (!value.isValid())
        return fallback;

    if (value.typeId() == QMetaType::QString) {
        const QString name = value.toString().trimmed().toLower();
        if (name == "horizontal"_L1)
            return Qt::Horizontal;
        if (name == "vertical"_L1)
            return Qt::Vertical;
        qCWarning(panelfactorylog).noquote() << "Unknown orientation" << value.toString() << "for" << item.name;
        return fallback;
    }

    const int raw = value.toInt();
    return raw == Qt::Vertical ? Qt::Vertical : (raw == Qt::Horizontal ? Qt::Horizontal : fallback);
}

QFrame* makeSeparator(const PanelItem& item, Qt::Orientation orientation, QWidget* parent)
{
    auto* sep = new QFrame(parent);
    sep->setObjectName("RibbonSeparator");
    sep->setFrameShadow(QFrame::Sunken);

    const int thickness = intArg(item, u"width"_s, RibbonStyle::SeparatorWidthPx);
    if (orientation == Qt::Vertical) {
        sep->setFrameShape(QFrame::VLine);
        sep->setFixedWidth(thickness);
    } else {
        sep->setFrameShape(QFrame::HLine);
        sep->setFixedHeight(thickness);
    }
    return sep;
}

QWidget* buildButton(const PanelItem& item, QWidget* parent)
{
    if (!item.action) {
        qCWarning(panelfactorylog).noquote() << "Button" << item.name << "has no action";
        return nullptr;
    }

    auto* button = new RibbonToolButton(parent);
    button->setDefaultAction(item.action);
    button->setButtonSize(item.size);
    button->setShowText(item.arguments.value(u"showText"_s, true).toBool());
    return button;
}

QWidget* buildComboBox(const PanelItem& item, QWidget* parent)
{
    auto* combo = new QComboBox(parent);
    combo->addItems(entriesArg(item));
    return combo;
}

QWidget* buildFontComboBox(const PanelItem&, QWidget* parent)
{
    return new QFontComboBox(parent);
}

QWidget* buildLineEdit(const PanelItem& item, QWidget* parent)
{
    auto* edit = new QLineEdit(textArg(item), parent);
    edit->setPlaceholderText(item.arguments.value(u"placeholder"_s).toString());
    return edit;
}

QWidget* buildTextEdit(const PanelItem& item, QWidget* parent)
{
    auto* edit = new QTextEdit(parent);
    edit->setPlainText(textArg(item));
    return edit;
}

QWidget* buildPlainTextEdit(const PanelItem& item, QWidget* parent)
{
    return new QPlainTextEdit(textArg(item), parent);
}

QWidget* buildLabel(const PanelItem& item, QWidget* parent)
{
    auto* label = new QLabel(textArg(item), parent);
    label->setAlignment(Qt::AlignCenter);
    return label;
}

QWidget* buildProgressBar(const PanelItem& item, QWidget* parent)
{
    auto* bar = new QProgressBar(parent);
    bar->setRange(intArg(item, u"minimum"_s, 0), intArg(item, u"maximum"_s, 100));
    bar->setValue(intArg(item, u"value"_s, 0));
    return bar;
}

QWidget* buildSlider(const PanelItem& item, QWidget* parent)
{
    auto* slider = new QSlider(orientationArg(item, Qt::Horizontal), parent);
    slider->setRange(intArg(item, u"minimum"_s, 0), intArg(item, u"maximum"_s, 100));
    slider->setValue(intArg(item, u"value"_s, 0));
    return slider;
}

QWidget* buildSpinBox(const PanelItem& item, QWidget* parent)
{
    auto* spin = new QSpinBox(parent);
    spin->setRange(intArg(item, u"minimum"_s, 0), intArg(item, u"maximum"_s, 99));
    spin->setValue(intArg(item, u"value"_s, 0));
    return spin;
}

QWidget* buildDoubleSpinBox(const PanelItem&, QWidget* parent)
{
    return new QDoubleSpinBox(parent);
}

QWidget* buildDateEdit(const PanelItem&, QWidget* parent)
{
    return new QDateEdit(parent);
}

QWidget* buildTimeEdit(const PanelItem&, QWidget* parent)
{
    return new QTimeEdit(parent);
}

QWidget* buildDateTimeEdit(const PanelItem&, QWidget* parent)
{
    return new QDateTimeEdit(parent);
}

QWidget* buildTableWidget(const PanelItem& item, QWidget* parent)
{
    return new QTableWidget(intArg(item, u"rows"_s, 0), intArg(item, u"columns"_s, 0), parent);
}

QWidget* buildTreeWidget(const PanelItem&, QWidget* parent)
{
    return new QTreeWidget(parent);
}

QWidget* buildListWidget(const PanelItem& item, QWidget* parent)
{
    auto* list = new QListWidget(parent);
    list->addItems(entriesArg(item));
    return list;
}

QWidget* buildCalendarWidget(const PanelItem&, QWidget* parent)
{
    return new QCalendarWidget(parent);
}

QWidget* buildSeparator(const PanelItem& item, QWidget* parent)
{
    return makeSeparator(item, orientationArg(item, Qt::Vertical), parent);
}

QWidget* buildHorizontalSeparator(const PanelItem& item, QWidget* parent)
{
    return makeSeparator(item, Qt::Horizontal, parent);
}

QWidget* buildVerticalSeparator(const PanelItem& item, QWidget* parent)
{
    return makeSeparator(item, Qt::Vertical, parent);
}

QWidget* buildGallery(const PanelItem& item, QWidget* parent)
{
    auto* gallery = new QListWidget(parent);
    gallery->setObjectName("RibbonGallery");
    gallery->setViewMode(QListView::IconMode);
    gallery->setFlow(QListView::LeftToRight);
    gallery->setWrapping(true);
    gallery->setResizeMode(QListView::Adjust);
    gallery->setMovement(QListView::Static);
    gallery->setIconSize(QSize(RibbonStyle::IconMediumPx, RibbonStyle::IconMediumPx));
    gallery->addItems(entriesArg(item));
    return gallery;
}

QWidget* buildCustom(const PanelItem& item, QWidget* parent)
{
    if (!item.factory) {
        qCWarning(panelfactorylog).noquote() << "Custom item" << item.name << "has no widget factory";
        return nullptr;
    }
    return item.factory(parent);
}

constexpr std::array<PanelWidgetFactory::Builder, kPanelItemKindCount> kBuilders = {
    &buildButton,              // Button
    &buildButton,              // SmallButton
    &buildButton,              // MediumButton
    &buildButton,              // LargeButton
    &buildButton,              // ToggleButton
    &buildButton,              // SmallToggleButton
    &buildButton,              // MediumToggleButton
    &buildButton,              // LargeToggleButton
    &buildComboBox,
    &buildFontComboBox,
    &buildLineEdit,
    &buildTextEdit,
    &buildPlainTextEdit,
    &buildLabel,
    &buildProgressBar,
    &buildSlider,
    &buildSpinBox,
    &buildDoubleSpinBox,
    &buildDateEdit,
    &buildTimeEdit,
    &buildDateTimeEdit,
    &buildTableWidget,
    &buildTreeWidget,
    &buildListWidget,
    &buildCalendarWidget,
    &buildSeparator,
    &buildHorizontalSeparator,
    &buildVerticalSeparator,
    &buildGallery,
    &buildCustom,
};

} // namespace

PanelWidgetFactory::Builder PanelWidgetFactory::builderFor(PanelItemKind kind)
{
    const auto index = static_cast<std::size_t>(kind);
    return index < kBuilders.size() ? kBuilders[index] : nullptr;
}

QWidget* PanelWidgetFactory::create(const PanelItem& item, QWidget* parent)
{
    const Builder builder = builderFor(item.kind);
    if (!builder)
        return nullptr;

    QWidget* w = builder(item, parent);
    if (!w)
        return nullptr;

    w->setParent(parent);
    if (w->objectName().isEmpty())
        w->setObjectName(item.name.isEmpty() ? QString("RibbonItem_%1").arg(PanelItemRegistry::typeName(item.kind))
                                             : item.name);
    return w;
}

} // namespace Ribbon
