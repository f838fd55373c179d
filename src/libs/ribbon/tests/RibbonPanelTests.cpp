// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "ribbon/RibbonPanel.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtTest/QSignalSpy>
#include <QtWidgets/QApplication>
#include <QtWidgets/QLabel>

#include <memory>

using Ribbon::ButtonOptions;
using Ribbon::CellRect;
using Ribbon::GridAllocator;
using Ribbon::PanelItemKind;
using Ribbon::PanelItemSpec;
using Ribbon::RibbonErrorCode;
using Ribbon::RibbonPanel;
using Ribbon::SpaceFindMode;

namespace {

QApplication* ensureApp()
{
    static QApplication* app = []() {
        static int argc = 1;
        static char arg0[] = "ribbon-panel-tests";
        static char* argv[] = { arg0, nullptr };
        return new QApplication(argc, argv);
    }();
    return app;
}

std::unique_ptr<RibbonPanel> makePanel(const QString& title, int rows = RibbonPanel::DefaultMaximumRows,
                                       bool showOptionButton = true)
{
    auto allocator = GridAllocator::create(rows);
    EXPECT_TRUE(allocator.has_value());
    return std::make_unique<RibbonPanel>(title, std::move(*allocator), showOptionButton);
}

ButtonOptions withText(const QString& text)
{
    ButtonOptions options;
    options.text = text;
    return options;
}

QList<PanelItemSpec> specsFromJson(const char* json)
{
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray(json));
    EXPECT_TRUE(doc.isArray());
    const auto specs = PanelItemSpec::listFromJson(doc.array());
    EXPECT_TRUE(specs.has_value());
    return specs.value_or(QList<PanelItemSpec>{});
}

} // namespace

TEST(RibbonPanelTests, SizeRowsDeriveFromMaximumRows)
{
    auto panel = makePanel("Clipboard");
    EXPECT_EQ(panel->maximumRows(), 6);
    EXPECT_EQ(panel->smallRows(), 2);
    EXPECT_EQ(panel->mediumRows(), 3);
    EXPECT_EQ(panel->largeRows(), 6);

    EXPECT_TRUE(panel->setMaximumRows(3));
    EXPECT_EQ(panel->smallRows(), 1);
    EXPECT_EQ(panel->mediumRows(), 2);
    EXPECT_EQ(panel->largeRows(), 3);
}

TEST(RibbonPanelTests, MaximumRowsAreFixedOnceItemsExist)
{
    ensureApp();
    auto panel = makePanel("Clipboard");
    ASSERT_TRUE(panel->addSmallButton("copy", withText("Copy")).has_value());

    const auto rejected = panel->setMaximumRows(4);
    EXPECT_EQ(rejected.code(), RibbonErrorCode::Configuration);
    EXPECT_EQ(panel->maximumRows(), 6);
}

TEST(RibbonPanelTests, SizeRowOverridesMustFitTheGrid)
{
    auto panel = makePanel("View");
    EXPECT_EQ(panel->setSmallRows(0).code(), RibbonErrorCode::InvalidArgument);
    EXPECT_EQ(panel->setMediumRows(7).code(), RibbonErrorCode::InvalidArgument);
    EXPECT_EQ(panel->mediumRows(), 3);

    EXPECT_TRUE(panel->setLargeRows(5));
    EXPECT_EQ(panel->largeRows(), 5);
}

TEST(RibbonPanelTests, LargeButtonSpansAllRowsAndOwnsItsAction)
{
    ensureApp();
    auto panel = makePanel("File");

    ButtonOptions options = withText("Open");
    options.toolTip = "Open a document";
    const auto action = panel->addLargeButton("open", options);
    ASSERT_TRUE(action.has_value());
    ASSERT_NE(*action, nullptr);
    EXPECT_EQ((*action)->text(), "Open");
    EXPECT_EQ((*action)->toolTip(), "Open a document");
    EXPECT_EQ((*action)->parent(), panel.get());
    EXPECT_FALSE((*action)->isCheckable());

    const auto item = panel->item("open");
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->kind, PanelItemKind::LargeButton);
    EXPECT_EQ(item->cells, (CellRect{0, 0, 6, 1}));

    QSignalSpy triggered(*action, &QAction::triggered);
    (*action)->trigger();
    EXPECT_EQ(triggered.count(), 1);
}

TEST(RibbonPanelTests, SmallButtonsStackBeforeOpeningAColumn)
{
    ensureApp();
    auto panel = makePanel("Font");

    for (const char* name : {"bold", "italic", "underline", "strike"})
        ASSERT_TRUE(panel->addSmallButton(name, withText(name)).has_value());

    EXPECT_EQ(panel->item("bold")->cells, (CellRect{0, 0, 2, 1}));
    EXPECT_EQ(panel->item("italic")->cells, (CellRect{2, 0, 2, 1}));
    EXPECT_EQ(panel->item("underline")->cells, (CellRect{4, 0, 2, 1}));
    EXPECT_EQ(panel->item("strike")->cells, (CellRect{0, 1, 2, 1}));
    EXPECT_EQ(panel->columnCount(), 2);
}

TEST(RibbonPanelTests, ToggleButtonsAreCheckable)
{
    ensureApp();
    auto panel = makePanel("View");
    const auto action = panel->addMediumToggleButton("ruler", withText("Ruler"));
    ASSERT_TRUE(action.has_value());
    EXPECT_TRUE((*action)->isCheckable());
    EXPECT_EQ(panel->item("ruler")->cells.rowSpan, 3);
}

TEST(RibbonPanelTests, DuplicateNamesAreRejectedWithoutPlacing)
{
    ensureApp();
    auto panel = makePanel("Edit");
    ASSERT_TRUE(panel->addLabel("status", "Ready").has_value());
    const int freeCells = panel->allocator().freeCellCount();

    const auto again = panel->addLabel("status", "Busy");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code(), RibbonErrorCode::Duplicate);
    EXPECT_EQ(panel->itemCount(), 1);
    EXPECT_EQ(panel->allocator().freeCellCount(), freeCells);

    EXPECT_TRUE(panel->addLabel({}, "unnamed").has_value());
    EXPECT_TRUE(panel->addLabel({}, "unnamed too").has_value());
    EXPECT_EQ(panel->itemCount(), 3);
}

TEST(RibbonPanelTests, RowSpanBeyondMaximumRowsIsInvalidSpan)
{
    auto panel = makePanel("Edit", 3);
    const auto tooTall = panel->addControl(PanelItemKind::LineEdit, "search", {{"rowSpan", 4}});
    ASSERT_FALSE(tooTall.has_value());
    EXPECT_EQ(tooTall.error().code(), RibbonErrorCode::InvalidSpan);
    EXPECT_FALSE(panel->allocator().hasPlacements());
}

TEST(RibbonPanelTests, ControlArgumentsSelectModeAndSize)
{
    auto panel = makePanel("Insert");
    const auto first = panel->addControl(PanelItemKind::ComboBox, "style", {{"mode", "rowwise"}, {"colSpan", 2}});
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->mode, SpaceFindMode::RowWise);
    EXPECT_EQ(first->cells, (CellRect{0, 0, 2, 2}));

    const auto medium = panel->addControl(PanelItemKind::Label, "caption", {{"size", "Medium"}});
    ASSERT_TRUE(medium.has_value());
    EXPECT_EQ(medium->cells.rowSpan, 3);

    const auto badMode = panel->addControl(PanelItemKind::Label, "broken", {{"mode", "diagonal"}});
    ASSERT_FALSE(badMode.has_value());
    EXPECT_EQ(badMode.error().code(), RibbonErrorCode::InvalidArgument);
}

TEST(RibbonPanelTests, HorizontalSeparatorTakesOneRowAndTwoColumns)
{
    auto panel = makePanel("Layout");
    const auto sep = panel->addHorizontalSeparator("rule");
    ASSERT_TRUE(sep.has_value());
    EXPECT_EQ(sep->cells, (CellRect{0, 0, 1, 2}));
}

TEST(RibbonPanelTests, BulkAddPlacesEverySpecInOrder)
{
    ensureApp();
    auto panel = makePanel("Bulk");
    const auto specs = specsFromJson(R"([
        {"name": "paste", "type": "LargeButton", "arguments": {"text": "Paste"}},
        {"name": "cut", "type": "smallbutton", "arguments": {"text": "Cut"}},
        {"name": "copy", "type": "SmallButton", "arguments": {"text": "Copy"}},
        {"name": "font", "type": "FontComboBox"},
        {"name": "size", "type": "SpinBox", "arguments": {"rowSpan": 2, "colSpan": 1}}
    ])");
    ASSERT_EQ(specs.size(), 5);

    QSignalSpy changed(panel.get(), &RibbonPanel::changed);
    const auto added = panel->addItemsBy(specs);
    ASSERT_TRUE(added.has_value());
    EXPECT_EQ(*added, QStringList({"paste", "cut", "copy", "font", "size"}));
    EXPECT_EQ(changed.count(), 5);

    EXPECT_EQ(panel->item("paste")->cells, (CellRect{0, 0, 6, 1}));
    EXPECT_EQ(panel->item("cut")->cells, (CellRect{0, 1, 2, 1}));
    EXPECT_EQ(panel->item("copy")->cells, (CellRect{2, 1, 2, 1}));
    EXPECT_EQ(panel->item("font")->cells, (CellRect{4, 1, 2, 1}));
    EXPECT_EQ(panel->item("size")->cells, (CellRect{0, 2, 2, 1}));
    ASSERT_FALSE(panel->item("paste")->action.isNull());
    EXPECT_EQ(panel->item("paste")->action->text(), "Paste");
}

TEST(RibbonPanelTests, BulkAddIsAllOrNothing)
{
    ensureApp();
    auto panel = makePanel("Bulk");

    const auto unknownType = panel->addItemsBy(specsFromJson(R"([
        {"name": "ok", "type": "Label"},
        {"name": "nope", "type": "Hologram"}
    ])"));
    ASSERT_FALSE(unknownType.has_value());
    EXPECT_EQ(unknownType.error().code(), RibbonErrorCode::NotFound);

    const auto repeated = panel->addItemsBy(specsFromJson(R"([
        {"name": "twice", "type": "Label"},
        {"name": "twice", "type": "LineEdit"}
    ])"));
    ASSERT_FALSE(repeated.has_value());
    EXPECT_EQ(repeated.error().code(), RibbonErrorCode::Duplicate);

    const auto tooTall = panel->addItemsBy(specsFromJson(R"([
        {"name": "fine", "type": "Label"},
        {"name": "tall", "type": "TextEdit", "arguments": {"rowSpan": 9}}
    ])"));
    ASSERT_FALSE(tooTall.has_value());
    EXPECT_EQ(tooTall.error().code(), RibbonErrorCode::InvalidSpan);

    EXPECT_EQ(panel->itemCount(), 0);
    EXPECT_FALSE(panel->allocator().hasPlacements());
}

TEST(RibbonPanelTests, SpecListRejectsMalformedEntries)
{
    const QJsonDocument doc = QJsonDocument::fromJson(R"([{"name": "x"}])");
    const auto specs = PanelItemSpec::listFromJson(doc.array());
    ASSERT_FALSE(specs.has_value());
    EXPECT_EQ(specs.error().code(), RibbonErrorCode::InvalidArgument);
}

TEST(RibbonPanelTests, RemovedItemKeepsItsCellsReserved)
{
    ensureApp();
    auto panel = makePanel("Edit");
    ASSERT_TRUE(panel->addLargeButton("find", withText("Find")).has_value());
    const int freeCells = panel->allocator().freeCellCount();

    EXPECT_TRUE(panel->removeItem("find"));
    EXPECT_EQ(panel->itemCount(), 0);
    EXPECT_EQ(panel->item("find").error().code(), RibbonErrorCode::NotFound);
    EXPECT_EQ(panel->allocator().freeCellCount(), freeCells);
    EXPECT_FALSE(panel->allocator().isFree(0, 0));

    EXPECT_EQ(panel->removeItem("find").code(), RibbonErrorCode::NotFound);

    ASSERT_TRUE(panel->addLargeButton("replace", withText("Replace")).has_value());
    EXPECT_EQ(panel->item("replace")->cells.column, 1);
}

TEST(RibbonPanelTests, CustomWidgetNeedsAFactory)
{
    auto panel = makePanel("Custom");
    const auto missing = panel->addWidget("empty", {}, 1);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code(), RibbonErrorCode::InvalidArgument);

    const auto placed = panel->addMediumWidget("label", [](QWidget* parent) { return new QLabel("hi", parent); });
    ASSERT_TRUE(placed.has_value());
    EXPECT_EQ(placed->kind, PanelItemKind::Custom);
    EXPECT_EQ(placed->cells.rowSpan, 3);
    EXPECT_TRUE(static_cast<bool>(placed->factory));

    EXPECT_EQ(panel->addControl(PanelItemKind::Custom, "raw").error().code(), RibbonErrorCode::InvalidArgument);
}

TEST(RibbonPanelTests, OptionButtonSignalsOnlyWhenShown)
{
    auto shown = makePanel("Paragraph");
    QSignalSpy shownSpy(shown.get(), &RibbonPanel::optionTriggered);
    shown->triggerOption();
    EXPECT_EQ(shownSpy.count(), 1);
    EXPECT_EQ(shown->optionToolTip(), "Panel options");

    auto hidden = makePanel("Styles", 6, false);
    QSignalSpy hiddenSpy(hidden.get(), &RibbonPanel::optionTriggered);
    hidden->triggerOption();
    EXPECT_EQ(hiddenSpy.count(), 0);
}

TEST(RibbonPanelTests, ItemAtReportsOutOfRange)
{
    auto panel = makePanel("Edit");
    ASSERT_TRUE(panel->addLabel("a", "A").has_value());
    EXPECT_EQ(panel->itemAt(0)->name, "a");
    EXPECT_EQ(panel->itemAt(1).error().code(), RibbonErrorCode::NotFound);
    EXPECT_EQ(panel->itemAt(-1).error().code(), RibbonErrorCode::NotFound);
}
