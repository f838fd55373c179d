// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "ribbon/PanelItemRegistry.hpp"

using Ribbon::ItemSize;
using Ribbon::PanelItemKind;
using Ribbon::PanelItemRegistry;

TEST(PanelItemRegistryTests, LooksUpTypesCaseInsensitively)
{
    const auto large = PanelItemRegistry::kindFromTypeName("largebutton");
    ASSERT_TRUE(large.has_value());
    EXPECT_EQ(*large, PanelItemKind::LargeButton);

    const auto combo = PanelItemRegistry::kindFromTypeName("  ComboBox ");
    ASSERT_TRUE(combo.has_value());
    EXPECT_EQ(*combo, PanelItemKind::ComboBox);
}

TEST(PanelItemRegistryTests, UnknownAndCustomTypesAreNotFound)
{
    const auto unknown = PanelItemRegistry::kindFromTypeName("Spinner");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code(), Ribbon::RibbonErrorCode::NotFound);
    EXPECT_TRUE(unknown.error().message().contains("Spinner"));

    EXPECT_FALSE(PanelItemRegistry::kindFromTypeName("Custom").has_value());
    EXPECT_FALSE(PanelItemRegistry::typeNames().contains("Custom"));
}

TEST(PanelItemRegistryTests, TraitsDescribeButtonsAndSeparators)
{
    const auto& toggle = PanelItemRegistry::traits(PanelItemKind::SmallToggleButton);
    EXPECT_TRUE(toggle.hasAction);
    EXPECT_TRUE(toggle.checkable);
    EXPECT_EQ(toggle.defaultSize, ItemSize::Small);

    const auto& plain = PanelItemRegistry::traits(PanelItemKind::Button);
    EXPECT_TRUE(plain.hasAction);
    EXPECT_FALSE(plain.checkable);
    EXPECT_EQ(plain.defaultSize, ItemSize::Large);

    const auto& hsep = PanelItemRegistry::traits(PanelItemKind::HorizontalSeparator);
    EXPECT_EQ(hsep.fixedRowSpan, 1);
    EXPECT_EQ(hsep.defaultColumnSpan, 2);
    EXPECT_FALSE(hsep.hasAction);

    EXPECT_EQ(PanelItemRegistry::traits(PanelItemKind::Gallery).defaultSize, ItemSize::Large);
}

TEST(PanelItemRegistryTests, TypeNamesRoundTripThroughLookup)
{
    const QStringList names = PanelItemRegistry::typeNames();
    EXPECT_EQ(names.size(), static_cast<qsizetype>(Ribbon::kPanelItemKindCount) - 1);

    for (const QString& name : names) {
        const auto kind = PanelItemRegistry::kindFromTypeName(name);
        ASSERT_TRUE(kind.has_value()) << name.toStdString();
        EXPECT_EQ(PanelItemRegistry::typeName(*kind), name);
    }
}
