// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ribbon/PanelItemRegistry.hpp"

#include <array>

namespace Ribbon {

namespace {

using K = PanelItemKind;
using S = ItemSize;

constexpr std::array<PanelItemTraits, kPanelItemKindCount> kTraits = {{
    {K::Button,              "Button",              S::Large,  0, 1, true,  false},
    {K::SmallButton,         "SmallButton",         S::Small,  0, 1, true,  false},
    {K::MediumButton,        "MediumButton",        S::Medium, 0, 1, true,  false},
    {K::LargeButton,         "LargeButton",         S::Large,  0, 1, true,  false},
    {K::ToggleButton,        "ToggleButton",        S::Large,  0, 1, true,  true},
    {K::SmallToggleButton,   "SmallToggleButton",   S::Small,  0, 1, true,  true},
    {K::MediumToggleButton,  "MediumToggleButton",  S::Medium, 0, 1, true,  true},
    {K::LargeToggleButton,   "LargeToggleButton",   S::Large,  0, 1, true,  true},
    {K::ComboBox,            "ComboBox",            S::Small,  0, 1, false, false},
    {K::FontComboBox,        "FontComboBox",        S::Small,  0, 1, false, false},
    {K::LineEdit,            "LineEdit",            S::Small,  0, 1, false, false},
    {K::TextEdit,            "TextEdit",            S::Small,  0, 1, false, false},
    {K::PlainTextEdit,       "PlainTextEdit",       S::Small,  0, 1, false, false},
    {K::Label,               "Label",               S::Small,  0, 1, false, false},
    {K::ProgressBar,         "ProgressBar",         S::Small,  0, 1, false, false},
    {K::Slider,              "Slider",              S::Small,  0, 1, false, false},
    {K::SpinBox,             "SpinBox",             S::Small,  0, 1, false, false},
    {K::DoubleSpinBox,       "DoubleSpinBox",       S::Small,  0, 1, false, false},
    {K::DateEdit,            "DateEdit",            S::Small,  0, 1, false, false},
    {K::TimeEdit,            "TimeEdit",            S::Small,  0, 1, false, false},
    {K::DateTimeEdit,        "DateTimeEdit",        S::Small,  0, 1, false, false},
    {K::TableWidget,         "TableWidget",         S::Small,  0, 1, false, false},
    {K::TreeWidget,          "TreeWidget",          S::Small,  0, 1, false, false},
    {K::ListWidget,          "ListWidget",          S::Small,  0, 1, false, false},
    {K::CalendarWidget,      "CalendarWidget",      S::Small,  0, 1, false, false},
    {K::Separator,           "Separator",           S::Large,  0, 1, false, false},
    {K::HorizontalSeparator, "HorizontalSeparator", S::Small,  1, 2, false, false},
    {K::VerticalSeparator,   "VerticalSeparator",   S::Large,  0, 1, false, false},
    {K::Gallery,             "Gallery",             S::Large,  0, 1, false, false},
    {K::Custom,              "Custom",              S::Small,  0, 1, false, false},
}};

consteval bool tableMatchesEnum()
{
    for (std::size_t i = 0; i < kTraits.size(); ++i) {
        if (static_cast<std::size_t>(kTraits[i].kind) != i)
            return false;
    }
    return true;
}

static_assert(tableMatchesEnum(), "panel item traits must be ordered like PanelItemKind");

} // namespace

const PanelItemTraits& PanelItemRegistry::traits(PanelItemKind kind)
{
    return kTraits[static_cast<std::size_t>(kind)];
}

QString PanelItemRegistry::typeName(PanelItemKind kind)
{
    return QString::fromLatin1(traits(kind).typeName);
}

RibbonExpected<PanelItemKind> PanelItemRegistry::kindFromTypeName(const QString& typeName)
{
    const QString trimmed = typeName.trimmed();
    for (const auto& t : kTraits) {
        // Custom items need a factory and cannot be requested by name.
        if (t.kind == PanelItemKind::Custom)
            continue;
        if (trimmed.compare(QLatin1String(t.typeName), Qt::CaseInsensitive) == 0)
            return t.kind;
    }

    return ribbonFailure(RibbonErrorCode::NotFound,
                         QString("Panel item registry: unknown item type '%1'.").arg(typeName));
}

QStringList PanelItemRegistry::typeNames()
{
    QStringList out;
    out.reserve(static_cast<qsizetype>(kTraits.size()) - 1);
    for (const auto& t : kTraits) {
        if (t.kind != PanelItemKind::Custom)
            out.push_back(QString::fromLatin1(t.typeName));
    }
    return out;
}

} // namespace Ribbon
