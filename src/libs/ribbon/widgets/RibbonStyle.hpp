// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "ribbon/RibbonTypes.hpp"

namespace Ribbon {

struct RibbonStyle final
{
    static constexpr int IconLargePx = 48;
    static constexpr int IconMediumPx = 32;
    static constexpr int IconSmallPx = 16;

    static constexpr int TitleBarIconPx = 32;
    static constexpr int DisplayOptionsIconPx = 16;
    static constexpr int PanelOptionIconPx = 16;

    static constexpr int TabFontPointSize = 10;
    static constexpr int MainSpacingPx = 5;
    static constexpr int PanelSpacingPx = 5;
    static constexpr int SeparatorWidthPx = 6;

    static constexpr int LargeButtonMinWidth = 56;
    static constexpr int SmallButtonMinWidth = 48;

    static constexpr int iconPxFor(ItemSize size)
    {
        switch (size) {
        case ItemSize::Large: return IconLargePx;
        case ItemSize::Medium: return IconMediumPx;
        case ItemSize::Small: return IconSmallPx;
        }
        return IconSmallPx;
    }
};

} // namespace Ribbon
