// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "ribbon/RibbonGlobal.hpp"

Q_LOGGING_CATEGORY(ribbonlog, "qtribbon.model")
