// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(RIBBON_BUILD_SHARED) && (RIBBON_BUILD_SHARED == 1)
#	if defined(RIBBON_LIBRARY)
#		define RIBBON_EXPORT Q_DECL_EXPORT
#	else
#		define RIBBON_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define RIBBON_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(ribbonlog)
