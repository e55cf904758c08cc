// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QtGlobal>

#if defined(ARCHIVEDIFF_BUILD_SHARED) && (ARCHIVEDIFF_BUILD_SHARED == 1)
#	if defined(ARCHIVEDIFF_LIBRARY)
#		define ARCHIVEDIFF_EXPORT Q_DECL_EXPORT
#	else
#		define ARCHIVEDIFF_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define ARCHIVEDIFF_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(archivediffmodellog)
Q_DECLARE_LOGGING_CATEGORY(archivediffparserlog)
