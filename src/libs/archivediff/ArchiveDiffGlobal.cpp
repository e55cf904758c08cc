// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archivediff/ArchiveDiffGlobal.hpp"

// doc: https://doc.qt.io/qt-6/qloggingcategory.html#creating-category-objects
Q_LOGGING_CATEGORY(archivediffmodellog, "archivediff.model")
Q_LOGGING_CATEGORY(archivediffparserlog, "archivediff.parser")
