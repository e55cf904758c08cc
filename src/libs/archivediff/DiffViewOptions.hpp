// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archivediff/ArchiveDiffGlobal.hpp"
#include "archivediff/DiffSortPolicy.hpp"

#include <utils/PathTreeModel.hpp>
#include <utils/Result.hpp>

#include <QtCore/QJsonObject>

namespace ArchiveDiff {

class DiffSortProxyModel;
class DiffTreeModel;

struct ARCHIVEDIFF_EXPORT DiffViewOptions final {
    Utils::PathTreeModelBase::DisplayMode displayMode = Utils::PathTreeModelBase::DisplayMode::Tree;
    bool foldersOnTop = false;
    DiffColumn sortColumn = DiffColumn::Name;
    Qt::SortOrder sortOrder = Qt::AscendingOrder;

    friend bool operator==(const DiffViewOptions&, const DiffViewOptions&) = default;
};

// Missing keys keep the value already in `out`; unknown names are errors and
// leave `out` untouched.
ARCHIVEDIFF_EXPORT Utils::Result parseDiffViewOptions(const QJsonObject& json, DiffViewOptions& out);
ARCHIVEDIFF_EXPORT QJsonObject serializeDiffViewOptions(const DiffViewOptions& options);
ARCHIVEDIFF_EXPORT Utils::Result loadDiffViewOptionsFromFile(const QString& path, DiffViewOptions& out);

ARCHIVEDIFF_EXPORT QString displayModeName(Utils::PathTreeModelBase::DisplayMode mode);
ARCHIVEDIFF_EXPORT bool displayModeFromName(QStringView name, Utils::PathTreeModelBase::DisplayMode& mode);

ARCHIVEDIFF_EXPORT void applyDiffViewOptions(const DiffViewOptions& options,
                                             DiffTreeModel& model,
                                             DiffSortProxyModel& proxy);

} // namespace ArchiveDiff
