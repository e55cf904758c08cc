// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/PathTreeModel.hpp"

namespace Utils {

PathTreeModelBase::PathTreeModelBase(QObject* parent)
    : QAbstractItemModel(parent)
{
}

void PathTreeModelBase::setDisplayMode(DisplayMode mode)
{
    if (mode == m_mode)
        return;

    beginResetModel();
    m_mode = mode;
    endResetModel();

    emit displayModeChanged(m_mode);
}

} // namespace Utils
