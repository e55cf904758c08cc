// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archivediff/DiffTypes.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QLocale>

namespace ArchiveDiff {

QString changeTypeShort(ChangeType type)
{
    switch (type) {
        case ChangeType::Added: return QStringLiteral("A");
        case ChangeType::Removed: return QStringLiteral("D");
        case ChangeType::Modified: return QStringLiteral("M");
        case ChangeType::None: break;
    }
    return {};
}

QString changeTypeName(ChangeType type)
{
    switch (type) {
        case ChangeType::Added: return QCoreApplication::translate("ArchiveDiff", "added");
        case ChangeType::Removed: return QCoreApplication::translate("ArchiveDiff", "removed");
        case ChangeType::Modified: return QCoreApplication::translate("ArchiveDiff", "modified");
        case ChangeType::None: break;
    }
    return QCoreApplication::translate("ArchiveDiff", "unchanged");
}

QString fileTypeName(FileType type)
{
    switch (type) {
        case FileType::Directory: return QCoreApplication::translate("ArchiveDiff", "Directory");
        case FileType::Link: return QCoreApplication::translate("ArchiveDiff", "Link");
        case FileType::File: break;
    }
    return QCoreApplication::translate("ArchiveDiff", "File");
}

QString formatSize(qint64 bytes)
{
    const QString magnitude = QLocale::c().formattedDataSize(qAbs(bytes), 1, QLocale::DataSizeSIFormat);
    return bytes < 0 ? QLatin1Char('-') + magnitude : magnitude;
}

} // namespace ArchiveDiff
