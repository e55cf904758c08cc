// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archivediff/ArchiveDiffGlobal.hpp"

#include <QtCore/QFlags>
#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <optional>

namespace ArchiveDiff {

enum class FileType : unsigned char {
    File,
    Directory,
    Link
};

// Reduced classification used for sorting and colouring. The detailed facts
// behind it are kept in DiffData::facts.
enum class ChangeType : unsigned char {
    None,
    Added,
    Modified,
    Removed
};

enum class ChangeFact : unsigned short {
    NoFact          = 0x00,
    Added           = 0x01,
    Removed         = 0x02,
    ContentModified = 0x04,
    ChangedLink     = 0x08,
    ModeChanged     = 0x10,
    OwnerChanged    = 0x20
};
Q_DECLARE_FLAGS(ChangeFacts, ChangeFact)

struct ModeChange final {
    QString oldMode;
    QString newMode;

    friend bool operator==(const ModeChange&, const ModeChange&) = default;
};

struct OwnerChange final {
    QString oldUser;
    QString oldGroup;
    QString newUser;
    QString newGroup;

    friend bool operator==(const OwnerChange&, const OwnerChange&) = default;
};

struct ContentChange final {
    qint64 added = 0;
    qint64 removed = 0;

    friend bool operator==(const ContentChange&, const ContentChange&) = default;
};

struct ARCHIVEDIFF_EXPORT DiffData final {
    FileType fileType = FileType::File;
    ChangeType changeType = ChangeType::None;
    ChangeFacts facts;

    // Signed byte delta. Directories accumulate the deltas of their subtree.
    qint64 size = 0;

    std::optional<ModeChange> modeChange;
    std::optional<OwnerChange> ownerChange;
    std::optional<ContentChange> contentChange;

    // Data of an ancestor that no diff record has described (yet).
    static DiffData placeholder()
    {
        DiffData d;
        d.fileType = FileType::Directory;
        return d;
    }

    bool isPlaceholder() const noexcept { return changeType == ChangeType::None; }

    friend bool operator==(const DiffData&, const DiffData&) = default;
};

struct ARCHIVEDIFF_EXPORT DiffEntry final {
    QString path;
    DiffData data;
};

using DiffEntryList = QVector<DiffEntry>;

// "A", "D", "M", or empty for unchanged.
ARCHIVEDIFF_EXPORT QString changeTypeShort(ChangeType type);
ARCHIVEDIFF_EXPORT QString changeTypeName(ChangeType type);
ARCHIVEDIFF_EXPORT QString fileTypeName(FileType type);

// Decimal (SI) units, sign kept: "-1.5 kB".
ARCHIVEDIFF_EXPORT QString formatSize(qint64 bytes);

} // namespace ArchiveDiff

Q_DECLARE_OPERATORS_FOR_FLAGS(ArchiveDiff::ChangeFacts)

Q_DECLARE_METATYPE(ArchiveDiff::FileType)
Q_DECLARE_METATYPE(ArchiveDiff::ChangeType)
Q_DECLARE_METATYPE(ArchiveDiff::DiffData)
