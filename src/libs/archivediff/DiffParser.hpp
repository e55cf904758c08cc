// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archivediff/ArchiveDiffGlobal.hpp"
#include "archivediff/DiffTypes.hpp"

#include <utils/Result.hpp>

#include <QtCore/QByteArray>
#include <QtCore/QJsonObject>
#include <QtCore/QList>
#include <QtCore/QStringList>

namespace ArchiveDiff {

class DiffTreeModel;

enum class DiffFormat : unsigned char {
    Text,
    JsonLines
};

// Converts a size as printed by the backup tool ("77.8", "kB") to bytes,
// rounding to the nearest byte. Units are decimal: B, kB/KB, MB, GB, TB.
ARCHIVEDIFF_EXPORT Utils::Result sizeToBytes(QStringView significand, QStringView unit, qint64& bytes);

// Textual diff output, one changed path per line:
//
//   added directory     home/user/newfolder
//   removed         0 B home/user/file1
//       +32 B     -36 B [-r--rw---- -> -rwxrwx--x] home/user/file.txt
//   changed link [user:dip -> user:user] home/user/link
//
// Blank lines are skipped. Every malformed line adds an error; `out` is only
// filled when all lines parsed.
ARCHIVEDIFF_EXPORT Utils::Result parseDiffLine(const QString& line, DiffEntry& out);
ARCHIVEDIFF_EXPORT Utils::Result parseDiffLines(const QStringList& lines, DiffEntryList& out);
ARCHIVEDIFF_EXPORT Utils::Result parseDiffText(const QByteArray& text, DiffEntryList& out);

// Structured records: {"path": ..., "changes": [{"type": ...}, ...]}.
ARCHIVEDIFF_EXPORT Utils::Result parseDiffJson(const QJsonObject& record, DiffEntry& out);
ARCHIVEDIFF_EXPORT Utils::Result parseDiffJson(const QList<QJsonObject>& records, DiffEntryList& out);
ARCHIVEDIFF_EXPORT Utils::Result parseDiffJson(const QByteArray& jsonLines, DiffEntryList& out);

// Parses `bytes` and adds the entries to `model`. Nothing is added unless the
// whole input parsed.
ARCHIVEDIFF_EXPORT Utils::Result loadDiff(DiffTreeModel& model, const QByteArray& bytes, DiffFormat format);

} // namespace ArchiveDiff
