// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archivediff/DiffParser.hpp"

#include "archivediff/DiffTreeModel.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>
#include <QtCore/QRegularExpression>

#include <cmath>

namespace ArchiveDiff {

namespace {

const QRegularExpression& changedFilePattern()
{
    // An added/removed clause, a changed link with an optional owner change,
    // or any combination of a content, owner and mode change; then the path.
    static const QRegularExpression re(
        QStringLiteral(
            R"(^\s*(?:)"
            R"((?<ar>added|removed)\s+(?:(?<artype>directory|link)|(?<size>[\d.]+)\s+(?<sizeunit>\w+)))"
            R"(|(?<cl>changed link))"
            R"((?>(?:\s*\[(?<lolduser>[\w .-]+):(?<loldgroup>[\w .-]+) -> (?<lnewuser>[\w .-]+):(?<lnewgroup>[\w .-]+)\])?))"
            R"((?!\s*(?:\+?[\d.]+\s+\w+\s+-?[\d.]+\s+\w+|\[[\w-]{10} -> [\w-]{10}\])\s))"
            R"(|(?:\s*\+?(?<added>[\d.]+)\s+(?<addedunit>\w+)\s+-?(?<removed>[\d.]+)\s+(?<removedunit>\w+))?)"
            R"((?:\s*\[(?<olduser>[\w .-]+):(?<oldgroup>[\w .-]+) -> (?<newuser>[\w .-]+):(?<newgroup>[\w .-]+)\])?)"
            R"((?:\s*\[(?<oldmode>[\w-]{10}) -> (?<newmode>[\w-]{10})\])?)"
            R"())\s+(?<path>.*)$)"),
        QRegularExpression::UseUnicodePropertiesOption);
    return re;
}

OwnerChange ownerChange(const QRegularExpressionMatch& m, bool changedLink)
{
    if (changedLink) {
        return OwnerChange{ m.captured(u"lolduser"), m.captured(u"loldgroup"),
                            m.captured(u"lnewuser"), m.captured(u"lnewgroup") };
    }
    return OwnerChange{ m.captured(u"olduser"), m.captured(u"oldgroup"),
                        m.captured(u"newuser"), m.captured(u"newgroup") };
}

// Added and Removed are final; Modified only upgrades an unchanged entry.
void promote(DiffData& d, ChangeType type)
{
    if (type == ChangeType::Modified && d.changeType != ChangeType::None)
        return;
    d.changeType = type;
}

QString requireString(const QJsonObject& obj, const QString& key, const QString& where, Utils::Result& result)
{
    const QJsonValue value = obj.value(key);
    if (!value.isString()) {
        result.addError(QStringLiteral("Expected string '%1' in %2").arg(key, where));
        return {};
    }
    return value.toString();
}

qint64 readBytes(const QJsonObject& obj, const QString& key, const QString& where, Utils::Result& result)
{
    const QJsonValue value = obj.value(key);
    if (value.isUndefined())
        return 0;
    if (!value.isDouble()) {
        result.addError(QStringLiteral("Expected number '%1' in %2").arg(key, where));
        return 0;
    }
    return value.toInteger();
}

Utils::Result applyJsonChange(const QJsonObject& change, const QString& where, DiffData& d)
{
    Utils::Result result;
    const QString type = requireString(change, QStringLiteral("type"), where, result);
    if (!result)
        return result;

    if (type == QLatin1String("modified")) {
        promote(d, ChangeType::Modified);
        d.facts |= ChangeFact::ContentModified;
        if (change.contains(QStringLiteral("added")) && change.contains(QStringLiteral("removed"))) {
            ContentChange content;
            content.added = readBytes(change, QStringLiteral("added"), where, result);
            content.removed = readBytes(change, QStringLiteral("removed"), where, result);
            d.contentChange = content;
            d.size = content.added - content.removed;
        }
    } else if (type == QLatin1String("changed link")) {
        promote(d, ChangeType::Modified);
        d.fileType = FileType::Link;
        d.facts |= ChangeFact::ChangedLink;
    } else if (type == QLatin1String("added") || type == QLatin1String("removed")
               || type == QLatin1String("added link") || type == QLatin1String("removed link")
               || type == QLatin1String("added directory") || type == QLatin1String("removed directory")) {
        if (type.endsWith(QLatin1String("directory")))
            d.fileType = FileType::Directory;
        else if (type.endsWith(QLatin1String("link")))
            d.fileType = FileType::Link;

        const bool added = type.startsWith(QLatin1String("added"));
        const qint64 size = readBytes(change, QStringLiteral("size"), where, result);
        d.size = added ? size : -size;
        promote(d, added ? ChangeType::Added : ChangeType::Removed);
        d.facts |= added ? ChangeFact::Added : ChangeFact::Removed;
    } else if (type == QLatin1String("mode")) {
        ModeChange mode;
        mode.oldMode = requireString(change, QStringLiteral("old_mode"), where, result);
        mode.newMode = requireString(change, QStringLiteral("new_mode"), where, result);
        promote(d, ChangeType::Modified);
        d.facts |= ChangeFact::ModeChanged;
        d.modeChange = mode;
    } else if (type == QLatin1String("owner")) {
        OwnerChange owner;
        owner.oldUser = requireString(change, QStringLiteral("old_user"), where, result);
        owner.oldGroup = requireString(change, QStringLiteral("old_group"), where, result);
        owner.newUser = requireString(change, QStringLiteral("new_user"), where, result);
        owner.newGroup = requireString(change, QStringLiteral("new_group"), where, result);
        promote(d, ChangeType::Modified);
        d.facts |= ChangeFact::OwnerChanged;
        d.ownerChange = owner;
    } else {
        result.addError(QStringLiteral("Unknown change type '%1' in %2").arg(type, where));
    }
    return result;
}

Utils::Result finishBatch(Utils::Result result, DiffEntryList&& parsed, DiffEntryList& out)
{
    if (!result) {
        qCWarning(archivediffparserlog).noquote()
            << "rejected diff batch with" << result.errors.size() << "error(s):" << result.errors.first();
        return result;
    }

    qCDebug(archivediffparserlog) << "parsed" << parsed.size() << "diff entries";
    out = std::move(parsed);
    return result;
}

} // namespace

Utils::Result sizeToBytes(QStringView significand, QStringView unit, qint64& bytes)
{
    double factor = 0.0;
    if (unit == u"B")
        factor = 1.0;
    else if (unit == u"kB" || unit == u"KB")
        factor = 1e3;
    else if (unit == u"MB")
        factor = 1e6;
    else if (unit == u"GB")
        factor = 1e9;
    else if (unit == u"TB")
        factor = 1e12;
    else
        return Utils::Result::failure(QStringLiteral("Unknown unit '%1'").arg(unit));

    bool ok = false;
    const double value = significand.toDouble(&ok);
    if (!ok || value < 0.0)
        return Utils::Result::failure(QStringLiteral("Malformed size '%1'").arg(significand));

    bytes = std::llround(value * factor);
    return Utils::Result::success();
}

Utils::Result parseDiffLine(const QString& line, DiffEntry& out)
{
    const QRegularExpressionMatch m = changedFilePattern().match(line);
    if (!m.hasMatch())
        return Utils::Result::failure(QStringLiteral("Couldn't parse diff output '%1'").arg(line));

    DiffEntry entry;
    entry.path = m.captured(u"path").trimmed();
    if (entry.path.isEmpty())
        return Utils::Result::failure(QStringLiteral("Missing path in diff output '%1'").arg(line));

    Utils::Result result;
    DiffData& d = entry.data;

    if (m.hasCaptured(u"ar")) {
        const bool added = m.captured(u"ar") == QLatin1String("added");
        const QString arType = m.captured(u"artype");
        if (arType == QLatin1String("directory")) {
            d.fileType = FileType::Directory;
        } else if (arType == QLatin1String("link")) {
            d.fileType = FileType::Link;
        } else {
            qint64 size = 0;
            result.merge(sizeToBytes(m.capturedView(u"size"), m.capturedView(u"sizeunit"), size));
            d.size = added ? size : -size;
        }
        d.changeType = added ? ChangeType::Added : ChangeType::Removed;
        d.facts = added ? ChangeFact::Added : ChangeFact::Removed;
    } else {
        const bool changedLink = m.hasCaptured(u"cl");
        const bool content = m.hasCaptured(u"added");
        const bool owner = m.hasCaptured(u"olduser") || m.hasCaptured(u"lolduser");
        const bool mode = m.hasCaptured(u"oldmode");
        if (!changedLink && !content && !owner && !mode)
            return Utils::Result::failure(QStringLiteral("No change in diff output '%1'").arg(line));

        d.changeType = ChangeType::Modified;
        if (changedLink) {
            d.fileType = FileType::Link;
            d.facts |= ChangeFact::ChangedLink;
        }
        if (content) {
            ContentChange change;
            result.merge(sizeToBytes(m.capturedView(u"added"), m.capturedView(u"addedunit"), change.added));
            result.merge(sizeToBytes(m.capturedView(u"removed"), m.capturedView(u"removedunit"), change.removed));
            d.facts |= ChangeFact::ContentModified;
            d.contentChange = change;
            d.size = change.added - change.removed;
        }
        if (owner) {
            d.facts |= ChangeFact::OwnerChanged;
            d.ownerChange = ownerChange(m, changedLink);
        }
        if (mode) {
            d.facts |= ChangeFact::ModeChanged;
            d.modeChange = ModeChange{ m.captured(u"oldmode"), m.captured(u"newmode") };
        }
    }

    if (!result) {
        for (QString& error : result.errors)
            error = QStringLiteral("%1 in diff output '%2'").arg(error, line);
        return result;
    }

    out = std::move(entry);
    return result;
}

Utils::Result parseDiffLines(const QStringList& lines, DiffEntryList& out)
{
    Utils::Result result;
    DiffEntryList parsed;
    parsed.reserve(lines.size());

    for (const QString& line : lines) {
        if (line.trimmed().isEmpty())
            continue;

        DiffEntry entry;
        const Utils::Result lineResult = parseDiffLine(line, entry);
        if (!lineResult) {
            result.merge(lineResult);
            continue;
        }
        parsed.push_back(std::move(entry));
    }

    return finishBatch(std::move(result), std::move(parsed), out);
}

Utils::Result parseDiffText(const QByteArray& text, DiffEntryList& out)
{
    QStringList lines = QString::fromUtf8(text).split(QLatin1Char('\n'));
    for (QString& line : lines) {
        if (line.endsWith(QLatin1Char('\r')))
            line.chop(1);
    }
    return parseDiffLines(lines, out);
}

Utils::Result parseDiffJson(const QJsonObject& record, DiffEntry& out)
{
    const QString raw = QString::fromUtf8(QJsonDocument(record).toJson(QJsonDocument::Compact));

    Utils::Result result;
    DiffEntry entry;
    entry.path = requireString(record, QStringLiteral("path"), raw, result).trimmed();
    if (result && entry.path.isEmpty())
        result.addError(QStringLiteral("Empty path in %1").arg(raw));

    const QJsonValue changes = record.value(QStringLiteral("changes"));
    if (!changes.isArray()) {
        result.addError(QStringLiteral("Expected array 'changes' in %1").arg(raw));
        return result;
    }

    const QJsonArray facts = changes.toArray();
    if (facts.isEmpty())
        result.addError(QStringLiteral("No change in %1").arg(raw));

    for (const QJsonValue& fact : facts) {
        if (!fact.isObject()) {
            result.addError(QStringLiteral("Expected object in 'changes' of %1").arg(raw));
            continue;
        }
        result.merge(applyJsonChange(fact.toObject(), raw, entry.data));
    }

    if (result)
        out = std::move(entry);
    return result;
}

Utils::Result parseDiffJson(const QList<QJsonObject>& records, DiffEntryList& out)
{
    Utils::Result result;
    DiffEntryList parsed;
    parsed.reserve(records.size());

    for (const QJsonObject& record : records) {
        DiffEntry entry;
        const Utils::Result recordResult = parseDiffJson(record, entry);
        if (!recordResult) {
            result.merge(recordResult);
            continue;
        }
        parsed.push_back(std::move(entry));
    }

    return finishBatch(std::move(result), std::move(parsed), out);
}

Utils::Result parseDiffJson(const QByteArray& jsonLines, DiffEntryList& out)
{
    Utils::Result result;
    DiffEntryList parsed;

    for (const QByteArray& rawLine : jsonLines.split('\n')) {
        const QByteArray line = rawLine.trimmed();
        if (line.isEmpty())
            continue;

        QJsonParseError error;
        const QJsonDocument doc = QJsonDocument::fromJson(line, &error);
        if (error.error != QJsonParseError::NoError) {
            result.addError(QStringLiteral("Invalid JSON (%1) in '%2'")
                                .arg(error.errorString(), QString::fromUtf8(line)));
            continue;
        }
        if (!doc.isObject()) {
            result.addError(QStringLiteral("Expected object in '%1'").arg(QString::fromUtf8(line)));
            continue;
        }

        DiffEntry entry;
        const Utils::Result recordResult = parseDiffJson(doc.object(), entry);
        if (!recordResult) {
            result.merge(recordResult);
            continue;
        }
        parsed.push_back(std::move(entry));
    }

    return finishBatch(std::move(result), std::move(parsed), out);
}

Utils::Result loadDiff(DiffTreeModel& model, const QByteArray& bytes, DiffFormat format)
{
    DiffEntryList entries;
    const Utils::Result result = format == DiffFormat::JsonLines ? parseDiffJson(bytes, entries)
                                                                 : parseDiffText(bytes, entries);
    if (!result)
        return result;

    model.addEntries(entries);
    return result;
}

} // namespace ArchiveDiff
