// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archivediff/DiffViewOptions.hpp"

#include "archivediff/DiffSortProxyModel.hpp"
#include "archivediff/DiffTreeModel.hpp"

#include <QtCore/QFile>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonParseError>

namespace ArchiveDiff {

namespace {

using namespace Qt::StringLiterals;
using DisplayMode = Utils::PathTreeModelBase::DisplayMode;

} // namespace

QString displayModeName(DisplayMode mode)
{
    switch (mode) {
        case DisplayMode::Tree: return u"tree"_s;
        case DisplayMode::SimplifiedTree: return u"simplified"_s;
        case DisplayMode::Flat: return u"flat"_s;
    }
    return u"tree"_s;
}

bool displayModeFromName(QStringView name, DisplayMode& mode)
{
    const QString key = name.trimmed().toString().toLower();
    if (key == u"tree"_s) {
        mode = DisplayMode::Tree;
        return true;
    }
    if (key == u"simplified"_s || key == u"simplified-tree"_s || key == u"simplifiedtree"_s) {
        mode = DisplayMode::SimplifiedTree;
        return true;
    }
    if (key == u"flat"_s) {
        mode = DisplayMode::Flat;
        return true;
    }
    return false;
}

Utils::Result parseDiffViewOptions(const QJsonObject& json, DiffViewOptions& out)
{
    Utils::Result result;
    DiffViewOptions options = out;

    const QJsonValue mode = json.value(u"displayMode"_s);
    if (!mode.isUndefined() && !displayModeFromName(mode.toString(), options.displayMode))
        result.addError(u"Unknown display mode '%1'"_s.arg(mode.toString()));

    const QJsonValue folders = json.value(u"foldersOnTop"_s);
    if (!folders.isUndefined()) {
        if (folders.isBool())
            options.foldersOnTop = folders.toBool();
        else
            result.addError(u"Expected bool at foldersOnTop"_s);
    }

    const QJsonValue column = json.value(u"sortColumn"_s);
    if (!column.isUndefined() && !columnFromName(column.toString(), options.sortColumn))
        result.addError(u"Unknown sort column '%1'"_s.arg(column.toString()));

    const QJsonValue order = json.value(u"sortOrder"_s);
    if (!order.isUndefined()) {
        const QString key = order.toString().toLower();
        if (key == u"ascending"_s)
            options.sortOrder = Qt::AscendingOrder;
        else if (key == u"descending"_s)
            options.sortOrder = Qt::DescendingOrder;
        else
            result.addError(u"Unknown sort order '%1'"_s.arg(order.toString()));
    }

    if (result)
        out = options;
    return result;
}

QJsonObject serializeDiffViewOptions(const DiffViewOptions& options)
{
    QJsonObject json;
    json.insert(u"displayMode"_s, displayModeName(options.displayMode));
    json.insert(u"foldersOnTop"_s, options.foldersOnTop);
    json.insert(u"sortColumn"_s, columnName(options.sortColumn));
    json.insert(u"sortOrder"_s,
                options.sortOrder == Qt::AscendingOrder ? u"ascending"_s : u"descending"_s);
    return json;
}

Utils::Result loadDiffViewOptionsFromFile(const QString& path, DiffViewOptions& out)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        return Utils::Result::failure(u"Failed to open %1: %2"_s.arg(path, file.errorString()));

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError)
        return Utils::Result::failure(u"Invalid JSON in %1: %2"_s.arg(path, error.errorString()));
    if (!doc.isObject())
        return Utils::Result::failure(u"Expected object in %1"_s.arg(path));

    return parseDiffViewOptions(doc.object(), out);
}

void applyDiffViewOptions(const DiffViewOptions& options, DiffTreeModel& model, DiffSortProxyModel& proxy)
{
    model.setDisplayMode(options.displayMode);
    if (proxy.sourceModel() != &model)
        proxy.setSourceModel(&model);
    proxy.setFoldersOnTop(options.foldersOnTop);
    proxy.sort(static_cast<int>(options.sortColumn), options.sortOrder);
}

} // namespace ArchiveDiff
