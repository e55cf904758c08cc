#include <QtCore/QCommandLineOption>
#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDebug>
#include <QtCore/QFile>
#include <QtCore/QTextStream>

#include "archivediff/DiffParser.hpp"
#include "archivediff/DiffSortProxyModel.hpp"
#include "archivediff/DiffTreeModel.hpp"
#include "archivediff/DiffViewOptions.hpp"

using namespace ArchiveDiff;

static void printErrors(const QString& header, const QStringList& errors)
{
	qCritical().noquote() << header;
	for (const QString& e : errors)
		qCritical().noquote() << "  " << e;
}

static bool readInput(const QString& path, QByteArray& out)
{
	QFile file;
	bool opened = false;
	if (path.isEmpty() || path == QLatin1String("-"))
		opened = file.open(stdin, QIODevice::ReadOnly);
	else {
		file.setFileName(path);
		opened = file.open(QIODevice::ReadOnly);
	}

	if (!opened) {
		qCritical().noquote() << QStringLiteral("Failed to open %1: %2")
									 .arg(path.isEmpty() ? QStringLiteral("stdin") : path, file.errorString());
		return false;
	}
	out = file.readAll();
	return true;
}

static void printRows(QTextStream& stream, const QAbstractItemModel& model, const QModelIndex& parent, int depth)
{
	const int rows = model.rowCount(parent);
	for (int row = 0; row < rows; ++row) {
		const QModelIndex name = model.index(row, static_cast<int>(DiffColumn::Name), parent);
		const QString change = model.index(row, static_cast<int>(DiffColumn::Change), parent).data().toString();
		const QString size = model.index(row, static_cast<int>(DiffColumn::Size), parent).data().toString();

		stream << change.leftJustified(1) << "  " << size.rightJustified(10) << "  "
			   << QString(depth * 2, QLatin1Char(' ')) << name.data().toString() << '\n';
		printRows(stream, model, name, depth + 1);
	}
}

int main(int argc, char** argv)
{
	QCoreApplication app(argc, argv);
	QCoreApplication::setApplicationName(QStringLiteral("archivediff"));
	QCoreApplication::setApplicationVersion(QStringLiteral("1.0"));

	QCommandLineParser parser;
	parser.setApplicationDescription(QStringLiteral("Shows the output of an archive diff as a tree of changed paths."));
	parser.addHelpOption();
	parser.addVersionOption();

	const QCommandLineOption jsonOption(QStringLiteral("json"),
										QStringLiteral("Input is JSON lines instead of text."));
	const QCommandLineOption modeOption(QStringLiteral("mode"),
										QStringLiteral("Display mode: tree, simplified or flat."),
										QStringLiteral("mode"));
	const QCommandLineOption foldersOption(QStringLiteral("folders-on-top"),
										   QStringLiteral("Keep directories above files."));
	const QCommandLineOption sortOption(QStringLiteral("sort"),
										QStringLiteral("Sort column: name, change or size."),
										QStringLiteral("column"));
	const QCommandLineOption descendingOption(QStringLiteral("descending"),
											  QStringLiteral("Sort in descending order."));
	const QCommandLineOption optionsOption(QStringLiteral("options"),
										   QStringLiteral("Read view options from a JSON file."),
										   QStringLiteral("file"));
	parser.addOptions({ jsonOption, modeOption, foldersOption, sortOption, descendingOption, optionsOption });
	parser.addPositionalArgument(QStringLiteral("file"), QStringLiteral("Diff output to read; stdin when omitted."));
	parser.process(app);

	DiffViewOptions options;
	if (parser.isSet(optionsOption)) {
		const Utils::Result loaded = loadDiffViewOptionsFromFile(parser.value(optionsOption), options);
		if (!loaded) {
			printErrors(QStringLiteral("Invalid view options:"), loaded.errors);
			return 1;
		}
	}

	// Explicit flags override the options file.
	if (parser.isSet(modeOption) && !displayModeFromName(parser.value(modeOption), options.displayMode)) {
		qCritical().noquote() << QStringLiteral("Unknown display mode: %1").arg(parser.value(modeOption));
		return 1;
	}
	if (parser.isSet(sortOption) && !columnFromName(parser.value(sortOption), options.sortColumn)) {
		qCritical().noquote() << QStringLiteral("Unknown sort column: %1").arg(parser.value(sortOption));
		return 1;
	}
	if (parser.isSet(foldersOption))
		options.foldersOnTop = true;
	if (parser.isSet(descendingOption))
		options.sortOrder = Qt::DescendingOrder;

	const QStringList positional = parser.positionalArguments();
	if (positional.size() > 1) {
		qCritical().noquote() << "Expected at most one input file.";
		return 1;
	}

	QByteArray input;
	if (!readInput(positional.value(0), input))
		return 1;

	DiffTreeModel model;
	const Utils::Result loaded =
		loadDiff(model, input, parser.isSet(jsonOption) ? DiffFormat::JsonLines : DiffFormat::Text);
	if (!loaded) {
		printErrors(QStringLiteral("Failed to parse diff:"), loaded.errors);
		return 2;
	}

	DiffSortProxyModel proxy;
	applyDiffViewOptions(options, model, proxy);

	QTextStream out(stdout);
	printRows(out, proxy, QModelIndex(), 0);
	return 0;
}
