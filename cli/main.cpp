// SPDX-License-Identifier: GPL-2.0
// caveplanner-cli - Command-line interface for the cave dive gas planner
//
// Reads plans as JSON and prints the calculated gas plan as JSON.

#include "commands.h"
#include "core/errorhelper.h"
#include <QCoreApplication>
#include <QStringList>
#include <stdio.h>

static void printUsage()
{
	fprintf(stderr, "Usage: caveplanner-cli [--verbose] <command> [options]\n");
	fprintf(stderr, "\n");
	fprintf(stderr, "Commands:\n");
	fprintf(stderr, "  calculate --plan=<file>                Calculate the gas plan of a plan file\n");
	fprintf(stderr, "  fix-distance --plan=<file> --index=N   Longest distance for swim N within the turn pressure\n");
	fprintf(stderr, "  store --plan=<file>                    Store a plan file as the current plan\n");
	fprintf(stderr, "  show                                   Calculate the stored plan\n");
	fprintf(stderr, "\n");
	fprintf(stderr, "Plan file format:\n");
	fprintf(stderr, "  { \"standingData\": { ... }, \"sections\": [ ... ] }\n");
}

int main(int argc, char *argv[])
{
	QCoreApplication app(argc, argv);
	QCoreApplication::setOrganizationName("CavePlanner");
	QCoreApplication::setApplicationName("caveplanner-cli");
	QCoreApplication::setApplicationVersion("1.0");

	QStringList args = QCoreApplication::arguments();
	QString command;
	QString planPath;
	int index = -1;
	bool haveIndex = false;

	for (int i = 1; i < args.size(); i++) {
		const QString &arg = args[i];
		if (arg == "--verbose" || arg == "-v") {
			verbose++;
		} else if (arg.startsWith("--plan=")) {
			planPath = arg.mid(7);
		} else if (arg.startsWith("--index=")) {
			index = arg.mid(8).toInt(&haveIndex);
		} else if (arg.startsWith("--")) {
			report_error("Unknown option: %s", qPrintable(arg));
			printUsage();
			return CMD_ERROR;
		} else if (command.isEmpty()) {
			command = arg;
		} else {
			report_error("Unexpected argument: %s", qPrintable(arg));
			printUsage();
			return CMD_ERROR;
		}
	}

	if (command.isEmpty()) {
		printUsage();
		return CMD_ERROR;
	}

	// Route to appropriate command handler
	if (command == "calculate")
		return cmdCalculate(planPath);
	if (command == "fix-distance") {
		if (!haveIndex) {
			report_error("fix-distance needs --index=N");
			return CMD_ERROR;
		}
		return cmdFixDistance(planPath, index);
	}
	if (command == "store")
		return cmdStore(planPath);
	if (command == "show")
		return cmdShow();

	report_error("Unknown command: %s", qPrintable(command));
	printUsage();
	return CMD_ERROR;
}
