// SPDX-License-Identifier: GPL-2.0
#include "planfile.h"
#include "core/caveplan-json.h"
#include "core/errorhelper.h"
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

// Expand tilde in paths to home directory
static QString expandTilde(const QString &path)
{
	if (path.startsWith("~/"))
		return QDir::homePath() + path.mid(1);
	return path;
}

std::optional<PlanFile> loadPlanFile(const QString &path)
{
	if (path.isEmpty()) {
		report_error("No plan file given");
		return {};
	}

	QFile file(expandTilde(path));
	if (!file.open(QIODevice::ReadOnly)) {
		report_error("Can't open plan file %s: %s", qPrintable(path), qPrintable(file.errorString()));
		return {};
	}

	QJsonParseError parseError;
	QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
	if (parseError.error != QJsonParseError::NoError) {
		report_error("Can't parse plan file %s: %s", qPrintable(path), qPrintable(parseError.errorString()));
		return {};
	}
	if (!doc.isObject()) {
		report_error("Plan file %s doesn't contain a JSON object", qPrintable(path));
		return {};
	}

	QJsonObject obj = doc.object();
	PlanFile plan { default_cave_config, {} };

	if (obj.contains("standingData")) {
		std::optional<cave_config> config = configFromJson(obj.value("standingData"));
		if (!config) {
			report_error("Invalid standing data in %s", qPrintable(path));
			return {};
		}
		plan.config = std::move(*config);
	}
	if (obj.contains("sections")) {
		std::optional<std::vector<segment>> segments = segmentsFromJson(obj.value("sections"));
		if (!segments) {
			report_error("Invalid sections in %s", qPrintable(path));
			return {};
		}
		plan.segments = std::move(*segments);
	}
	return plan;
}
