// SPDX-License-Identifier: GPL-2.0
#include "qPrefCavePlanner.h"
#include "qPrefPrivate.h"
#include "core/caveplan-json.h"
#include "core/errorhelper.h"

#include <QJsonDocument>
#include <QJsonParseError>

static const QString group = QStringLiteral("CavePlanner");
static const QString standing_data_key = QStringLiteral("standing_data");
static const QString sections_key = QStringLiteral("sections");

qPrefCavePlanner *qPrefCavePlanner::instance()
{
	static qPrefCavePlanner *self = new qPrefCavePlanner;
	return self;
}

// Returns an undefined value if nothing usable is stored under the key
static QJsonValue loadDocument(const QString &name)
{
	QByteArray raw = qPrefPrivate::propValue(keyFromGroupAndName(group, name), QByteArray()).toByteArray();
	if (raw.isEmpty())
		return QJsonValue(QJsonValue::Undefined);

	QJsonParseError parseError;
	QJsonDocument doc = QJsonDocument::fromJson(raw, &parseError);
	if (parseError.error != QJsonParseError::NoError) {
		report_info("Ignoring stored %s: %s", qPrintable(name), qPrintable(parseError.errorString()));
		return QJsonValue(QJsonValue::Undefined);
	}
	if (doc.isObject())
		return doc.object();
	if (doc.isArray())
		return doc.array();
	return QJsonValue(QJsonValue::Undefined);
}

std::optional<cave_config> qPrefCavePlanner::load_config()
{
	QJsonValue value = loadDocument(standing_data_key);
	if (value.isUndefined())
		return {};
	std::optional<cave_config> config = configFromJson(value);
	if (!config)
		report_info("Ignoring stored standing data of unexpected shape");
	return config;
}

std::optional<std::vector<segment>> qPrefCavePlanner::load_segments()
{
	QJsonValue value = loadDocument(sections_key);
	if (value.isUndefined())
		return {};
	std::optional<std::vector<segment>> segments = segmentsFromJson(value);
	if (!segments)
		report_info("Ignoring stored sections of unexpected shape");
	return segments;
}

cave_config qPrefCavePlanner::config_or_default()
{
	return load_config().value_or(default_cave_config);
}

std::vector<segment> qPrefCavePlanner::segments_or_default()
{
	return load_segments().value_or(std::vector<segment>());
}

void qPrefCavePlanner::save_config(const cave_config &config)
{
	QJsonDocument doc(configToJson(config));
	qPrefPrivate::propSetValue(keyFromGroupAndName(group, standing_data_key), doc.toJson(QJsonDocument::Compact));
	emit instance()->configChanged();
}

void qPrefCavePlanner::save_segments(const std::vector<segment> &segments)
{
	QJsonDocument doc(segmentsToJson(segments));
	qPrefPrivate::propSetValue(keyFromGroupAndName(group, sections_key), doc.toJson(QJsonDocument::Compact));
	emit instance()->segmentsChanged();
}

void qPrefCavePlanner::clear()
{
	qPrefPrivate::propRemove(keyFromGroupAndName(group, standing_data_key));
	qPrefPrivate::propRemove(keyFromGroupAndName(group, sections_key));
}
