// SPDX-License-Identifier: GPL-2.0
#ifndef CAVEPLAN_JSON_H
#define CAVEPLAN_JSON_H

#include "caveplan.h"
#include "gasconsumption.h"

#include <optional>
#include <vector>
#include <QJsonArray>
#include <QJsonObject>

// The stored format uses bar, liters, meters and minutes throughout.
QJsonObject configToJson(const cave_config &config);
QJsonArray segmentsToJson(const std::vector<segment> &segments);

// Return nothing if the data doesn't have the expected shape. Missing
// fields are taken from default_cave_config, segments of an unknown
// type are skipped.
std::optional<cave_config> configFromJson(const QJsonValue &value);
std::optional<std::vector<segment>> segmentsFromJson(const QJsonValue &value);

// Results of a calculation, as printed by the command line tool
QJsonObject calculationToJson(const dive_calculation &calc);

#endif // CAVEPLAN_JSON_H
