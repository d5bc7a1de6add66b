// SPDX-License-Identifier: GPL-2.0
#include "commands.h"
#include "planfile.h"
#include "core/caveplan-json.h"
#include "core/errorhelper.h"
#include "core/gasconsumption.h"
#include "core/settings/qPrefCavePlanner.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <stdio.h>

// Output JSON to stdout
static void outputJson(const QJsonObject &obj)
{
	QJsonDocument doc(obj);
	printf("%s\n", doc.toJson(QJsonDocument::Indented).constData());
}

static void outputCalculation(const cave_config &config, const std::vector<segment> &segments)
{
	dive_calculation calc = calculate_cave_dive(config, segments);
	report_verbose("Calculated %d segments, turn pressure %d bar, %d pending drops",
		       static_cast<int>(calc.segments.size()), calc.turn_pressure.mbar / 1000,
		       static_cast<int>(calc.pending_drops.size()));
	outputJson(calculationToJson(calc));
}

int cmdCalculate(const QString &planPath)
{
	std::optional<PlanFile> plan = loadPlanFile(planPath);
	if (!plan)
		return CMD_ERROR;

	outputCalculation(plan->config, plan->segments);
	return CMD_SUCCESS;
}

int cmdFixDistance(const QString &planPath, int index)
{
	std::optional<PlanFile> plan = loadPlanFile(planPath);
	if (!plan)
		return CMD_ERROR;
	if (index < 0 || static_cast<size_t>(index) >= plan->segments.size()) {
		report_error("Segment index %d out of range, the plan has %d segments", index,
			     static_cast<int>(plan->segments.size()));
		return CMD_ERROR;
	}

	dive_calculation calc = calculate_cave_dive(plan->config, plan->segments);
	std::optional<int> distance = compute_fixed_distance(plan->segments, calc.segments,
							     calc.usable_backgas_rounded, calc.backgas_size, index);
	QJsonObject result;
	if (distance)
		result["distance"] = *distance;
	else
		result["distance"] = QJsonValue(QJsonValue::Null);
	outputJson(result);
	return CMD_SUCCESS;
}

int cmdStore(const QString &planPath)
{
	std::optional<PlanFile> plan = loadPlanFile(planPath);
	if (!plan)
		return CMD_ERROR;

	qPrefCavePlanner::save_config(plan->config);
	qPrefCavePlanner::save_segments(plan->segments);
	report_verbose("Stored plan with %d segments", static_cast<int>(plan->segments.size()));
	return CMD_SUCCESS;
}

int cmdShow()
{
	outputCalculation(qPrefCavePlanner::config_or_default(), qPrefCavePlanner::segments_or_default());
	return CMD_SUCCESS;
}
