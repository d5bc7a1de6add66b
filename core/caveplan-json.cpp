// SPDX-License-Identifier: GPL-2.0
#include "caveplan-json.h"
#include "errorhelper.h"

static QJsonArray stringList(const std::vector<std::string> &list)
{
	QJsonArray res;
	for (const std::string &s: list)
		res.append(QString::fromStdString(s));
	return res;
}

static QString reentryScenarioName(enum reentry_scenario scenario)
{
	return scenario == REENTRY_KILL_STAGE ? QStringLiteral("kill-stage") : QStringLiteral("backgas-reentry");
}

QJsonObject configToJson(const cave_config &config)
{
	QJsonObject obj;

	obj["scr"] = config.scr / 1000.0;
	obj["swimSpeed"] = config.swim_speed / 1000.0;
	obj["bottomGasType"] = QString::fromStdString(config.backgas_type);
	obj["bottomGasFillPressure"] = to_bar(config.backgas_fill);
	obj["conservatism"] = to_bar(config.conservatism);
	obj["stageStandingTime"] = to_minutes(config.stage_time);

	QJsonArray stages;
	for (const stage_definition &def: config.stages) {
		QJsonObject stage;
		stage["id"] = QString::fromStdString(def.id);
		stage["tankType"] = QString::fromStdString(def.tank_type);
		stage["fillPressure"] = to_bar(def.fill);
		stage["reserveInBackGas"] = def.reserve_in_backgas;
		stages.append(stage);
	}
	obj["stages"] = stages;
	return obj;
}

QJsonArray segmentsToJson(const std::vector<segment> &segments)
{
	QJsonArray res;
	for (const segment &seg: segments) {
		QJsonObject obj;
		obj["id"] = QString::fromStdString(seg.id);
		obj["type"] = segment_type_name(seg.type);
		obj["avgDepth"] = to_meter(seg.depth);
		obj["distance"] = seg.distance;
		if (!seg.stage_id.empty())
			obj["stageId"] = QString::fromStdString(seg.stage_id);
		if (!seg.note.empty())
			obj["note"] = QString::fromStdString(seg.note);
		res.append(obj);
	}
	return res;
}

std::optional<cave_config> configFromJson(const QJsonValue &value)
{
	if (!value.isObject())
		return {};
	QJsonObject obj = value.toObject();
	const cave_config &def = default_cave_config;
	cave_config config;

	config.scr = int_cast<int>(obj.value("scr").toDouble(def.scr / 1000.0) * 1000);
	config.swim_speed = int_cast<int>(obj.value("swimSpeed").toDouble(def.swim_speed / 1000.0) * 1000);
	config.backgas_type = obj.value("bottomGasType").toString(QString::fromStdString(def.backgas_type)).toStdString();
	config.backgas_fill = bar_to_pressure(obj.value("bottomGasFillPressure").toDouble(to_bar(def.backgas_fill)));
	config.conservatism = bar_to_pressure(obj.value("conservatism").toDouble(to_bar(def.conservatism)));
	config.stage_time = minutes_to_duration(obj.value("stageStandingTime").toDouble(to_minutes(def.stage_time)));

	QJsonValue stages = obj.value("stages");
	if (!stages.isUndefined() && !stages.isArray())
		return {};
	for (const QJsonValue &v: stages.toArray()) {
		if (!v.isObject())
			return {};
		QJsonObject stage = v.toObject();
		stage_definition sd;
		sd.id = stage.value("id").toString().toStdString();
		sd.tank_type = stage.value("tankType").toString().toStdString();
		sd.fill = bar_to_pressure(stage.value("fillPressure").toDouble());
		sd.reserve_in_backgas = stage.value("reserveInBackGas").toBool();
		config.stages.push_back(std::move(sd));
	}
	return config;
}

std::optional<std::vector<segment>> segmentsFromJson(const QJsonValue &value)
{
	if (!value.isArray())
		return {};

	std::vector<segment> res;
	for (const QJsonValue &v: value.toArray()) {
		if (!v.isObject())
			return {};
		QJsonObject obj = v.toObject();
		segment seg;
		seg.id = obj.value("id").toString().toStdString();
		seg.type = segment_type_from_name(obj.value("type").toString().toStdString());
		if (seg.type == SEGMENT_NONE) {
			report_info("Skipping segment %s of unknown type", seg.id.c_str());
			continue;
		}
		seg.depth = meter_to_depth(obj.value("avgDepth").toDouble());
		seg.distance = int_cast<int>(obj.value("distance").toDouble());
		seg.stage_id = obj.value("stageId").toString().toStdString();
		seg.note = obj.value("note").toString().toStdString();
		res.push_back(std::move(seg));
	}
	return res;
}

static QJsonObject stageStateToJson(const stage_state &st)
{
	QJsonObject obj;
	obj["id"] = QString::fromStdString(st.id);
	obj["tankType"] = QString::fromStdString(st.tank_type);
	obj["volume"] = to_liter(st.size);
	obj["initialPressure"] = st.initial_pressure;
	obj["currentPressure"] = st.current_pressure;
	obj["dropPressure"] = st.drop_pressure;
	obj["dropped"] = st.dropped;
	return obj;
}

static QJsonObject recalculationToJson(const recalculation_result &r)
{
	QJsonObject obj;
	obj["possible"] = r.possible;
	obj["scenario"] = reentryScenarioName(r.scenario);
	obj["availableGasLiters"] = r.available_l;
	obj["availableGasBar"] = to_bar(r.available_pressure);
	obj["gasSourceLabel"] = QString::fromStdString(r.gas_source);
	obj["gasSourceVolume"] = to_liter(r.gas_source_size);
	obj["backGasToExitLiters"] = r.backgas_to_exit_l;
	obj["backGasToExitBar"] = r.backgas_to_exit_bar;
	obj["recalcTurnPressureBar"] = to_bar(r.turn_pressure);
	if (r.scenario == REENTRY_KILL_STAGE) {
		obj["stageRemainingLiters"] = r.stage_remaining_l;
		obj["stageRemainingBar"] = r.stage_remaining_bar;
	} else {
		obj["stageReservationLiters"] = r.stage_reservation_l;
	}
	return obj;
}

static QJsonObject segmentResultToJson(const segment_result &res)
{
	QJsonObject obj;
	obj["sectionId"] = QString::fromStdString(res.segment_id);
	obj["time"] = res.time;
	obj["depth"] = to_meter(res.depth);
	obj["gasConsumed"] = res.gas_consumed;
	obj["runningTime"] = res.runtime;
	obj["runningAvgDepth"] = to_meter(res.running_avg_depth);
	obj["remainingBackGasLiters"] = res.remaining_backgas_l;
	obj["remainingBackGasBar"] = res.remaining_backgas_bar;
	obj["backGasUsedTotal"] = res.backgas_used;

	QJsonArray stages;
	for (const stage_state &st: res.stages)
		stages.append(stageStateToJson(st));
	obj["stageStates"] = stages;
	obj["stageDroppedIds"] = stringList(res.dropped_stage_ids);
	obj["breathedStageIds"] = stringList(res.breathed_stage_ids);
	obj["breathedBackGas"] = res.breathed_backgas;
	obj["turnWarning"] = res.turn_warning;
	obj["turnPressureBar"] = to_bar(res.threshold);
	obj["isWayBack"] = res.way_back;
	obj["distanceFromExit"] = res.distance_from_exit;
	obj["timeFromExit"] = res.time_from_exit;
	obj["freeLitersFromExit"] = res.gas_from_exit;
	if (res.recalculation)
		obj["recalculation"] = recalculationToJson(*res.recalculation);
	return obj;
}

QJsonObject calculationToJson(const dive_calculation &calc)
{
	QJsonObject obj;

	QJsonArray sections;
	for (const segment_result &res: calc.segments)
		sections.append(segmentResultToJson(res));
	obj["sections"] = sections;
	obj["totalBackGas"] = calc.total_backgas;
	obj["stageReservation"] = calc.stage_reservation;
	obj["effectiveBackGas"] = calc.effective_backgas;
	obj["usableBackGas"] = calc.usable_backgas;
	obj["usableBackGasRounded"] = calc.usable_backgas_rounded;
	obj["bottomGasVolume"] = to_liter(calc.backgas_size);
	obj["turnPressureBar"] = to_bar(calc.turn_pressure);

	QJsonArray drops;
	for (const drop_advisory &drop: calc.pending_drops) {
		QJsonObject d;
		d["afterSectionId"] = QString::fromStdString(drop.segment_id);
		d["stageId"] = QString::fromStdString(drop.stage_id);
		if (drop.split_distance)
			d["splitAtDistance"] = *drop.split_distance;
		drops.append(d);
	}
	obj["pendingDropInserts"] = drops;
	return obj;
}
