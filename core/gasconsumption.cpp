// SPDX-License-Identifier: GPL-2.0
/* gasconsumption.cpp
 *
 * Gas consumption of a planned cave dive, segment by segment.
 *
 * Gas model:
 *  - gas used in a segment = SCR x ATA x time (free liters), ATA = depth / 10 m + 1
 *  - stages are breathed first, in the order they are configured, each one
 *    down to its drop pressure (half the fill plus a margin)
 *  - whatever the stages can't deliver comes from the back gas
 *  - the usable back gas follows the rule of thirds, after deducting the
 *    reservations for the stages that should be covered by the back gas
 *  - a segment gets a turn warning when the back gas drops below the turn
 *    pressure while still going in
 */
#include "gasconsumption.h"
#include "caveplanner-float.h"
#include "errorhelper.h"
#include "tanktypes.h"

#include <algorithm>
#include <math.h>

double stage_state::volume() const
{
	return current_pressure * to_liter(size);
}

double stage_state::available() const
{
	return (current_pressure - drop_pressure) * to_liter(size);
}

std::vector<bool> way_back_flags(const std::vector<segment> &segments)
{
	std::vector<bool> res;
	bool way_back = false;

	res.reserve(segments.size());
	for (const segment &seg: segments) {
		if (seg.type == SEGMENT_TURNAROUND)
			way_back = !way_back;
		else if (seg.type == SEGMENT_RECALCULATION)
			way_back = false;
		res.push_back(way_back);
	}
	return res;
}

static double stage_drop_pressure(pressure_t fill)
{
	return to_bar(fill) / 2 + to_bar(stage_drop_margin);
}

/* Back gas needed to breathe a stage from its fill down to its drop pressure */
static double stage_reservation(const cave_config &config)
{
	double reservation = 0.0;
	for (const stage_definition &def: config.stages) {
		if (!def.reserve_in_backgas)
			continue;
		double bar = to_bar(def.fill) - stage_drop_pressure(def.fill);
		if (bar > 0)
			reservation += bar * to_liter(get_stage_size(def.tank_type));
	}
	return reservation;
}

static std::vector<stage_state> initial_stage_states(const cave_config &config)
{
	std::vector<stage_state> res;
	for (const stage_definition &def: config.stages) {
		stage_state st;
		st.id = def.id;
		st.tank_type = def.tank_type;
		st.size = get_stage_size(def.tank_type);
		st.initial_pressure = st.current_pressure = to_bar(def.fill);
		st.drop_pressure = stage_drop_pressure(def.fill);
		res.push_back(std::move(st));
	}
	return res;
}

/* Is there a planned drop for this stage further along the current way
 * in? A turnaround or a recalculation ends that passage. */
static bool has_drop_marker(const std::vector<segment> &segments, const std::vector<bool> &way_back,
			    const std::string &stage_id, size_t idx)
{
	for (size_t i = idx + 1; i < segments.size(); i++) {
		const segment &seg = segments[i];
		if (seg.type == SEGMENT_TURNAROUND || seg.type == SEGMENT_RECALCULATION)
			break;
		if (seg.type == SEGMENT_STAGE && seg.stage_id == stage_id && !way_back[i])
			return true;
	}
	return false;
}

static bool below_threshold(double pressure, double threshold)
{
	return pressure < threshold && !nearly_equal(pressure, threshold);
}

static double segment_time(const cave_config &config, const segment &seg)
{
	switch (seg.type) {
	case SEGMENT_SWIM:
		return config.swim_speed > 0 ? seg.distance * 1000.0 / config.swim_speed : 0.0;
	case SEGMENT_JUMP_LEFT:
	case SEGMENT_JUMP_RIGHT:
		return to_minutes(jump_time);
	case SEGMENT_STAGE:
		return to_minutes(config.stage_time);
	default:
		return 0.0;
	}
}

namespace {

/* The mutable state of one simulation run. Lives only as long as
 * simulate_gas() runs, so concurrent calculations never share it. */
struct gas_simulation {
	const cave_config &config;
	const std::vector<segment> &segments;
	std::vector<bool> way_back;
	dive_calculation &calc;
	std::vector<stage_state> stages;
	std::vector<bool> awaiting_drop;	/* empty down to the drop pressure, but the drop is planned later */
	std::vector<bool> picked_up;
	double size_l;
	double remaining_backgas;
	double backgas_used = 0.0;
	double total_consumed = 0.0;
	double runtime = 0.0;
	double time_depth = 0.0;
	depth_t current_depth;

	gas_simulation(const cave_config &config, const std::vector<segment> &segments, dive_calculation &calc);
	void stage_event(size_t idx, segment_result &res);
	void stage_exhausted(size_t idx, size_t stage, double consumed, double demand, segment_result &res);
	double breathe_stages(size_t idx, double demand, segment_result &res);
	segment_result run_segment(size_t idx);
};

}

gas_simulation::gas_simulation(const cave_config &config, const std::vector<segment> &segments, dive_calculation &calc) :
	config(config),
	segments(segments),
	way_back(way_back_flags(segments)),
	calc(calc),
	stages(initial_stage_states(config)),
	awaiting_drop(stages.size(), false),
	picked_up(stages.size(), false),
	size_l(to_liter(calc.backgas_size)),
	remaining_backgas(calc.total_backgas)
{
}

/* Stage drops while going in, pick-ups on the way back */
void gas_simulation::stage_event(size_t idx, segment_result &res)
{
	const segment &seg = segments[idx];
	int s = config.stage_index(seg.stage_id);
	if (s < 0) {
		report_verbose("Ignoring stage event %s: no stage %s", seg.id.c_str(), seg.stage_id.c_str());
		return;
	}

	stage_state &st = stages[s];
	if (!way_back[idx]) {
		if (st.dropped)
			return;
		st.dropped = true;
		awaiting_drop[s] = false;
		res.dropped_stage_ids.push_back(st.id);
	} else {
		if (!st.dropped)
			return;
		// From here on the stage may be breathed empty
		st.dropped = false;
		st.drop_pressure = 0.0;
		awaiting_drop[s] = false;
		picked_up[s] = true;
	}
}

void gas_simulation::stage_exhausted(size_t idx, size_t stage, double consumed, double demand, segment_result &res)
{
	const segment &seg = segments[idx];
	stage_state &st = stages[stage];

	if (picked_up[stage] || has_drop_marker(segments, way_back, st.id, idx)) {
		awaiting_drop[stage] = true;
		return;
	}

	st.dropped = true;
	res.dropped_stage_ids.push_back(st.id);

	drop_advisory drop { seg.id, st.id, {} };
	if (seg.is_swim() && demand > 0)
		drop.split_distance = int_cast<int>(consumed / demand * seg.distance);
	report_verbose("Stage %s reaches its drop pressure in segment %s without a planned drop", st.id.c_str(), seg.id.c_str());
	calc.pending_drops.push_back(std::move(drop));
}

/* Returns the part of the demand the stages couldn't deliver */
double gas_simulation::breathe_stages(size_t idx, double demand, segment_result &res)
{
	double remaining = demand;

	for (size_t s = 0; s < stages.size() && remaining > 0; s++) {
		stage_state &st = stages[s];
		if (st.dropped || awaiting_drop[s])
			continue;

		double available = st.available();
		if (available <= 0) {
			stage_exhausted(idx, s, demand - remaining, demand, res);
			continue;
		}

		res.breathed_stage_ids.push_back(st.id);
		if (remaining <= available) {
			st.current_pressure -= remaining / to_liter(st.size);
			remaining = 0.0;
		} else {
			remaining -= available;
			st.current_pressure = st.drop_pressure;
			stage_exhausted(idx, s, demand - remaining, demand, res);
		}
	}
	return remaining;
}

segment_result gas_simulation::run_segment(size_t idx)
{
	const segment &seg = segments[idx];
	segment_result res;

	double time = segment_time(config, seg);
	if (seg.is_swim())
		current_depth = seg.depth;
	depth_t depth = current_depth;
	double demand = config.scr / 1000.0 * depth_to_ata(depth) * time;

	// The stage being handled isn't breathed while standing at it
	double from_backgas;
	if (seg.type == SEGMENT_STAGE) {
		stage_event(idx, res);
		from_backgas = demand;
	} else {
		from_backgas = breathe_stages(idx, demand, res);
	}

	if (from_backgas > 0) {
		remaining_backgas -= from_backgas;
		backgas_used += from_backgas;
		res.breathed_backgas = true;
	}
	total_consumed += demand;

	runtime += time;
	time_depth += time * to_meter(depth);

	res.segment_id = seg.id;
	res.time = time;
	res.depth = depth;
	res.gas_consumed = demand;
	res.runtime = runtime;
	res.running_avg_depth = runtime > 0 ? meter_to_depth(time_depth / runtime) : depth_t();
	res.remaining_backgas_l = remaining_backgas;
	res.remaining_backgas_bar = size_l > 0 ? remaining_backgas / size_l : 0.0;
	res.backgas_used = backgas_used;
	res.total_consumed = total_consumed;
	res.stages = stages;
	res.way_back = way_back[idx];
	res.threshold = calc.turn_pressure;

	double turn_pressure = to_bar(calc.turn_pressure);
	res.turn_warning = !res.way_back && turn_pressure > 0 &&
			   below_threshold(res.remaining_backgas_bar, turn_pressure);
	return res;
}

dive_calculation simulate_gas(const cave_config &config, const std::vector<segment> &segments)
{
	dive_calculation calc;

	calc.backgas_size = get_backgas_size(config.backgas_type);
	double size_l = to_liter(calc.backgas_size);
	double fill = to_bar(config.backgas_fill);

	calc.total_backgas = size_l * fill;
	calc.stage_reservation = stage_reservation(config);
	calc.effective_backgas = calc.total_backgas - calc.stage_reservation;
	calc.usable_backgas = std::max(calc.effective_backgas / 3 - to_bar(config.conservatism) * size_l, 0.0);
	if (size_l > 0) {
		double usable_bar = calc.usable_backgas / size_l;
		calc.usable_backgas_rounded = floor_to_10bar(usable_bar) * size_l;
		calc.turn_pressure = bar_to_pressure(std::max(ceil_to_10bar(fill - usable_bar), 0.0));
	}

	gas_simulation sim(config, segments, calc);
	calc.segments.reserve(segments.size());
	for (size_t i = 0; i < segments.size(); i++)
		calc.segments.push_back(sim.run_segment(i));
	return calc;
}

dive_calculation calculate_cave_dive(const cave_config &config, const std::vector<segment> &segments)
{
	dive_calculation calc = simulate_gas(config, segments);
	evaluate_reentries(config, segments, calc);
	return calc;
}
