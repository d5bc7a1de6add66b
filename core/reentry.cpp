// SPDX-License-Identifier: GPL-2.0
/* reentry.cpp
 *
 * Second pass over a simulated dive: direction, distance to the exit and
 * the evaluation of side passage re-entries at recalculation points.
 *
 * At a recalculation one of two scenarios applies:
 *  - kill-stage: a stage that is still carried covers the re-entry. The back
 *    gas must not drop any further, and it must be possible to get out on
 *    half the back gas even if the stage is breathed empty.
 *  - back gas re-entry: a third of the back gas that is neither needed for
 *    the exit (twice, for the buddy) nor reserved for a dropped stage.
 * The resulting turn pressure replaces the normal one until the next
 * turnaround.
 */
#include "gasconsumption.h"
#include "caveplanner-float.h"
#include "errorhelper.h"
#include "format.h"
#include "tanktypes.h"

#include <algorithm>
#include <math.h>

namespace {

struct passage_leg {
	double distance;	/* m */
	depth_t depth;
};

/* The swims between the exit and the current position. Going in adds
 * legs, coming back retraces them from the far end. */
class penetration_profile {
	std::vector<passage_leg> legs;
public:
	void swim_in(double distance, depth_t depth);
	void swim_out(double distance);
	double distance() const;
	double time(int swim_speed) const;
	double gas(int swim_speed, int scr) const;
};

}

void penetration_profile::swim_in(double distance, depth_t depth)
{
	if (distance > 0)
		legs.push_back({ distance, depth });
}

void penetration_profile::swim_out(double distance)
{
	while (distance > 0 && !legs.empty()) {
		passage_leg &leg = legs.back();
		if (leg.distance <= distance) {
			distance -= leg.distance;
			legs.pop_back();
		} else {
			leg.distance -= distance;
			distance = 0;
		}
	}
}

double penetration_profile::distance() const
{
	double res = 0.0;
	for (const passage_leg &leg: legs)
		res += leg.distance;
	return res;
}

double penetration_profile::time(int swim_speed) const
{
	return swim_speed > 0 ? distance() * 1000.0 / swim_speed : 0.0;
}

double penetration_profile::gas(int swim_speed, int scr) const
{
	if (swim_speed <= 0)
		return 0.0;
	double res = 0.0;
	for (const passage_leg &leg: legs)
		res += scr / 1000.0 * depth_to_ata(leg.depth) * leg.distance * 1000.0 / swim_speed;
	return res;
}

static recalculation_result kill_stage(const segment_result &res, size_t stage_idx, double gas_to_exit)
{
	recalculation_result r;
	const stage_state &st = res.stages[stage_idx];
	double stage_l = st.available();
	double stage_size_l = to_liter(st.size);

	r.scenario = REENTRY_KILL_STAGE;
	r.stage_remaining_l = stage_l;
	r.stage_remaining_bar = stage_size_l > 0 ? stage_l / stage_size_l : 0.0;
	r.available_l = round(stage_l);
	r.available_pressure = bar_to_pressure(floor_to_10bar(r.stage_remaining_bar));
	r.gas_source = format_string_std("S%d %s", static_cast<int>(stage_idx) + 1, get_tank_label(st.tank_type).c_str());
	r.gas_source_size = st.size;
	r.possible = gas_to_exit + stage_l <= res.remaining_backgas_l / 2;

	// The stage covers the re-entry, the back gas shouldn't drop any further
	r.turn_pressure = bar_to_pressure(std::max(floor_to_10bar(res.remaining_backgas_bar), 0.0));
	return r;
}

static recalculation_result backgas_reentry(const segment_result &res, volume_t backgas_size, double gas_to_exit)
{
	recalculation_result r;
	double size_l = to_liter(backgas_size);

	r.scenario = REENTRY_BACKGAS;
	for (const stage_state &st: res.stages) {
		if (st.dropped && st.current_pressure > 0)
			r.stage_reservation_l += st.volume();
	}

	double budget = (res.remaining_backgas_l - r.stage_reservation_l - 2 * gas_to_exit) / 3;
	double budget_bar = size_l > 0 ? std::max(floor_to_10bar(budget / size_l), 0.0) : 0.0;

	r.available_l = budget_bar * size_l;
	r.available_pressure = bar_to_pressure(budget_bar);
	r.gas_source = "Back Gas";
	r.gas_source_size = backgas_size;
	r.possible = budget_bar > 0;
	r.turn_pressure = bar_to_pressure(std::max(ceil_to_10bar(res.remaining_backgas_bar - budget_bar), 0.0));
	return r;
}

static recalculation_result evaluate_recalculation(const dive_calculation &calc, const segment_result &res, double gas_to_exit)
{
	recalculation_result r;

	auto it = std::find_if(res.stages.begin(), res.stages.end(), [](const stage_state &st)
			       { return !st.dropped && st.available() > 0; });
	if (it != res.stages.end())
		r = kill_stage(res, static_cast<size_t>(it - res.stages.begin()), gas_to_exit);
	else
		r = backgas_reentry(res, calc.backgas_size, gas_to_exit);

	double size_l = to_liter(calc.backgas_size);
	r.backgas_to_exit_l = gas_to_exit;
	r.backgas_to_exit_bar = size_l > 0 ? gas_to_exit / size_l : 0.0;

	report_verbose("Recalculation %s: %s re-entry on %s is %s, turn at %d bar",
		       res.segment_id.c_str(),
		       r.scenario == REENTRY_KILL_STAGE ? "kill-stage" : "back gas",
		       r.gas_source.c_str(), r.possible ? "possible" : "not possible",
		       r.turn_pressure.mbar / 1000);
	return r;
}

void evaluate_reentries(const cave_config &config, const std::vector<segment> &segments, dive_calculation &calc)
{
	std::vector<bool> way_back = way_back_flags(segments);
	penetration_profile profile;
	std::optional<pressure_t> recalc_turn_pressure;
	size_t nr = std::min(segments.size(), calc.segments.size());

	for (size_t i = 0; i < nr; i++) {
		const segment &seg = segments[i];
		segment_result &res = calc.segments[i];

		res.way_back = way_back[i];
		if (seg.is_swim()) {
			if (res.way_back)
				profile.swim_out(seg.distance);
			else
				profile.swim_in(seg.distance, seg.depth);
		}
		res.distance_from_exit = profile.distance();
		res.time_from_exit = profile.time(config.swim_speed);
		res.gas_from_exit = profile.gas(config.swim_speed, config.scr);

		if (seg.type == SEGMENT_TURNAROUND) {
			recalc_turn_pressure.reset();
		} else if (seg.type == SEGMENT_RECALCULATION) {
			res.recalculation = evaluate_recalculation(calc, res, res.gas_from_exit);
			recalc_turn_pressure = res.recalculation->turn_pressure;
		}

		if (!recalc_turn_pressure)
			continue;
		double turn_pressure = to_bar(*recalc_turn_pressure);
		res.threshold = *recalc_turn_pressure;
		res.recalc_threshold_active = true;
		res.turn_warning = !res.way_back && turn_pressure > 0 &&
				   res.remaining_backgas_bar < turn_pressure &&
				   !nearly_equal(res.remaining_backgas_bar, turn_pressure);
	}
}
