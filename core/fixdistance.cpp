// SPDX-License-Identifier: GPL-2.0
#include "gasconsumption.h"
#include "caveplanner-float.h"

#include <algorithm>
#include <math.h>

/* Gas left in the stages that will be breathed before the back gas */
static double stage_gas_available(const std::vector<stage_state> &stages)
{
	double res = 0.0;
	for (const stage_state &st: stages) {
		if (!st.dropped && st.available() > 0)
			res += st.available();
	}
	return res;
}

/* The stages as they were before the first segment */
static std::vector<stage_state> initial_stages(const std::vector<stage_state> &stages)
{
	std::vector<stage_state> res = stages;
	for (stage_state &st: res) {
		st.current_pressure = st.initial_pressure;
		st.drop_pressure = st.initial_pressure / 2 + to_bar(stage_drop_margin);
		st.dropped = false;
	}
	return res;
}

/*
 * The gas used in a swim scales with its distance. So scale the distance
 * by the ratio of the gas that may be used in this segment to the gas the
 * segment actually used. That gas is the back gas down to the turn
 * pressure in force (or the rounded usable back gas, whichever is less)
 * plus whatever the stages can still deliver.
 */
std::optional<int> compute_fixed_distance(const std::vector<segment> &segments,
					  const std::vector<segment_result> &results,
					  double usable_backgas_rounded, volume_t backgas_size,
					  int index)
{
	if (index < 0 || static_cast<size_t>(index) >= segments.size() || static_cast<size_t>(index) >= results.size())
		return {};
	const segment &seg = segments[index];
	if (!seg.is_swim())
		return {};

	const segment_result &res = results[index];
	if (!res.turn_warning)
		return seg.distance;

	double size_l = to_liter(backgas_size);
	double prev_total, prev_backgas_used, prev_pressure, prev_stage_gas;
	if (index > 0) {
		const segment_result &prev = results[index - 1];
		prev_total = prev.total_consumed;
		prev_backgas_used = prev.backgas_used;
		prev_pressure = prev.remaining_backgas_bar;
		prev_stage_gas = stage_gas_available(prev.stages);
	} else {
		prev_total = 0.0;
		prev_backgas_used = 0.0;
		prev_pressure = size_l > 0 ? res.remaining_backgas_bar + res.backgas_used / size_l : 0.0;
		prev_stage_gas = stage_gas_available(initial_stages(res.stages));
	}

	double consumed = res.total_consumed - prev_total;
	if (consumed <= 0)
		return {};

	double backgas_budget = (prev_pressure - to_bar(res.threshold)) * size_l;
	// Already past the threshold before this swim: no stage can undo that
	if (backgas_budget < 0 && !nearly_0(backgas_budget))
		return 0;
	if (!res.recalc_threshold_active)
		backgas_budget = std::min(backgas_budget, usable_backgas_rounded - prev_backgas_used);

	double budget = std::max(backgas_budget, 0.0) + prev_stage_gas;
	if (budget <= 0)
		return 0;
	return std::min(static_cast<int>(floor(seg.distance * budget / consumed)), seg.distance);
}
