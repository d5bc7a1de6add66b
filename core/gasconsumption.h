// SPDX-License-Identifier: GPL-2.0
#ifndef GASCONSUMPTION_H
#define GASCONSUMPTION_H

#include "caveplan.h"
#include "units.h"

#include <optional>
#include <string>
#include <vector>

/*
 * Gas quantities in the results are free liters (gas at surface pressure),
 * tank pressures are bar. Thresholds that are shown to the diver are
 * rounded to multiples of 10 bar and kept as pressure_t.
 */

struct stage_state {
	std::string id;
	std::string tank_type;
	volume_t size;
	double initial_pressure = 0.0;	/* bar */
	double current_pressure = 0.0;	/* bar */
	double drop_pressure = 0.0;	/* bar, 0 once the stage was picked up again */
	bool dropped = false;

	double volume() const;		/* free liters left in the stage */
	double available() const;	/* free liters down to the drop pressure */
};

enum reentry_scenario {
	REENTRY_KILL_STAGE,
	REENTRY_BACKGAS
};

struct recalculation_result {
	bool possible = false;
	enum reentry_scenario scenario = REENTRY_BACKGAS;
	double available_l = 0.0;		/* free liters available for the re-entry */
	pressure_t available_pressure;		/* the same in the source tank, rounded down to 10 bar */
	std::string gas_source;			/* "S1 Alu80 (11L)" or "Back Gas" */
	volume_t gas_source_size;
	double backgas_to_exit_l = 0.0;
	double backgas_to_exit_bar = 0.0;
	pressure_t turn_pressure;		/* replaces the normal turn pressure until the next turnaround */

	// kill-stage only
	double stage_remaining_l = 0.0;
	double stage_remaining_bar = 0.0;
	// back gas re-entry only
	double stage_reservation_l = 0.0;
};

struct segment_result {
	std::string segment_id;
	double time = 0.0;			/* min */
	depth_t depth;				/* effective depth of this segment */
	double gas_consumed = 0.0;		/* l, from all sources */
	double runtime = 0.0;			/* min */
	depth_t running_avg_depth;
	double remaining_backgas_l = 0.0;
	double remaining_backgas_bar = 0.0;
	double backgas_used = 0.0;		/* l, back gas used up to and including this segment */
	double total_consumed = 0.0;		/* l, all sources up to and including this segment */
	std::vector<stage_state> stages;
	std::vector<std::string> dropped_stage_ids;
	std::vector<std::string> breathed_stage_ids;
	bool breathed_backgas = false;
	bool turn_warning = false;
	pressure_t threshold;			/* the turn pressure this segment was checked against */
	bool recalc_threshold_active = false;
	bool way_back = false;
	double distance_from_exit = 0.0;	/* m */
	double time_from_exit = 0.0;		/* min */
	double gas_from_exit = 0.0;		/* l */
	std::optional<recalculation_result> recalculation;
};

/* Request for the editor to materialize a stage drop the simulation had
 * to do on its own, because no explicit marker was planned. */
struct drop_advisory {
	std::string segment_id;			/* the drop happens during this segment */
	std::string stage_id;
	std::optional<int> split_distance;	/* m into the segment, swims only */
};

struct dive_calculation {
	std::vector<segment_result> segments;
	double total_backgas = 0.0;		/* l */
	double stage_reservation = 0.0;		/* l */
	double effective_backgas = 0.0;		/* l */
	double usable_backgas = 0.0;		/* l */
	double usable_backgas_rounded = 0.0;	/* l, a multiple of 10 bar */
	volume_t backgas_size;
	pressure_t turn_pressure;
	std::vector<drop_advisory> pending_drops;
};

/* Returns for every segment whether the diver is on the way back there.
 * Turnarounds flip the direction, recalculations start a new way in. */
extern std::vector<bool> way_back_flags(const std::vector<segment> &segments);

/* Single forward pass: time, depth and gas of every segment. */
extern dive_calculation simulate_gas(const cave_config &config, const std::vector<segment> &segments);

/* Second pass over the snapshots of simulate_gas(): direction, distance to
 * the exit and the re-entry evaluation at every recalculation. */
extern void evaluate_reentries(const cave_config &config, const std::vector<segment> &segments, dive_calculation &calc);

/* Both passes. This is what the editor calls after every change. */
extern dive_calculation calculate_cave_dive(const cave_config &config, const std::vector<segment> &segments);

/* Longest distance for the swim at 'index' that doesn't trigger a turn
 * warning. Returns nothing for anything but a swim, or if the swim didn't
 * use any gas. */
extern std::optional<int> compute_fixed_distance(const std::vector<segment> &segments,
						 const std::vector<segment_result> &results,
						 double usable_backgas_rounded, volume_t backgas_size,
						 int index);

#endif // GASCONSUMPTION_H
