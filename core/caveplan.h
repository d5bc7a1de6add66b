// SPDX-License-Identifier: GPL-2.0
#ifndef CAVEPLAN_H
#define CAVEPLAN_H

#include "units.h"

#include <string>
#include <vector>

/* A stage is dropped once it is down to half its fill plus this margin */
static constexpr pressure_t stage_drop_margin = 15_bar;
/* A jump is always planned as a fixed transit */
static constexpr duration_t jump_time = 2_min;

enum segment_type {
	SEGMENT_NONE = -1,
	SEGMENT_SWIM,
	SEGMENT_TURN_LEFT,
	SEGMENT_TURN_RIGHT,
	SEGMENT_JUMP_LEFT,
	SEGMENT_JUMP_RIGHT,
	SEGMENT_STAGE,		/* drop while going in, pick up on the way out */
	SEGMENT_TURNAROUND,
	SEGMENT_RECALCULATION,
	NUM_SEGMENT_TYPES
};

struct stage_definition {
	std::string id;
	std::string tank_type;		/* key into stage_tank_types() */
	pressure_t fill;
	bool reserve_in_backgas = false;
};

/* The standing data of a dive: everything that doesn't change from
 * segment to segment. */
struct cave_config {
	int scr = 0;			/* ml/min at surface pressure */
	int swim_speed = 0;		/* mm/min */
	std::string backgas_type;	/* key into backgas_tank_types() */
	pressure_t backgas_fill;
	pressure_t conservatism;	/* deducted from the usable back gas */
	duration_t stage_time;		/* spent at each stage drop or pick-up */
	std::vector<stage_definition> stages;

	const stage_definition *get_stage(const std::string &id) const;
	int stage_index(const std::string &id) const; /* -1 if unknown */
};

extern const cave_config default_cave_config;

struct segment {
	std::string id;
	enum segment_type type = SEGMENT_SWIM;
	depth_t depth;			/* average depth, swims only */
	int distance = 0;		/* m, swims only */
	std::string stage_id;		/* stage events only */
	std::string note;

	bool is_swim() const { return type == SEGMENT_SWIM; }
	bool is_navigation() const;	/* turns and jumps */
};

extern const char *segment_type_name(enum segment_type type);
extern const char *segment_type_label(enum segment_type type);
extern enum segment_type segment_type_from_name(const std::string &name);

extern std::string generate_segment_id();

#endif // CAVEPLAN_H
