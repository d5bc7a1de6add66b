// SPDX-License-Identifier: GPL-2.0
#ifndef TANKTYPES_H
#define TANKTYPES_H

#include "units.h"

#include <string>
#include <vector>

/* The cylinders the planner knows about. Primary ("back gas") sets and
 * stage cylinders are kept in separate tables, since the editor offers
 * them in different places. */
struct tank_info {
	std::string name;	/* machine name as stored, e.g. "alu80" */
	std::string label;	/* "Alu80 (11L)" */
	volume_t size;		/* internal volume */
};

extern const std::vector<tank_info> &backgas_tank_types();
extern const std::vector<tank_info> &stage_tank_types();

// Unknown names fall back to a 2x80 set resp. an Alu80.
extern volume_t get_backgas_size(const std::string &name);
extern volume_t get_stage_size(const std::string &name);

// Label of a back gas or stage type, or the name itself if it is unknown.
extern std::string get_tank_label(const std::string &name);

#endif // TANKTYPES_H
