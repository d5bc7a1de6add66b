// SPDX-License-Identifier: GPL-2.0
#include "caveplan.h"

#include <algorithm>
#include <QUuid>

const cave_config default_cave_config = {
	.scr = 20000,
	.swim_speed = 10000,
	.backgas_type = "2x80",
	.backgas_fill = 220_bar,
	.conservatism = 0_bar,
	.stage_time = 2_min,
	.stages = {}
};

static const char *segment_type_names[NUM_SEGMENT_TYPES] = {
	"swim", "t-left", "t-right", "jump-left", "jump-right", "stage-drop", "turnaround", "recalculation"
};

static const char *segment_type_labels[NUM_SEGMENT_TYPES] = {
	"Swim", "T Left", "T Right", "Jump Left", "Jump Right", "Stage Pick-up/Drop-off", "Turnaround", "Recalculation"
};

const char *segment_type_name(enum segment_type type)
{
	if (type < 0 || type >= NUM_SEGMENT_TYPES)
		return "";
	return segment_type_names[type];
}

const char *segment_type_label(enum segment_type type)
{
	if (type < 0 || type >= NUM_SEGMENT_TYPES)
		return "";
	return segment_type_labels[type];
}

enum segment_type segment_type_from_name(const std::string &name)
{
	for (int i = 0; i < NUM_SEGMENT_TYPES; i++) {
		if (name == segment_type_names[i])
			return static_cast<enum segment_type>(i);
	}
	return SEGMENT_NONE;
}

bool segment::is_navigation() const
{
	return type == SEGMENT_TURN_LEFT || type == SEGMENT_TURN_RIGHT ||
	       type == SEGMENT_JUMP_LEFT || type == SEGMENT_JUMP_RIGHT;
}

const stage_definition *cave_config::get_stage(const std::string &id) const
{
	auto it = std::find_if(stages.begin(), stages.end(),
			       [&id](const stage_definition &s) { return s.id == id; });
	return it != stages.end() ? &*it : nullptr;
}

int cave_config::stage_index(const std::string &id) const
{
	auto it = std::find_if(stages.begin(), stages.end(),
			       [&id](const stage_definition &s) { return s.id == id; });
	return it != stages.end() ? static_cast<int>(it - stages.begin()) : -1;
}

std::string generate_segment_id()
{
	// 8 hex digits are plenty for a plan of a few dozen segments
	return QUuid::createUuid().toString(QUuid::Id128).left(8).toStdString();
}
