// SPDX-License-Identifier: GPL-2.0
#ifndef TESTHELPER_H
#define TESTHELPER_H

#include "core/caveplan.h"

// 20 l/min, 10 m/min, a 2x80 (22L) at 220 bar, no stages
cave_config test_config();

segment swim(const char *id, int depth_m, int distance);
segment marker(const char *id, enum segment_type type);
segment stage_event(const char *id, const char *stage_id);
stage_definition alu80(const char *id, int fill_bar, bool reserve = false);

#endif
