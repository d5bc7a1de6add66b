// SPDX-License-Identifier: GPL-2.0
#ifndef CLI_PLANFILE_H
#define CLI_PLANFILE_H

#include "core/caveplan.h"

#include <optional>
#include <vector>
#include <QString>

struct PlanFile {
	cave_config config;
	std::vector<segment> segments;
};

// Read a plan of the form { "standingData": {...}, "sections": [...] }.
// Either part may be missing and is then replaced by the defaults resp.
// an empty plan. Problems are reported via report_error().
std::optional<PlanFile> loadPlanFile(const QString &path);

#endif // CLI_PLANFILE_H
