// SPDX-License-Identifier: GPL-2.0
#include "tanktypes.h"

#include <algorithm>

static const volume_t default_backgas_size = 22_l;
static const volume_t default_stage_size = 11_l;

const std::vector<tank_info> &backgas_tank_types()
{
	static const std::vector<tank_info> table = {
		{ "2x80", "2x80 (22L)", 22_l },
		{ "d12", "D12 (24L)", 24_l },
	};
	return table;
}

const std::vector<tank_info> &stage_tank_types()
{
	static const std::vector<tank_info> table = {
		{ "alu80", "Alu80 (11L)", 11_l },
		{ "alu40", "Alu40 (5.5L)", 5500_ml },
	};
	return table;
}

static const tank_info *find_tank_info(const std::vector<tank_info> &table, const std::string &name)
{
	auto it = std::find_if(table.begin(), table.end(), [&name](const tank_info &info)
			       { return info.name == name; });
	return it != table.end() ? &*it : nullptr;
}

volume_t get_backgas_size(const std::string &name)
{
	const tank_info *info = find_tank_info(backgas_tank_types(), name);
	return info ? info->size : default_backgas_size;
}

volume_t get_stage_size(const std::string &name)
{
	const tank_info *info = find_tank_info(stage_tank_types(), name);
	return info ? info->size : default_stage_size;
}

std::string get_tank_label(const std::string &name)
{
	if (const tank_info *info = find_tank_info(backgas_tank_types(), name))
		return info->label;
	if (const tank_info *info = find_tank_info(stage_tank_types(), name))
		return info->label;
	return name;
}
