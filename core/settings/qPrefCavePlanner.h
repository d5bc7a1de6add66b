// SPDX-License-Identifier: GPL-2.0
#ifndef QPREFCAVEPLANNER_H
#define QPREFCAVEPLANNER_H
#include "core/caveplan.h"

#include <optional>
#include <vector>
#include <QObject>

/* Standing data and segment list of the plan that is being edited. Both are
 * kept as JSON documents in the application settings. Loading never fails:
 * missing or unreadable data is reported as "nothing stored". */
class qPrefCavePlanner : public QObject {
	Q_OBJECT

public:
	static qPrefCavePlanner *instance();

	static std::optional<cave_config> load_config();
	static std::optional<std::vector<segment>> load_segments();

	// Stored data, or the defaults resp. an empty plan
	static cave_config config_or_default();
	static std::vector<segment> segments_or_default();

	static void save_config(const cave_config &config);
	static void save_segments(const std::vector<segment> &segments);
	static void clear();

signals:
	void configChanged();
	void segmentsChanged();

private:
	qPrefCavePlanner(QObject *parent = NULL) : QObject(parent) {}
};

#endif
