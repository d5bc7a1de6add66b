// SPDX-License-Identifier: GPL-2.0
#ifndef TESTREENTRY_H
#define TESTREENTRY_H

#include "testbase.h"

class TestReentry : public TestBase {
	Q_OBJECT
private slots:
	void testWayBackFlags();
	void testDistanceFromExit();
	void testRecalculationAtExit();
	void testRecalculationAtExitWithSidePassage();
	void testRecalculationPartwayBack();
	void testBackgasReentry();
	void testBackgasReentryDroppedStage();
	void testReentryNotPossible();
	void testAdjustedTurnPressure();
	void testKillStage();
	void testKillStageCoversSidePassage();
	void testKillStageNotPossible();
};

#endif
