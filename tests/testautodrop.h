// SPDX-License-Identifier: GPL-2.0
#ifndef TESTAUTODROP_H
#define TESTAUTODROP_H

#include "testbase.h"

class TestAutoDrop : public TestBase {
	Q_OBJECT
private slots:
	void testDropWithinSwim();
	void testDropDuringJump();
	void testPlannedDropLater();
	void testMarkerInOtherPassage();
	void testSecondStageTakesOver();
	void testPickedUpStageNotDropped();
	void testSegmentsUnchanged();
};

#endif
