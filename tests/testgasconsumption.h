// SPDX-License-Identifier: GPL-2.0
#ifndef TESTGASCONSUMPTION_H
#define TESTGASCONSUMPTION_H

#include "testbase.h"

class TestGasConsumption : public TestBase {
	Q_OBJECT
private slots:
	void testTurnPressure();
	void testConservatism();
	void testStageReservation();
	void testSwimConsumption();
	void testNavigationSegments();
	void testRunningAverageDepth();
	void testZeroSwimSpeed();
	void testStageBreathedFirst();
	void testStageEventBreathesBackgas();
	void testUnknownStage();
	void testTurnWarning();
	void testNoWarningOnTheWayBack();
	void testRepeatedCalculation();
};

#endif
