// SPDX-License-Identifier: GPL-2.0
#include "testgasconsumption.h"
#include "testhelper.h"
#include "core/gasconsumption.h"

void TestGasConsumption::testTurnPressure()
{
	dive_calculation calc = calculate_cave_dive(test_config(), {});

	// 22 l at 220 bar, a third of it is usable
	QCOMPARE(calc.total_backgas, 4840.0);
	QCOMPARE(calc.stage_reservation, 0.0);
	QCOMPARE(calc.effective_backgas, 4840.0);
	QVERIFY(qFuzzyCompare(calc.usable_backgas, 4840.0 / 3));
	QCOMPARE(calc.usable_backgas_rounded, 70.0 * 22);
	QCOMPARE(calc.backgas_size.mliter, 22000);
	QCOMPARE(calc.turn_pressure.mbar, 150000);
	QVERIFY(calc.segments.empty());
	QVERIFY(calc.pending_drops.empty());
}

void TestGasConsumption::testConservatism()
{
	cave_config config = test_config();
	config.conservatism = 10_bar;
	dive_calculation calc = calculate_cave_dive(config, {});

	// 10 bar less usable gas moves the turn pressure up to 160 bar
	QVERIFY(qFuzzyCompare(calc.usable_backgas, 4840.0 / 3 - 220.0));
	QCOMPARE(calc.usable_backgas_rounded, 60.0 * 22);
	QCOMPARE(calc.turn_pressure.mbar, 160000);
}

void TestGasConsumption::testStageReservation()
{
	cave_config config = test_config();
	config.stages.push_back(alu80("stg1", 200, true));
	config.stages.push_back(alu80("stg2", 200, false));
	dive_calculation calc = calculate_cave_dive(config, {});

	// Only the first stage is covered by the back gas: 200 down to 115 bar in 11 l
	QVERIFY(qFuzzyCompare(calc.stage_reservation, 85.0 * 11));
	QVERIFY(qFuzzyCompare(calc.effective_backgas, 4840.0 - 935.0));
	QVERIFY(qFuzzyCompare(calc.usable_backgas, (4840.0 - 935.0) / 3));
	QCOMPARE(calc.usable_backgas_rounded, 50.0 * 22);
	QCOMPARE(calc.turn_pressure.mbar, 170000);
}

void TestGasConsumption::testSwimConsumption()
{
	dive_calculation calc = calculate_cave_dive(test_config(), { swim("s1", 10, 100) });

	QCOMPARE(calc.segments.size(), (size_t)1);
	const segment_result &res = calc.segments[0];
	QCOMPARE(res.segment_id, std::string("s1"));
	QCOMPARE(res.time, 10.0);
	QCOMPARE(res.depth.mm, 10000);
	// 20 l/min at 2 ATA for 10 minutes
	QCOMPARE(res.gas_consumed, 400.0);
	QCOMPARE(res.remaining_backgas_l, 4440.0);
	QVERIFY(qFuzzyCompare(res.remaining_backgas_bar, 4440.0 / 22));
	QCOMPARE(res.backgas_used, 400.0);
	QCOMPARE(res.total_consumed, 400.0);
	QCOMPARE(res.runtime, 10.0);
	QVERIFY(res.breathed_backgas);
	QVERIFY(res.breathed_stage_ids.empty());
	QVERIFY(!res.turn_warning);
	QCOMPARE(res.threshold.mbar, 150000);
}

void TestGasConsumption::testNavigationSegments()
{
	dive_calculation calc = calculate_cave_dive(test_config(), {
		swim("s1", 20, 100),
		marker("s2", SEGMENT_TURN_LEFT),
		marker("s3", SEGMENT_JUMP_RIGHT),
		marker("s4", SEGMENT_TURNAROUND),
	});

	// Turns take no time
	QCOMPARE(calc.segments[1].time, 0.0);
	QCOMPARE(calc.segments[1].gas_consumed, 0.0);
	QCOMPARE(calc.segments[1].depth.mm, 20000);

	// A jump is two minutes at the depth of the last swim
	QCOMPARE(calc.segments[2].time, 2.0);
	QCOMPARE(calc.segments[2].depth.mm, 20000);
	QCOMPARE(calc.segments[2].gas_consumed, 120.0);

	QCOMPARE(calc.segments[3].time, 0.0);
	QCOMPARE(calc.segments[3].runtime, 12.0);
	QCOMPARE(calc.segments[3].total_consumed, 720.0);
	QCOMPARE(calc.segments[3].remaining_backgas_l, 4840.0 - 720.0);
}

void TestGasConsumption::testRunningAverageDepth()
{
	dive_calculation calc = calculate_cave_dive(test_config(), {
		swim("s1", 10, 100),
		swim("s2", 30, 100),
		marker("s3", SEGMENT_TURNAROUND),
		swim("s4", 30, 200),
	});

	QCOMPARE(calc.segments[0].running_avg_depth.mm, 10000);
	QCOMPARE(calc.segments[1].running_avg_depth.mm, 20000);
	QCOMPARE(calc.segments[2].running_avg_depth.mm, 20000);
	QCOMPARE(calc.segments[3].running_avg_depth.mm, 25000);
	QCOMPARE(calc.segments[3].runtime, 40.0);
}

void TestGasConsumption::testZeroSwimSpeed()
{
	cave_config config = test_config();
	config.swim_speed = 0;
	dive_calculation calc = calculate_cave_dive(config, { swim("s1", 30, 500) });

	const segment_result &res = calc.segments[0];
	QCOMPARE(res.time, 0.0);
	QCOMPARE(res.gas_consumed, 0.0);
	QCOMPARE(res.remaining_backgas_l, 4840.0);
	QCOMPARE(res.running_avg_depth.mm, 0);
	QCOMPARE(res.time_from_exit, 0.0);
	QCOMPARE(res.gas_from_exit, 0.0);
	QVERIFY(!res.turn_warning);
}

void TestGasConsumption::testStageBreathedFirst()
{
	cave_config config = test_config();
	config.stages.push_back(alu80("stg1", 200));
	dive_calculation calc = calculate_cave_dive(config, { swim("s1", 10, 100) });

	const segment_result &res = calc.segments[0];
	QCOMPARE(res.stages.size(), (size_t)1);
	const stage_state &st = res.stages[0];
	QCOMPARE(st.size.mliter, 11000);
	QCOMPARE(st.initial_pressure, 200.0);
	QCOMPARE(st.drop_pressure, 115.0);
	QVERIFY(qFuzzyCompare(st.current_pressure, 200.0 - 400.0 / 11));
	QVERIFY(!st.dropped);

	QCOMPARE(res.breathed_stage_ids, std::vector<std::string>{ "stg1" });
	QVERIFY(!res.breathed_backgas);
	QCOMPARE(res.remaining_backgas_l, 4840.0);
	QCOMPARE(res.backgas_used, 0.0);
	QCOMPARE(res.total_consumed, 400.0);
}

void TestGasConsumption::testStageEventBreathesBackgas()
{
	cave_config config = test_config();
	config.stages.push_back(alu80("stg1", 200));
	dive_calculation calc = calculate_cave_dive(config, {
		swim("s1", 10, 100),
		stage_event("s2", "stg1"),
	});

	const segment_result &res = calc.segments[1];
	// Two minutes at 10 m, none of it from the stage that is being dropped
	QCOMPARE(res.time, 2.0);
	QCOMPARE(res.gas_consumed, 80.0);
	QCOMPARE(res.remaining_backgas_l, 4840.0 - 80.0);
	QVERIFY(qFuzzyCompare(res.stages[0].current_pressure, calc.segments[0].stages[0].current_pressure));
	QVERIFY(res.stages[0].dropped);
	QCOMPARE(res.dropped_stage_ids, std::vector<std::string>{ "stg1" });
	QVERIFY(res.breathed_stage_ids.empty());
}

void TestGasConsumption::testUnknownStage()
{
	cave_config config = test_config();
	config.stages.push_back(alu80("stg1", 200));
	dive_calculation calc = calculate_cave_dive(config, {
		stage_event("s1", "missing"),
		swim("s2", 10, 100),
	});

	QCOMPARE(calc.segments.size(), (size_t)2);
	QVERIFY(calc.segments[0].dropped_stage_ids.empty());
	QVERIFY(!calc.segments[0].stages[0].dropped);
	// The stage is still carried and breathed
	QCOMPARE(calc.segments[1].breathed_stage_ids, std::vector<std::string>{ "stg1" });
}

void TestGasConsumption::testTurnWarning()
{
	dive_calculation calc = calculate_cave_dive(test_config(), { swim("s1", 20, 500) });

	// 3000 l at 3 ATA leave 83.6 bar, well below the turn pressure of 150 bar
	const segment_result &res = calc.segments[0];
	QCOMPARE(res.gas_consumed, 3000.0);
	QVERIFY(res.remaining_backgas_bar < 150.0);
	QVERIFY(res.turn_warning);
	QVERIFY(!res.recalc_threshold_active);

	// Overbreathing shows as a negative remaining pressure
	calc = calculate_cave_dive(test_config(), { swim("s1", 20, 900) });
	QVERIFY(calc.segments[0].remaining_backgas_l < 0);
	QVERIFY(calc.segments[0].turn_warning);
}

void TestGasConsumption::testNoWarningOnTheWayBack()
{
	dive_calculation calc = calculate_cave_dive(test_config(), {
		swim("s1", 20, 200),
		marker("s2", SEGMENT_TURNAROUND),
		swim("s3", 20, 300),
	});

	QVERIFY(!calc.segments[0].turn_warning);
	QVERIFY(calc.segments[2].way_back);
	QVERIFY(calc.segments[2].remaining_backgas_bar < 150.0);
	QVERIFY(!calc.segments[2].turn_warning);
}

void TestGasConsumption::testRepeatedCalculation()
{
	cave_config config = test_config();
	config.stages.push_back(alu80("stg1", 200));
	std::vector<segment> segments = {
		swim("s1", 15, 300),
		marker("s2", SEGMENT_TURNAROUND),
		swim("s3", 15, 300),
	};

	dive_calculation first = calculate_cave_dive(config, segments);
	dive_calculation second = calculate_cave_dive(config, segments);

	QCOMPARE(first.segments.size(), second.segments.size());
	for (size_t i = 0; i < first.segments.size(); i++) {
		QCOMPARE(first.segments[i].remaining_backgas_l, second.segments[i].remaining_backgas_l);
		QCOMPARE(first.segments[i].stages[0].current_pressure, second.segments[i].stages[0].current_pressure);
		QCOMPARE(first.segments[i].stages[0].dropped, second.segments[i].stages[0].dropped);
	}
	QCOMPARE(first.pending_drops.size(), second.pending_drops.size());
}

QTEST_GUILESS_MAIN(TestGasConsumption)
