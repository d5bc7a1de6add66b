// SPDX-License-Identifier: GPL-2.0
#ifndef TESTBASE_H
#define TESTBASE_H

#include <string>
#include <QtTest>

// Any report_error() while a test runs fails that test
class TestBase : public QObject {
	Q_OBJECT
public:
	static void failOnError(std::string error);

protected slots:
	void initTestCase();
	void cleanupTestCase();
};

#endif
