// SPDX-License-Identifier: GPL-2.0
#include "testbase.h"
#include "core/errorhelper.h"

void TestBase::failOnError(std::string error)
{
	QFAIL(qPrintable(QStringLiteral("Error reported: %1").arg(QString::fromStdString(error))));
}

void TestBase::initTestCase()
{
	set_error_cb(&TestBase::failOnError);
}

void TestBase::cleanupTestCase()
{
	set_error_cb(NULL);
}
