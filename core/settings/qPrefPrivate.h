// SPDX-License-Identifier: GPL-2.0
#ifndef QPREFPRIVATE_H
#define QPREFPRIVATE_H

// Header used by all qPref<class> implementations to avoid duplicating code
#include <QString>
#include <QVariant>

// implementation class of the interface classes
class qPrefPrivate {

public:
	// Helper functions
	static void propSetValue(const QString &key, const QVariant &value);
	static QVariant propValue(const QString &key, const QVariant &defaultValue);
	static void propRemove(const QString &key);

private:
	qPrefPrivate() {}
};

// helper function to ensure there's a '/' between group and name
extern QString keyFromGroupAndName(QString group, QString name);

#endif
