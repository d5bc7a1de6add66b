// SPDX-License-Identifier: GPL-2.0
#include "qPrefPrivate.h"

#include <QSettings>

QString keyFromGroupAndName(QString group, QString name)
{
	QString slash = (group.endsWith('/') || name.startsWith('/')) ? "" : "/";
	return group + slash + name;
}

void qPrefPrivate::propSetValue(const QString &key, const QVariant &value)
{
	QSettings s;
	s.setValue(key, value);
}

QVariant qPrefPrivate::propValue(const QString &key, const QVariant &defaultValue)
{
	QSettings s;
	return s.value(key, defaultValue);
}

void qPrefPrivate::propRemove(const QString &key)
{
	QSettings s;
	s.remove(key);
}
