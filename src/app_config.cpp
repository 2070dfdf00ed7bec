// AppConfig 实现
#include "app_config.h"

#include <QSettings>

namespace Harmony
{

namespace
{

int readBoundedInt(QSettings &settings, const QString &key, int fallback, int minValue, int maxValue)
{
	const QVariant raw = settings.value(key);
	if (!raw.isValid())
		return fallback;
	bool ok = false;
	const int value = raw.toInt(&ok);
	if (!ok || value < minValue || value > maxValue)
	{
		Logger::warning(QStringLiteral("Config %1=%2 out of range [%3, %4], using %5")
							.arg(key, raw.toString())
							.arg(minValue)
							.arg(maxValue)
							.arg(fallback));
		return fallback;
	}
	return value;
}

}

AppConfig AppConfig::load(QSettings &settings)
{
	AppConfig config;
	settings.beginGroup(QStringLiteral("set"));

	const QString baseStr = settings.value(QStringLiteral("musicApiBaseUrl"), QString()).toString().trimmed();
	if (!baseStr.isEmpty())
	{
		QUrl url(baseStr);
		if (url.isValid() && !url.scheme().isEmpty())
			config.apiBaseUrl = url;
		else
			Logger::warning(QStringLiteral("Config musicApiBaseUrl is not a valid url: %1").arg(baseStr));
	}

	config.likedPlaylistId = settings.value(QStringLiteral("likedPlaylistId"), QString()).toString().trimmed();
	config.cookie = settings.value(QStringLiteral("cookie"), QString()).toString().trimmed();
	config.savedTracksPageSize = readBoundedInt(settings, QStringLiteral("savedTracksPageSize"), config.savedTracksPageSize, 1, 1000);
	config.requestTimeoutMs = readBoundedInt(settings, QStringLiteral("requestTimeoutMs"), config.requestTimeoutMs, 1000, 120000);
	config.requestRetries = readBoundedInt(settings, QStringLiteral("requestRetries"), config.requestRetries, 0, 10);
	config.retryBaseDelayMs = readBoundedInt(settings, QStringLiteral("retryBaseDelayMs"), config.retryBaseDelayMs, 0, 10000);

	const QString levelName = settings.value(QStringLiteral("logLevel"), QStringLiteral("info")).toString();
	config.logLevel = Logger::levelFromString(levelName, Logger::Level::Info);

	settings.endGroup();
	return config;
}

AppConfig AppConfig::load()
{
	QSettings settings;
	return load(settings);
}

}
