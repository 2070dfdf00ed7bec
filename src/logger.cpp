// Logger 实现：基于 Qt 的 qDebug 系列函数封装日志输出
#include "logger.h"

#include <QDebug>
#include <QLoggingCategory>

namespace Harmony
{

namespace
{

Q_LOGGING_CATEGORY(lcHarmony, "harmony")

}

Logger::Level Logger::currentLevel = Logger::Level::Info;

void Logger::init(Level level)
{
	qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} [%{type}] %{message}"));
	currentLevel = level;
}

void Logger::setLevel(Level level)
{
	currentLevel = level;
}

Logger::Level Logger::level()
{
	return currentLevel;
}

Logger::Level Logger::levelFromString(const QString &name, Level fallback)
{
	const QString n = name.trimmed().toLower();
	if (n == QStringLiteral("debug"))
		return Level::Debug;
	if (n == QStringLiteral("info"))
		return Level::Info;
	if (n == QStringLiteral("warning") || n == QStringLiteral("warn"))
		return Level::Warning;
	if (n == QStringLiteral("error"))
		return Level::Error;
	if (n == QStringLiteral("none") || n == QStringLiteral("off"))
		return Level::None;
	return fallback;
}

void Logger::debug(const QString &message)
{
	if (currentLevel <= Level::Debug)
		qCDebug(lcHarmony).noquote() << message;
}

void Logger::info(const QString &message)
{
	if (currentLevel <= Level::Info)
		qCInfo(lcHarmony).noquote() << message;
}

void Logger::warning(const QString &message)
{
	if (currentLevel <= Level::Warning)
		qCWarning(lcHarmony).noquote() << message;
}

void Logger::error(const QString &message)
{
	if (currentLevel <= Level::Error)
		qCCritical(lcHarmony).noquote() << message;
}

}
