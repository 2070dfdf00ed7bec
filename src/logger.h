// 简单日志封装，统一控制日志级别与输出格式
#pragma once

#include <QString>

namespace Harmony
{

class Logger
{
public:
	// 日志级别，按严重程度递增
	enum class Level
	{
		Debug,
		Info,
		Warning,
		Error,
		None
	};

	// 初始化日志模块：设置级别并安装统一的输出格式
	static void init(Level level = Level::Info);
	static void setLevel(Level level);
	static Level level();
	// 解析配置中的级别名（debug/info/warning/error/none），无法识别时返回 fallback
	static Level levelFromString(const QString &name, Level fallback = Level::Info);

	static void debug(const QString &message);
	static void info(const QString &message);
	static void warning(const QString &message);
	static void error(const QString &message);

private:
	static Level currentLevel;
};

}
