// AppConfig：从 QSettings 读取运行配置
#pragma once

#include <QString>
#include <QUrl>

#include "logger.h"

class QSettings;

namespace Harmony
{

struct AppConfig
{
	// 本地 netease-cloud-music-api 服务地址
	QUrl apiBaseUrl = QUrl(QStringLiteral("http://127.0.0.1:30488"));
	// “我喜欢的音乐”歌单 id
	QString likedPlaylistId;
	// 登录 cookie，原样附加到请求头
	QString cookie;
	int savedTracksPageSize = 50;
	int requestTimeoutMs = 15000;
	int requestRetries = 2;
	int retryBaseDelayMs = 500;
	Logger::Level logLevel = Logger::Level::Info;

	// 读取 "set" 分组；非法值记录警告后回退默认值
	static AppConfig load(QSettings &settings);
	static AppConfig load();
};

}
