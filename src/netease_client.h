// NeteaseClient：基于本地 netease-cloud-music-api 的收藏歌曲分页客户端
#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QSharedPointer>
#include <QUrl>

#include "app_config.h"
#include "http_client.h"
#include "music_client.h"

namespace Harmony
{

class NeteaseClient : public IMusicClient
{
public:
	// 共享持有 httpClient，请求投递到其所在线程执行；savedTracksPage 可在任意线程调用
	// 建议以 QObject::deleteLater 作为删除器，保证 httpClient 在自己的线程中析构
	NeteaseClient(QSharedPointer<HttpClient> httpClient, const AppConfig &config);

	QString id() const override;
	QFuture<Result<SongBatch>> savedTracksPage(int offset, int limit) const override;

private:
	// 构造后不再修改，跨线程只做拷贝
	const QSharedPointer<HttpClient> client;
	QUrl apiBase;
	QString likedPlaylistId;
	QString cookie;
	int timeoutMs = 15000;
	RetryPolicy retryPolicy;

	QUrl buildUrl(const QString &path, const QList<QPair<QString, QString>> &query) const;
};

namespace Netease
{

// 解析单首歌曲（/playlist/track/all 与 /song/detail 的 songs[] 元素）
Result<SongDescription> parseSong(const QJsonObject &obj, const QString &path = QString());
// 解析一页收藏歌曲；超过 limit 的部分会被截断
Result<SongBatch> parseSavedTracksPage(int offset, int limit, const QByteArray &body);

}

}
