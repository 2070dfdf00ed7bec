// NeteaseClient 实现：请求在 HttpClient 线程发出，响应在线程池中解析
#include "netease_client.h"

#include <QFutureWatcher>
#include <QJsonArray>
#include <QPromise>
#include <QSharedPointer>
#include <QUrlQuery>

#include <utility>
#include <QtConcurrent/QtConcurrentRun>

#include "json_utils.h"
#include "logger.h"

namespace Harmony
{

namespace
{

using BatchPromise = QSharedPointer<QPromise<Result<SongBatch>>>;

void fulfil(const BatchPromise &promise, const Result<SongBatch> &result)
{
	promise->addResult(result);
	promise->finish();
}

}

NeteaseClient::NeteaseClient(QSharedPointer<HttpClient> httpClient, const AppConfig &config)
	: client(std::move(httpClient))
	, apiBase(config.apiBaseUrl)
	, likedPlaylistId(config.likedPlaylistId)
	, cookie(config.cookie)
	, timeoutMs(config.requestTimeoutMs)
{
	retryPolicy.maxRetries = config.requestRetries;
	retryPolicy.baseDelayMs = config.retryBaseDelayMs;
}

QString NeteaseClient::id() const
{
	return QStringLiteral("netease");
}

QUrl NeteaseClient::buildUrl(const QString &path, const QList<QPair<QString, QString>> &query) const
{
	QUrl url = apiBase.resolved(QUrl(path));
	QUrlQuery q;
	for (const auto &pair : query)
		q.addQueryItem(pair.first, pair.second);
	url.setQuery(q);
	return url;
}

QFuture<Result<SongBatch>> NeteaseClient::savedTracksPage(int offset, int limit) const
{
	BatchPromise promise = BatchPromise::create();
	promise->start();
	QFuture<Result<SongBatch>> future = promise->future();

	if (likedPlaylistId.isEmpty())
	{
		fulfil(promise, Result<SongBatch>::failure(makeError(ErrorCategory::Auth, 301, QStringLiteral("Liked playlist id is not configured"))));
		return future;
	}
	if (!client)
	{
		fulfil(promise, Result<SongBatch>::failure(makeError(ErrorCategory::Network, -3, QStringLiteral("No HTTP client"))));
		return future;
	}

	const int safeOffset = offset > 0 ? offset : 0;
	const int safeLimit = limit > 0 ? limit : 50;
	HttpRequestOptions opts;
	opts.url = buildUrl(QStringLiteral("/playlist/track/all"),
						{{QStringLiteral("id"), likedPlaylistId},
						 {QStringLiteral("limit"), QString::number(safeLimit)},
						 {QStringLiteral("offset"), QString::number(safeOffset)}});
	opts.timeoutMs = timeoutMs;
	if (!cookie.isEmpty())
		opts.headers.insert("Cookie", cookie.toUtf8());

	const RetryPolicy policy = retryPolicy;
	const QSharedPointer<HttpClient> http = client;
	const bool posted = QMetaObject::invokeMethod(
		http.data(),
		[http, opts, policy, safeOffset, safeLimit, promise]() {
			// 投递期间已被调用方取消，不再发出请求
			if (promise->isCanceled())
			{
				promise->finish();
				return;
			}
			QSharedPointer<RequestToken> token = http->sendWithRetry(opts, policy, [safeOffset, safeLimit, promise](Result<HttpResponse> result) {
				if (!result.ok)
				{
					if (result.error.category == ErrorCategory::Cancelled)
						Logger::debug(QStringLiteral("Saved tracks request at offset %1 cancelled").arg(safeOffset));
					else
						Logger::warning(QStringLiteral("Saved tracks request failed at offset %1: %2").arg(safeOffset).arg(result.error.toString()));
					fulfil(promise, Result<SongBatch>::failure(result.error));
					return;
				}
				const QByteArray body = result.value.body;
				QtConcurrent::run([safeOffset, safeLimit, body]() {
					return Netease::parseSavedTracksPage(safeOffset, safeLimit, body);
				}).then([promise](Result<SongBatch> parsed) {
					fulfil(promise, parsed);
				});
			});
			// future 被取消时中止底层请求；watcher 随令牌一起释放
			auto *watcher = new QFutureWatcher<Result<SongBatch>>(token.data());
			QObject::connect(watcher, &QFutureWatcherBase::canceled, token.data(), &RequestToken::cancel);
			watcher->setFuture(promise->future());
			if (promise->isCanceled())
				token->cancel();
		},
		Qt::AutoConnection);
	if (!posted)
		fulfil(promise, Result<SongBatch>::failure(makeError(ErrorCategory::Network, -3, QStringLiteral("Failed to schedule saved tracks request"))));
	return future;
}

namespace Netease
{

Result<SongDescription> parseSong(const QJsonObject &obj, const QString &path)
{
	Json::Reader r(obj, path);
	Result<QString> songId = r.string(QStringLiteral("id"));
	if (!songId.ok)
		return Result<SongDescription>::failure(songId.error);

	SongDescription s;
	s.id = songId.value;
	s.title = r.string(QStringLiteral("name"), false).value;
	s.durationMs = r.int64(QStringLiteral("dt"), false).value;

	Result<QJsonArray> artists = r.array(QStringLiteral("ar"), false);
	if (!artists.ok)
		return Result<SongDescription>::failure(artists.error);
	for (int i = 0; i < artists.value.size(); ++i)
	{
		Json::Reader ar(artists.value.at(i).toObject(), r.childPath(QStringLiteral("ar"), i));
		Artist a;
		a.id = ar.string(QStringLiteral("id"), false).value;
		a.name = ar.string(QStringLiteral("name"), false).value;
		s.artists.append(a);
	}

	Result<QJsonObject> album = r.object(QStringLiteral("al"), false);
	if (!album.ok)
		return Result<SongDescription>::failure(album.error);
	Json::Reader al(album.value, r.childPath(QStringLiteral("al")));
	s.album.id = al.string(QStringLiteral("id"), false).value;
	s.album.name = al.string(QStringLiteral("name"), false).value;
	s.album.coverUrl = QUrl(al.string(QStringLiteral("picUrl"), false).value);
	return Result<SongDescription>::success(s);
}

Result<SongBatch> parseSavedTracksPage(int offset, int limit, const QByteArray &body)
{
	Result<QJsonObject> root = Json::parseObject(body);
	if (!root.ok)
		return Result<SongBatch>::failure(root.error);

	Json::Reader r(root.value);
	// 接口在未登录时返回 code=301，其余非 200 视为上游变化
	if (r.has(QStringLiteral("code")))
	{
		const qint64 code = r.int64(QStringLiteral("code")).value;
		if (code == 301)
			return Result<SongBatch>::failure(makeError(ErrorCategory::Auth, 301, QStringLiteral("Login required")));
		if (code != 200)
			return Result<SongBatch>::failure(makeError(ErrorCategory::UpstreamChange, static_cast<int>(code), QStringLiteral("Unexpected response code")));
	}

	Result<QJsonArray> songsArr = r.array(QStringLiteral("songs"));
	if (!songsArr.ok)
		return Result<SongBatch>::failure(songsArr.error);

	SongBatch page;
	page.songs.reserve(songsArr.value.size());
	for (int i = 0; i < songsArr.value.size(); ++i)
	{
		Result<SongDescription> song = parseSong(songsArr.value.at(i).toObject(), r.childPath(QStringLiteral("songs"), i));
		if (!song.ok)
			return Result<SongBatch>::failure(song.error);
		page.songs.append(song.value);
	}
	if (limit > 0 && page.songs.size() > limit)
	{
		Logger::warning(QStringLiteral("Saved tracks page returned %1 songs for limit %2, truncating").arg(page.songs.size()).arg(limit));
		page.songs = page.songs.mid(0, limit);
	}

	page.batch.offset = offset > 0 ? offset : 0;
	page.batch.batchSize = limit > 0 ? limit : static_cast<int>(page.songs.size());
	page.batch.received = static_cast<int>(page.songs.size());
	const qint64 total = r.int64(QStringLiteral("total"), false).value;
	if (total > 0)
		page.batch.total = static_cast<int>(total);
	return Result<SongBatch>::success(page);
}

}

}
