// HTTP 客户端封装：统一超时、重试、取消与错误处理
#pragma once

#include <QByteArray>
#include <QMap>
#include <QNetworkAccessManager>
#include <QObject>
#include <QSharedPointer>
#include <QUrl>

#include <functional>

#include "core_types.h"

namespace Harmony
{

// 请求取消令牌，用于主动终止正在进行的请求（含尚未发出的重试）
class RequestToken : public QObject
{
	Q_OBJECT

public:
	explicit RequestToken(QObject *parent = nullptr);
	void cancel();
	bool isCancelled() const;

signals:
	void cancelled();

private:
	bool cancelledFlag = false;
};

// 单次 GET 请求配置
struct HttpRequestOptions
{
	QUrl url;
	QMap<QByteArray, QByteArray> headers;
	int timeoutMs = 15000;
};

// 重试策略：maxRetries 次重试，延迟为 baseDelayMs * 2^(n-1)，最多放大 maxBackoffFactor 倍
struct RetryPolicy
{
	int maxRetries = 2;
	int baseDelayMs = 500;
	int maxBackoffFactor = 16;

	int delayForAttempt(int attempt) const;
};

struct HttpResponse
{
	int statusCode = 0;
	QByteArray body;
	QMap<QByteArray, QByteArray> headers;
};

using HttpCallback = std::function<void(Result<HttpResponse>)>;

// HTTP 客户端，对 QNetworkAccessManager 进行高层封装
// 必须在所属线程中调用 send 系列方法
class HttpClient : public QObject
{
	Q_OBJECT

public:
	explicit HttpClient(QObject *parent = nullptr);

	void setDefaultHeaders(const QMap<QByteArray, QByteArray> &headers);
	void setUserAgent(const QByteArray &ua);

	// 发出 GET 请求，按 policy 重试；返回的令牌可随时取消，回调只会被调用一次
	QSharedPointer<RequestToken> sendWithRetry(const HttpRequestOptions &options, const RetryPolicy &policy, const HttpCallback &callback);

	// 根据 HTTP 状态码归类错误（401/403 -> Auth，429 -> RateLimit，其余 4xx -> UpstreamChange，5xx -> Network）
	static ErrorCategory categoryForStatus(int statusCode);
	static bool isRetryable(const Result<HttpResponse> &result);

private:
	QNetworkAccessManager manager;
	QMap<QByteArray, QByteArray> defaultHeaders;
	QByteArray userAgent;

	void applyHeaders(QNetworkRequest &request, const HttpRequestOptions &options);
	void sendOnce(const HttpRequestOptions &options, const QSharedPointer<RequestToken> &token, const HttpCallback &callback);
};

}
