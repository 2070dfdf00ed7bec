// HttpClient 实现：为网络请求提供超时、重试、取消等能力
#include "http_client.h"

#include "logger.h"

#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

namespace Harmony
{

namespace
{

Error cancelledError()
{
	return makeError(ErrorCategory::Cancelled, -2, QStringLiteral("Request cancelled"));
}

}

RequestToken::RequestToken(QObject *parent)
	: QObject(parent)
{
}

void RequestToken::cancel()
{
	if (cancelledFlag)
		return;
	cancelledFlag = true;
	emit cancelled();
}

bool RequestToken::isCancelled() const
{
	return cancelledFlag;
}

int RetryPolicy::delayForAttempt(int attempt) const
{
	const int base = baseDelayMs > 0 ? baseDelayMs : 0;
	int factor = 1;
	for (int i = 1; i < attempt && factor < maxBackoffFactor; ++i)
		factor *= 2;
	if (factor > maxBackoffFactor)
		factor = maxBackoffFactor;
	return base * factor;
}

HttpClient::HttpClient(QObject *parent)
	: QObject(parent)
{
	manager.setRedirectPolicy(QNetworkRequest::NoLessSafeRedirectPolicy);
}

void HttpClient::setDefaultHeaders(const QMap<QByteArray, QByteArray> &headers)
{
	defaultHeaders = headers;
}

void HttpClient::setUserAgent(const QByteArray &ua)
{
	userAgent = ua;
}

void HttpClient::applyHeaders(QNetworkRequest &request, const HttpRequestOptions &options)
{
	for (auto it = defaultHeaders.cbegin(); it != defaultHeaders.cend(); ++it)
		request.setRawHeader(it.key(), it.value());
	for (auto it = options.headers.cbegin(); it != options.headers.cend(); ++it)
		request.setRawHeader(it.key(), it.value());
	if (!userAgent.isEmpty())
		request.setHeader(QNetworkRequest::UserAgentHeader, userAgent);
}

// 每次尝试都经过 sendOnce；可重试的失败按退避延迟后再发，令牌取消后不再重试
QSharedPointer<RequestToken> HttpClient::sendWithRetry(const HttpRequestOptions &options, const RetryPolicy &policy, const HttpCallback &callback)
{
	QSharedPointer<RequestToken> token = QSharedPointer<RequestToken>::create();
	QSharedPointer<int> attempt = QSharedPointer<int>::create(0);
	auto retryFn = QSharedPointer<std::function<void()>>::create();
	// 闭包只弱引用自身，强引用由挂起中的回调/定时器持有，请求结束后自动释放
	QWeakPointer<std::function<void()>> weakRetry = retryFn;
	*retryFn = [this, options, policy, callback, token, attempt, weakRetry]() {
		if (token->isCancelled())
		{
			callback(Result<HttpResponse>::failure(cancelledError()));
			return;
		}
		QSharedPointer<std::function<void()>> self = weakRetry.toStrongRef();
		sendOnce(options, token, [this, options, policy, callback, token, attempt, self](Result<HttpResponse> result) {
			if (!self || !isRetryable(result) || *attempt >= policy.maxRetries || token->isCancelled())
			{
				callback(result);
				return;
			}
			(*attempt)++;
			const int delay = policy.delayForAttempt(*attempt);
			Logger::debug(QStringLiteral("Retrying %1 in %2 ms (attempt %3/%4): %5")
							  .arg(options.url.path())
							  .arg(delay)
							  .arg(*attempt)
							  .arg(policy.maxRetries)
							  .arg(result.ok ? QString::number(result.value.statusCode) : result.error.message));
			QTimer::singleShot(delay, this, [self]() {
				(*self)();
			});
		});
	};
	(*retryFn)();
	return token;
}

void HttpClient::sendOnce(const HttpRequestOptions &options, const QSharedPointer<RequestToken> &token, const HttpCallback &callback)
{
	if (!options.url.isValid())
	{
		callback(Result<HttpResponse>::failure(makeError(ErrorCategory::Network, -1, QStringLiteral("Invalid URL"), options.url.toString())));
		return;
	}
	if (token && token->isCancelled())
	{
		callback(Result<HttpResponse>::failure(cancelledError()));
		return;
	}

	QNetworkRequest request(options.url);
	applyHeaders(request, options);

	QNetworkReply *reply = manager.get(request);

	const int timeoutMs = options.timeoutMs > 0 ? options.timeoutMs : 15000;
	QTimer *timer = new QTimer(reply);
	timer->setSingleShot(true);
	QObject::connect(timer, &QTimer::timeout, reply, [reply]() {
		if (reply->isRunning())
			reply->abort();
	});
	timer->start(timeoutMs);

	// 取消令牌触发时中止请求，finished 中按 Cancelled 上报
	if (token)
	{
		QObject::connect(token.data(), &RequestToken::cancelled, reply, [reply]() {
			if (reply->isRunning())
				reply->abort();
		});
	}

	QObject::connect(reply, &QNetworkReply::finished, reply, [reply, timer, token, callback]() {
		const bool timedOut = !timer->isActive() && reply->error() == QNetworkReply::OperationCanceledError && !(token && token->isCancelled());
		timer->stop();

		HttpResponse response;
		response.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
		const auto headerList = reply->rawHeaderList();
		for (const QByteArray &name : headerList)
			response.headers.insert(name, reply->rawHeader(name));
		response.body = reply->readAll();

		if (reply->error() == QNetworkReply::NoError)
		{
			callback(Result<HttpResponse>::success(response));
		}
		else if (token && token->isCancelled())
		{
			callback(Result<HttpResponse>::failure(cancelledError()));
		}
		else
		{
			Error e;
			e.category = response.statusCode >= 400 ? categoryForStatus(response.statusCode) : ErrorCategory::Network;
			// 超时由定时器 abort 触发，统一按 TimeoutError 上报以便重试
			e.code = timedOut ? static_cast<int>(QNetworkReply::TimeoutError) : static_cast<int>(reply->error());
			e.message = timedOut ? QStringLiteral("Request timed out") : reply->errorString();
			e.detail = QString::number(response.statusCode);
			callback(Result<HttpResponse>::failure(e));
		}

		reply->deleteLater();
	});
}

// 仅用于状态码 >= 400 的失败响应
ErrorCategory HttpClient::categoryForStatus(int statusCode)
{
	if (statusCode == 401 || statusCode == 403)
		return ErrorCategory::Auth;
	if (statusCode == 429)
		return ErrorCategory::RateLimit;
	if (statusCode >= 500)
		return ErrorCategory::Network;
	if (statusCode >= 400)
		return ErrorCategory::UpstreamChange;
	return ErrorCategory::Unknown;
}

// 5xx、限流与临时性网络错误可重试；鉴权、取消与上游变化不重试
bool HttpClient::isRetryable(const Result<HttpResponse> &result)
{
	if (result.ok)
		return result.value.statusCode >= 500 && result.value.statusCode < 600;
	const Error &e = result.error;
	if (e.category == ErrorCategory::RateLimit)
		return true;
	if (e.category != ErrorCategory::Network)
		return false;
	switch (e.code)
	{
	case QNetworkReply::TimeoutError:
	case QNetworkReply::TemporaryNetworkFailureError:
	case QNetworkReply::UnknownNetworkError:
	case QNetworkReply::NetworkSessionFailedError:
	case QNetworkReply::RemoteHostClosedError:
		return true;
	default:
		break;
	}
	// 5xx 在 Qt 中映射为 ServerError 系列
	if (e.detail.toInt() >= 500)
		return true;
	return false;
}

}
