// 核心领域模型与通用结果类型定义
#pragma once

#include <QList>
#include <QString>
#include <QUrl>

#include <optional>

namespace Harmony
{

// 艺术家信息
struct Artist
{
	QString id;
	QString name;

	bool operator==(const Artist &other) const { return id == other.id && name == other.name; }
};

// 专辑引用
struct AlbumRef
{
	QString id;
	QString name;
	QUrl coverUrl;
};

// 歌曲描述：不可变值类型，以 id 作为身份标识
struct SongDescription
{
	QString id;
	QString title;
	QList<Artist> artists;
	AlbumRef album;
	qint64 durationMs = 0;

	// 歌曲的公开网页链接
	QString link() const;
	// 以 " / " 拼接的艺术家名
	QString artistsText() const;

	bool operator==(const SongDescription &other) const { return id == other.id; }
	bool operator!=(const SongDescription &other) const { return !(*this == other); }
};

// 分页游标：描述最近一次拉取的页
struct PaginationCursor
{
	int offset = 0;
	int batchSize = 0;
	// 服务端给出的总数，未知时为空
	std::optional<int> total;
	// 该页实际返回的条数，未知时为空
	std::optional<int> received;

	static PaginationCursor firstPage(int batchSize);

	// 下一页游标；已到末尾时返回空
	std::optional<PaginationCursor> next() const;

	bool operator==(const PaginationCursor &other) const
	{
		return offset == other.offset && batchSize == other.batchSize && total == other.total && received == other.received;
	}
};

// 一页歌曲及其游标
struct SongBatch
{
	PaginationCursor batch;
	QList<SongDescription> songs;
};

// 错误分类，用于统一错误上报
enum class ErrorCategory
{
	Network,
	Parser,
	Auth,
	UpstreamChange,
	RateLimit,
	Cancelled,
	Unknown
};

// 统一错误对象
struct Error
{
	ErrorCategory category = ErrorCategory::Unknown;
	int code = 0;
	QString message;
	QString detail;

	QString toString() const;
};

// 泛型结果类型，用于携带返回值或错误信息
template <typename T>
struct Result
{
	bool ok = false;
	T value{};
	Error error;

	static Result<T> success(const T &v)
	{
		Result<T> r;
		r.ok = true;
		r.value = v;
		return r;
	}

	static Result<T> failure(const Error &e)
	{
		Result<T> r;
		r.ok = false;
		r.error = e;
		return r;
	}
};

Error makeError(ErrorCategory category, int code, const QString &message, const QString &detail = QString());

// std::visit 辅助：将多个 lambda 合并为一个重载集
template <class... Ts>
struct overloaded : Ts...
{
	using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}
