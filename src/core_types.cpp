// 核心领域模型的少量行为实现
#include "core_types.h"

#include <QStringList>

namespace Harmony
{

QString SongDescription::link() const
{
	return QStringLiteral("https://music.163.com/#/song?id=%1").arg(id);
}

QString SongDescription::artistsText() const
{
	QStringList names;
	names.reserve(artists.size());
	for (const Artist &a : artists)
		names.append(a.name);
	return names.join(QStringLiteral(" / "));
}

PaginationCursor PaginationCursor::firstPage(int batchSize)
{
	PaginationCursor cursor;
	cursor.offset = 0;
	cursor.batchSize = batchSize;
	return cursor;
}

std::optional<PaginationCursor> PaginationCursor::next() const
{
	if (batchSize <= 0)
		return std::nullopt;
	// 上一页不满，说明已经没有更多
	if (received && *received < batchSize)
		return std::nullopt;
	const int nextOffset = offset + batchSize;
	if (total && nextOffset >= *total)
		return std::nullopt;

	PaginationCursor cursor;
	cursor.offset = nextOffset;
	cursor.batchSize = batchSize;
	cursor.total = total;
	return cursor;
}

QString Error::toString() const
{
	if (detail.isEmpty())
		return QStringLiteral("%1 (code %2)").arg(message).arg(code);
	return QStringLiteral("%1 (code %2, %3)").arg(message).arg(code).arg(detail);
}

Error makeError(ErrorCategory category, int code, const QString &message, const QString &detail)
{
	Error e;
	e.category = category;
	e.code = code;
	e.message = message;
	e.detail = detail;
	return e;
}

}
