// SongRow：收藏歌曲列表中一行的渲染数据
#pragma once

#include <QString>

#include "core_types.h"

namespace Harmony
{

struct SongRow
{
	// 从 1 开始的行号
	int index = 0;
	QString id;
	QString title;
	QString artists;
	QString album;
	qint64 durationMs = 0;

	static SongRow fromSong(const SongDescription &song, int index)
	{
		SongRow row;
		row.index = index;
		row.id = song.id;
		row.title = song.title;
		row.artists = song.artistsText();
		row.album = song.album.name;
		row.durationMs = song.durationMs;
		return row;
	}

	bool operator==(const SongRow &other) const
	{
		return index == other.index && id == other.id && title == other.title && artists == other.artists && album == other.album && durationMs == other.durationMs;
	}
};

}
