// AppState：应用状态树以及各子状态的归约逻辑
#pragma once

#include <QList>
#include <QSet>
#include <QString>

#include <optional>

#include "app_actions.h"
#include "app_events.h"
#include "core_types.h"

namespace Harmony
{

// 首页状态：累计的收藏歌曲与最近一页的游标
struct HomeState
{
	QList<SongDescription> savedTracks;
	PaginationCursor lastSavedTracksBatch;
	// 最近一次分页拉取的错误，成功后清空
	std::optional<Error> lastError;
};

class BrowserState
{
public:
	// 首页尚未加载时返回 nullptr
	const HomeState *homeState() const;
	const QList<ScreenName> &navigationStack() const;

	QList<AppEvent> update(const BrowserAction &action);
	QList<AppEvent> navigate(const ScreenName &screen);

private:
	std::optional<HomeState> home;
	QList<ScreenName> navigation{ScreenName{}};
};

class PlaybackState
{
public:
	std::optional<QString> currentSongId() const;
	const SongDescription *currentSong() const;
	const QList<SongDescription> &queue() const;
	std::optional<PlaylistSource> source() const;
	std::optional<PaginationCursor> pagedBatch() const;

	QList<AppEvent> update(const PlaybackAction &action);

private:
	QList<SongDescription> songs;
	std::optional<QString> currentId;
	std::optional<PlaylistSource> currentSource;
	std::optional<PaginationCursor> batch;

	int indexOf(const QString &songId) const;
};

// 选择状态：上下文切换或退出选择模式时清空（clear-on-switch）
class SelectionState
{
public:
	SelectionContext context() const;
	bool isActive() const;
	bool isSelected(const QString &songId) const;
	int count() const;
	// 按选中顺序返回
	const QList<SongDescription> &selectedSongs() const;

	QList<AppEvent> update(const SelectionAction &action);
	QList<AppEvent> setMode(bool active);

private:
	SelectionContext currentContext = SelectionContext::Queue;
	bool active = false;
	QList<SongDescription> songs;
	QSet<QString> ids;

	bool clear();
};

struct AppState
{
	BrowserState browser;
	PlaybackState playback;
	SelectionState selection;

	// 对 Action 做穷尽匹配并返回产生的事件
	QList<AppEvent> update(const Action &action);
};

}
