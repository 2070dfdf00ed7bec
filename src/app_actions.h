// 动作定义：对 AppState 的唯一修改途径
#pragma once

#include <QList>
#include <QString>
#include <QStringList>

#include <optional>
#include <variant>

#include "core_types.h"

namespace Harmony
{

// 选择状态所属上下文；同一时刻只有一个上下文的选择是有效的
enum class SelectionContext
{
	Default,
	Queue,
	SavedTracks,
	Playlist
};

// 播放队列的来源，用于“正在播放：xxx”的展示
struct PlaylistSource
{
	enum class Kind
	{
		SavedTracks,
		Playlist,
		Album
	};

	Kind kind = Kind::SavedTracks;
	QString id;

	static PlaylistSource savedTracks() { return PlaylistSource{Kind::SavedTracks, QString()}; }

	bool operator==(const PlaylistSource &other) const { return kind == other.kind && id == other.id; }
};

// 浏览器导航栈中的一个页面
struct ScreenName
{
	enum class Kind
	{
		Home,
		Album,
		Artist
	};

	Kind kind = Kind::Home;
	QString id;

	bool operator==(const ScreenName &other) const { return kind == other.kind && id == other.id; }
};

struct BrowserAction
{
	// 整体替换收藏歌曲（首次加载或刷新）
	struct SetSavedTracks
	{
		SongBatch batch;
	};
	// 追加一页收藏歌曲；不做去重，重复派发会重复追加
	struct AppendSavedTracks
	{
		SongBatch batch;
	};
	// 某一页拉取失败，分页状态保持不变
	struct SavedTracksFetchFailed
	{
		int offset = 0;
		Error error;
	};
	struct NavigationPush
	{
		ScreenName screen;
	};
	struct NavigationPop
	{
	};

	using Variant = std::variant<SetSavedTracks, AppendSavedTracks, SavedTracksFetchFailed, NavigationPush, NavigationPop>;
	Variant value;
};

struct PlaybackAction
{
	// 以一整页歌曲作为播放队列，并记录其来源
	struct LoadPagedSongs
	{
		std::optional<PlaylistSource> source;
		SongBatch batch;
	};
	// 播放队列中的指定歌曲
	struct Load
	{
		QString songId;
	};
	// 追加到播放队列末尾，已在队列中的歌曲会被跳过
	struct QueueSongs
	{
		QList<SongDescription> songs;
	};
	struct Stop
	{
	};

	using Variant = std::variant<LoadPagedSongs, Load, QueueSongs, Stop>;
	Variant value;
};

struct SelectionAction
{
	struct Select
	{
		QList<SongDescription> songs;
	};
	struct Deselect
	{
		QStringList ids;
	};
	struct Clear
	{
	};
	// 切换上下文时清空已有选择
	struct ChangeContext
	{
		SelectionContext context = SelectionContext::Default;
	};

	using Variant = std::variant<Select, Deselect, Clear, ChangeContext>;
	Variant value;
};

struct AppAction
{
	struct ChangeSelectionMode
	{
		bool active = false;
	};
	struct ViewAlbum
	{
		QString albumId;
	};
	struct ViewArtist
	{
		QString artistId;
	};
	struct CopyLink
	{
		QString url;
	};
	// 通用的异步请求失败
	struct FetchFailed
	{
		Error error;
	};

	using Variant = std::variant<ChangeSelectionMode, ViewAlbum, ViewArtist, CopyLink, FetchFailed>;
	Variant value;
};

using Action = std::variant<BrowserAction, PlaybackAction, SelectionAction, AppAction>;

// 调试日志用的简短名称，例如 "Browser.AppendSavedTracks"
QString actionName(const Action &action);

}
