// PlaylistModel：一个列表视图所需的能力集合（渲染、播放、菜单、选择）
#pragma once

#include <QString>

#include <optional>

#include "app_events.h"
#include "app_model.h"
#include "list_diff.h"
#include "song_actions.h"
#include "song_row.h"

namespace Harmony
{

class PlaylistModel
{
public:
	virtual ~PlaylistModel() = default;

	virtual std::optional<QString> currentSongId() const = 0;
	// 先把当前已知的整页设为播放队列，再加载指定歌曲
	virtual void playSong(const QString &id) = 0;

	// 不关心的事件或状态未加载时返回空
	virtual std::optional<ListDiff<SongRow>> diffForEvent(const AppEvent &event) = 0;
	// 视图挂载时的完整列表
	virtual std::optional<ListDiff<SongRow>> initialDiff() = 0;
	virtual bool autoscrollToPlaying() const = 0;

	// id 不在当前渲染列表中时返回空
	virtual std::optional<SongActionGroup> actionsFor(const QString &id) const = 0;
	virtual std::optional<SongMenu> menuFor(const QString &id) const = 0;

	virtual void selectSong(const QString &id) = 0;
	virtual void deselectSong(const QString &id) = 0;
	virtual bool enableSelection() = 0;
	// 仅当本列表拥有选择上下文时返回
	virtual std::optional<StateRef<SelectionState>> selection() const = 0;

	bool isSongSelected(const QString &id) const;
	void toggleSongSelection(const QString &id);
};

}
