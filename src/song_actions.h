// 单曲的上下文动作与菜单描述，由 UI 层物化为真实的菜单和 QAction
#pragma once

#include <QList>
#include <QString>
#include <QStringList>

#include <functional>
#include <memory>
#include <optional>

#include "action_dispatcher.h"
#include "core_types.h"

namespace Harmony
{

struct SongAction
{
	QString name;
	QString label;
	std::function<void()> activate;
};

// 动作组，菜单项通过 "<prefix>.<name>" 引用其中的动作
class SongActionGroup
{
public:
	static constexpr const char *Prefix = "song";

	void add(SongAction action);
	const QList<SongAction> &actions() const;
	const SongAction *find(const QString &name) const;
	// 名称不存在时返回 false
	bool trigger(const QString &name) const;
	QStringList names() const;

private:
	QList<SongAction> m_actions;
};

struct SongMenu
{
	struct Item
	{
		QString label;
		// 形如 "song.view_album"
		QString action;
	};

	QList<Item> items;
};

// 每个动作持有自己的派发句柄
QList<SongAction> makeArtistActions(const SongDescription &song, const ActionDispatcher &dispatcher);
SongAction makeAlbumAction(const SongDescription &song, const ActionDispatcher &dispatcher);
SongAction makeLinkAction(const SongDescription &song, const ActionDispatcher &dispatcher);

SongActionGroup makeSongActionGroup(const SongDescription &song, const ActionDispatcher &dispatcher);
SongMenu makeSongMenu(const SongDescription &song);

}
