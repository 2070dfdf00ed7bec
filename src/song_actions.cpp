// 单曲动作与菜单构建
#include "song_actions.h"

#include <utility>

#include "labels.h"

namespace Harmony
{

namespace
{

SongAction makeDispatchingAction(const QString &name, const QString &label, const ActionDispatcher &dispatcher, const Action &action)
{
	std::shared_ptr<ActionDispatcher> handle(dispatcher.boxClone());
	SongAction result;
	result.name = name;
	result.label = label;
	result.activate = [handle, action]() { handle->dispatch(action); };
	return result;
}

QString qualified(const QString &name)
{
	return QStringLiteral("%1.%2").arg(QLatin1String(SongActionGroup::Prefix), name);
}

QString artistActionName(const Artist &artist)
{
	return QStringLiteral("view_artist_%1").arg(artist.id);
}

}

void SongActionGroup::add(SongAction action)
{
	m_actions.append(std::move(action));
}

const QList<SongAction> &SongActionGroup::actions() const
{
	return m_actions;
}

const SongAction *SongActionGroup::find(const QString &name) const
{
	for (const SongAction &action : m_actions)
	{
		if (action.name == name)
			return &action;
	}
	return nullptr;
}

bool SongActionGroup::trigger(const QString &name) const
{
	const SongAction *action = find(name);
	if (!action || !action->activate)
		return false;
	action->activate();
	return true;
}

QStringList SongActionGroup::names() const
{
	QStringList result;
	for (const SongAction &action : m_actions)
		result.append(action.name);
	return result;
}

QList<SongAction> makeArtistActions(const SongDescription &song, const ActionDispatcher &dispatcher)
{
	QList<SongAction> result;
	for (const Artist &artist : song.artists)
	{
		result.append(makeDispatchingAction(artistActionName(artist),
											Labels::moreFromArtist(artist.name.toHtmlEscaped()),
											dispatcher,
											AppAction{AppAction::ViewArtist{artist.id}}));
	}
	return result;
}

SongAction makeAlbumAction(const SongDescription &song, const ActionDispatcher &dispatcher)
{
	return makeDispatchingAction(QStringLiteral("view_album"), Labels::viewAlbum(), dispatcher, AppAction{AppAction::ViewAlbum{song.album.id}});
}

SongAction makeLinkAction(const SongDescription &song, const ActionDispatcher &dispatcher)
{
	return makeDispatchingAction(QStringLiteral("copy_link"), Labels::copyLink(), dispatcher, AppAction{AppAction::CopyLink{song.link()}});
}

SongActionGroup makeSongActionGroup(const SongDescription &song, const ActionDispatcher &dispatcher)
{
	SongActionGroup group;
	for (SongAction &action : makeArtistActions(song, dispatcher))
		group.add(std::move(action));
	group.add(makeAlbumAction(song, dispatcher));
	group.add(makeLinkAction(song, dispatcher));
	return group;
}

SongMenu makeSongMenu(const SongDescription &song)
{
	SongMenu menu;
	menu.items.append({Labels::viewAlbum(), qualified(QStringLiteral("view_album"))});
	// 艺术家名会进入富文本菜单，需要转义
	for (const Artist &artist : song.artists)
		menu.items.append({Labels::moreFromArtist(artist.name.toHtmlEscaped()), qualified(artistActionName(artist))});
	menu.items.append({Labels::copyLink(), qualified(QStringLiteral("copy_link"))});
	return menu;
}

}
