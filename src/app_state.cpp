// AppState 归约实现：每个 Action 分支在这里被穷尽处理
#include "app_state.h"

#include "logger.h"

namespace Harmony
{

const HomeState *BrowserState::homeState() const
{
	return home ? &*home : nullptr;
}

const QList<ScreenName> &BrowserState::navigationStack() const
{
	return navigation;
}

QList<AppEvent> BrowserState::navigate(const ScreenName &screen)
{
	if (!navigation.isEmpty() && navigation.last() == screen)
		return {};
	navigation.append(screen);
	return {BrowserEvent{BrowserEvent::NavigationPushed{screen}}};
}

QList<AppEvent> BrowserState::update(const BrowserAction &action)
{
	return std::visit(
		overloaded{
			[this](const BrowserAction::SetSavedTracks &a) -> QList<AppEvent> {
				HomeState next;
				next.savedTracks = a.batch.songs;
				next.lastSavedTracksBatch = a.batch.batch;
				home = next;
				return {BrowserEvent{BrowserEvent::SavedTracksUpdated{}}};
			},
			[this](const BrowserAction::AppendSavedTracks &a) -> QList<AppEvent> {
				if (!home)
					home.emplace();
				const int startIndex = static_cast<int>(home->savedTracks.size());
				if (a.batch.batch.offset != startIndex)
					Logger::warning(QStringLiteral("Appending page at offset %1 to %2 saved tracks").arg(a.batch.batch.offset).arg(startIndex));
				home->savedTracks.append(a.batch.songs);
				home->lastSavedTracksBatch = a.batch.batch;
				home->lastError.reset();
				return {BrowserEvent{BrowserEvent::SavedTracksAppended{startIndex}}};
			},
			[this](const BrowserAction::SavedTracksFetchFailed &a) -> QList<AppEvent> {
				// 主动取消不算错误
				if (home && a.error.category != ErrorCategory::Cancelled)
					home->lastError = a.error;
				return {BrowserEvent{BrowserEvent::SavedTracksFetchFailed{a.offset, a.error}}};
			},
			[this](const BrowserAction::NavigationPush &a) -> QList<AppEvent> {
				return navigate(a.screen);
			},
			[this](const BrowserAction::NavigationPop &) -> QList<AppEvent> {
				// 根页面不可弹出
				if (navigation.size() <= 1)
					return {};
				navigation.removeLast();
				return {BrowserEvent{BrowserEvent::NavigationPopped{}}};
			},
		},
		action.value);
}

std::optional<QString> PlaybackState::currentSongId() const
{
	return currentId;
}

const SongDescription *PlaybackState::currentSong() const
{
	if (!currentId)
		return nullptr;
	const int index = indexOf(*currentId);
	return index >= 0 ? &songs.at(index) : nullptr;
}

const QList<SongDescription> &PlaybackState::queue() const
{
	return songs;
}

std::optional<PlaylistSource> PlaybackState::source() const
{
	return currentSource;
}

std::optional<PaginationCursor> PlaybackState::pagedBatch() const
{
	return batch;
}

int PlaybackState::indexOf(const QString &songId) const
{
	for (int i = 0; i < songs.size(); ++i)
	{
		if (songs.at(i).id == songId)
			return i;
	}
	return -1;
}

QList<AppEvent> PlaybackState::update(const PlaybackAction &action)
{
	return std::visit(
		overloaded{
			[this](const PlaybackAction::LoadPagedSongs &a) -> QList<AppEvent> {
				songs = a.batch.songs;
				currentSource = a.source;
				batch = a.batch.batch;
				if (currentId && indexOf(*currentId) < 0)
					currentId.reset();
				return {PlaybackEvent{PlaybackEvent::PlaylistChanged{}}};
			},
			[this](const PlaybackAction::Load &a) -> QList<AppEvent> {
				if (indexOf(a.songId) < 0)
				{
					Logger::warning(QStringLiteral("Load ignored, song %1 is not in the queue").arg(a.songId));
					return {};
				}
				currentId = a.songId;
				return {PlaybackEvent{PlaybackEvent::TrackChanged{a.songId}}};
			},
			[this](const PlaybackAction::QueueSongs &a) -> QList<AppEvent> {
				int added = 0;
				for (const SongDescription &song : a.songs)
				{
					if (indexOf(song.id) >= 0)
						continue;
					songs.append(song);
					++added;
				}
				if (added == 0)
					return {};
				return {PlaybackEvent{PlaybackEvent::PlaylistChanged{}}};
			},
			[this](const PlaybackAction::Stop &) -> QList<AppEvent> {
				if (!currentId)
					return {};
				currentId.reset();
				return {PlaybackEvent{PlaybackEvent::PlaybackStopped{}}};
			},
		},
		action.value);
}

SelectionContext SelectionState::context() const
{
	return currentContext;
}

bool SelectionState::isActive() const
{
	return active;
}

bool SelectionState::isSelected(const QString &songId) const
{
	return ids.contains(songId);
}

int SelectionState::count() const
{
	return static_cast<int>(songs.size());
}

const QList<SongDescription> &SelectionState::selectedSongs() const
{
	return songs;
}

bool SelectionState::clear()
{
	if (songs.isEmpty())
		return false;
	songs.clear();
	ids.clear();
	return true;
}

QList<AppEvent> SelectionState::setMode(bool enable)
{
	if (active == enable)
		return {};
	active = enable;
	QList<AppEvent> events{SelectionEvent{SelectionEvent::SelectionModeChanged{enable}}};
	if (!enable && clear())
		events.append(SelectionEvent{SelectionEvent::SelectionChanged{}});
	return events;
}

QList<AppEvent> SelectionState::update(const SelectionAction &action)
{
	return std::visit(
		overloaded{
			[this](const SelectionAction::Select &a) -> QList<AppEvent> {
				bool changed = false;
				for (const SongDescription &song : a.songs)
				{
					if (ids.contains(song.id))
						continue;
					ids.insert(song.id);
					songs.append(song);
					changed = true;
				}
				if (!changed)
					return {};
				return {SelectionEvent{SelectionEvent::SelectionChanged{}}};
			},
			[this](const SelectionAction::Deselect &a) -> QList<AppEvent> {
				bool changed = false;
				for (const QString &id : a.ids)
				{
					if (!ids.remove(id))
						continue;
					changed = true;
					for (int i = 0; i < songs.size(); ++i)
					{
						if (songs.at(i).id == id)
						{
							songs.removeAt(i);
							break;
						}
					}
				}
				if (!changed)
					return {};
				return {SelectionEvent{SelectionEvent::SelectionChanged{}}};
			},
			[this](const SelectionAction::Clear &) -> QList<AppEvent> {
				if (!clear())
					return {};
				return {SelectionEvent{SelectionEvent::SelectionChanged{}}};
			},
			[this](const SelectionAction::ChangeContext &a) -> QList<AppEvent> {
				if (currentContext == a.context)
					return {};
				currentContext = a.context;
				QList<AppEvent> events{SelectionEvent{SelectionEvent::SelectionContextChanged{a.context}}};
				if (clear())
					events.append(SelectionEvent{SelectionEvent::SelectionChanged{}});
				return events;
			},
		},
		action.value);
}

QList<AppEvent> AppState::update(const Action &action)
{
	return std::visit(
		overloaded{
			[this](const BrowserAction &a) { return browser.update(a); },
			[this](const PlaybackAction &a) { return playback.update(a); },
			[this](const SelectionAction &a) { return selection.update(a); },
			[this](const AppAction &a) {
				return std::visit(
					overloaded{
						[this](const AppAction::ChangeSelectionMode &m) { return selection.setMode(m.active); },
						[this](const AppAction::ViewAlbum &v) { return browser.navigate(ScreenName{ScreenName::Kind::Album, v.albumId}); },
						[this](const AppAction::ViewArtist &v) { return browser.navigate(ScreenName{ScreenName::Kind::Artist, v.artistId}); },
						[](const AppAction::CopyLink &c) { return QList<AppEvent>{NoticeEvent{NoticeEvent::LinkCopied{c.url}}}; },
						[](const AppAction::FetchFailed &f) {
							Logger::warning(QStringLiteral("Fetch failed: %1").arg(f.error.toString()));
							return QList<AppEvent>{NoticeEvent{NoticeEvent::ErrorReported{f.error}}};
						},
					},
					a.value);
			},
		},
		action);
}

}
