// SavedTracksModel 实现
#include "saved_tracks_model.h"

#include <utility>

#include "logger.h"

namespace Harmony
{

SavedTracksModel::SavedTracksModel(QSharedPointer<AppModel> app, std::unique_ptr<ActionDispatcher> dispatcher, int pageSize)
	: m_app(std::move(app))
	, m_dispatcher(std::move(dispatcher))
	, m_pageSize(pageSize > 0 ? pageSize : 50)
{
}

SavedTracksModel::~SavedTracksModel()
{
	// 视图销毁时取消仍在路上的页请求，底层 HTTP 请求随之中止
	if (m_pendingOffset && !m_inflight.isFinished())
	{
		Logger::debug(QStringLiteral("Cancelling saved tracks page at %1").arg(*m_pendingOffset));
		m_inflight.cancel();
	}
}

std::optional<StateRef<HomeState>> SavedTracksModel::homeState() const
{
	return m_app->mapReadOpt<HomeState>([](const AppState &state) { return state.browser.homeState(); });
}

std::optional<QList<SongRow>> SavedTracksModel::rows() const
{
	const auto home = homeState();
	if (!home)
		return std::nullopt;
	QList<SongRow> result;
	const QList<SongDescription> &songs = (*home)->savedTracks;
	result.reserve(songs.size());
	for (int i = 0; i < songs.size(); ++i)
		result.append(SongRow::fromSong(songs.at(i), i + 1));
	return result;
}

std::optional<SongDescription> SavedTracksModel::findSong(const QString &id) const
{
	const auto home = homeState();
	if (!home)
		return std::nullopt;
	for (const SongDescription &song : (*home)->savedTracks)
	{
		if (song.id == id)
			return song;
	}
	return std::nullopt;
}

bool SavedTracksModel::isLoading() const
{
	return m_pendingOffset.has_value();
}

bool SavedTracksModel::loadInitial()
{
	return requestPage(0, true);
}

bool SavedTracksModel::loadMore()
{
	std::optional<PaginationCursor> next;
	{
		const auto home = homeState();
		if (!home)
			return false;
		next = (*home)->lastSavedTracksBatch.next();
	}
	if (!next)
		return false;
	return requestPage(next->offset, false);
}

// 同一时刻只允许一个页请求；结果或失败都经派发器回到状态树
bool SavedTracksModel::requestPage(int offset, bool replace)
{
	if (m_pendingOffset)
	{
		Logger::debug(QStringLiteral("Saved tracks page at %1 already requested").arg(*m_pendingOffset));
		return false;
	}
	QSharedPointer<IMusicClient> client = m_app->musicClient();
	if (!client)
	{
		Logger::warning(QStringLiteral("No music client, cannot fetch saved tracks"));
		return false;
	}
	m_pendingOffset = offset;
	const int limit = m_pageSize;
	Logger::debug(QStringLiteral("Fetching saved tracks offset=%1 limit=%2").arg(offset).arg(limit));
	const QFuture<Result<SongBatch>> page = client->savedTracksPage(offset, limit);
	m_inflight = page;
	m_dispatcher->callAndDispatch([page, offset, replace]() -> ActionFuture {
		QFuture<Result<SongBatch>> pending = page;
		return pending
			.then([offset, replace](Result<SongBatch> result) -> Result<Action> {
				// 失败也作为动作派发，分页状态保持不变
				if (!result.ok)
					return Result<Action>::success(BrowserAction{BrowserAction::SavedTracksFetchFailed{offset, result.error}});
				if (replace)
					return Result<Action>::success(BrowserAction{BrowserAction::SetSavedTracks{result.value}});
				return Result<Action>::success(BrowserAction{BrowserAction::AppendSavedTracks{result.value}});
			})
			.onCanceled([offset]() -> Result<Action> {
				// 被取消的页同样要结束加载状态，否则该视图无法再翻页
				return Result<Action>::success(BrowserAction{BrowserAction::SavedTracksFetchFailed{
					offset, makeError(ErrorCategory::Cancelled, -2, QStringLiteral("Saved tracks request cancelled"))}});
			});
	});
	return true;
}

std::optional<QString> SavedTracksModel::currentSongId() const
{
	return m_app->read()->playback.currentSongId();
}

// 先用整张列表替换播放队列，再播放指定歌曲
void SavedTracksModel::playSong(const QString &id)
{
	std::optional<SongBatch> batch;
	{
		const auto home = homeState();
		if (home)
			batch = SongBatch{(*home)->lastSavedTracksBatch, (*home)->savedTracks};
	}
	if (batch)
		m_dispatcher->dispatch(PlaybackAction{PlaybackAction::LoadPagedSongs{PlaylistSource::savedTracks(), *batch}});
	m_dispatcher->dispatch(PlaybackAction{PlaybackAction::Load{id}});
}

// 只关心收藏歌曲相关事件；收到页结果时结束加载状态
std::optional<ListDiff<SongRow>> SavedTracksModel::diffForEvent(const AppEvent &event)
{
	const BrowserEvent *browser = std::get_if<BrowserEvent>(&event);
	if (!browser)
		return std::nullopt;
	return std::visit(
		overloaded{
			[this](const BrowserEvent::SavedTracksAppended &e) -> std::optional<ListDiff<SongRow>> {
				m_pendingOffset.reset();
				const auto all = rows();
				if (!all)
					return std::nullopt;
				return m_diff.append(e.startIndex, *all);
			},
			[this](const BrowserEvent::SavedTracksUpdated &) -> std::optional<ListDiff<SongRow>> {
				m_pendingOffset.reset();
				const auto all = rows();
				if (!all)
					return std::nullopt;
				return m_diff.reset(*all);
			},
			[this](const BrowserEvent::SavedTracksFetchFailed &) -> std::optional<ListDiff<SongRow>> {
				m_pendingOffset.reset();
				return std::nullopt;
			},
			[](const auto &) -> std::optional<ListDiff<SongRow>> { return std::nullopt; },
		},
		browser->value);
}

std::optional<ListDiff<SongRow>> SavedTracksModel::initialDiff()
{
	const auto all = rows();
	if (!all)
		return std::nullopt;
	return m_diff.reset(*all);
}

bool SavedTracksModel::autoscrollToPlaying() const
{
	return true;
}

std::optional<SongActionGroup> SavedTracksModel::actionsFor(const QString &id) const
{
	const auto song = findSong(id);
	if (!song)
		return std::nullopt;
	return makeSongActionGroup(*song, *m_dispatcher);
}

std::optional<SongMenu> SavedTracksModel::menuFor(const QString &id) const
{
	const auto song = findSong(id);
	if (!song)
		return std::nullopt;
	return makeSongMenu(*song);
}

void SavedTracksModel::selectSong(const QString &id)
{
	const auto song = findSong(id);
	if (!song)
	{
		Logger::debug(QStringLiteral("Select ignored, song %1 is not rendered").arg(id));
		return;
	}
	m_dispatcher->dispatch(SelectionAction{SelectionAction::Select{{*song}}});
}

void SavedTracksModel::deselectSong(const QString &id)
{
	m_dispatcher->dispatch(SelectionAction{SelectionAction::Deselect{{id}}});
}

bool SavedTracksModel::enableSelection()
{
	m_dispatcher->dispatch(AppAction{AppAction::ChangeSelectionMode{true}});
	return true;
}

std::optional<StateRef<SelectionState>> SavedTracksModel::selection() const
{
	return m_app->mapReadOpt<SelectionState>([](const AppState &state) -> const SelectionState * {
		if (state.selection.context() != SelectionContext::Queue)
			return nullptr;
		return &state.selection;
	});
}

ActionDispatcher &SavedTracksModel::dispatcher() const
{
	return *m_dispatcher;
}

QList<SelectionTool> SavedTracksModel::toolsVisible(const SelectionState &) const
{
	return {SelectionTool{SelectionTool::Kind::SelectAll}};
}

void SavedTracksModel::handleToolActivated(const SelectionState &selection, const SelectionTool &tool)
{
	if (tool.kind != SelectionTool::Kind::SelectAll)
	{
		defaultHandleToolActivated(selection, tool);
		return;
	}
	QList<SongDescription> songs;
	{
		const auto home = homeState();
		if (home)
			songs = (*home)->savedTracks;
	}
	handleSelectAllTool(selection, songs);
}

}
