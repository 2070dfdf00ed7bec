#include "saved_tracks_model.h"

#include <gtest/gtest.h>

#include <memory>

#include "app_controller.h"
#include "test_helpers.h"

namespace Harmony
{
namespace
{

using Testing::actionAs;
using Testing::makeBatch;
using Testing::makeSong;
using Testing::makeSongs;
using Testing::RecordingDispatcher;
using Testing::songIds;
using Testing::waitUntil;

// 直接修改状态、只记录派发动作的视图模型
class SavedTracksModelTest : public ::testing::Test
{
protected:
	QSharedPointer<AppModel> app = QSharedPointer<AppModel>::create(QSharedPointer<IMusicClient>(
		QSharedPointer<Testing::FakeMusicClient>::create(makeSongs({"A", "B", "C", "D", "E"}))));
	RecordingDispatcher recorder;
	SavedTracksModel model{app, recorder.boxClone(), 3};

	const SongBatch firstPage = makeBatch(0, 3, 5, makeSongs({"A", "B", "C"}));
	const SongBatch secondPage = makeBatch(3, 3, 5, makeSongs({"D", "E"}));

	void loadPages()
	{
		app->update(BrowserAction{BrowserAction::AppendSavedTracks{firstPage}});
		app->update(BrowserAction{BrowserAction::AppendSavedTracks{secondPage}});
	}

	const QList<Action> &log() const { return *recorder.log; }
};

TEST_F(SavedTracksModelTest, AbsentStateGivesNothing)
{
	EXPECT_FALSE(model.homeState().has_value());
	EXPECT_FALSE(model.rows().has_value());
	EXPECT_FALSE(model.initialDiff().has_value());
	EXPECT_FALSE(model.diffForEvent(BrowserEvent{BrowserEvent::SavedTracksAppended{0}}).has_value());
	EXPECT_FALSE(model.actionsFor(QStringLiteral("A")).has_value());
	EXPECT_FALSE(model.menuFor(QStringLiteral("A")).has_value());
	EXPECT_FALSE(model.loadMore());
	EXPECT_FALSE(model.currentSongId().has_value());
	EXPECT_TRUE(model.autoscrollToPlaying());
}

TEST_F(SavedTracksModelTest, AppendedEventYieldsOnlyNewRows)
{
	app->update(BrowserAction{BrowserAction::AppendSavedTracks{firstPage}});
	const auto initial = model.initialDiff();
	ASSERT_TRUE(initial.has_value());
	EXPECT_EQ(initial->kind, ListDiff<SongRow>::Kind::Reset);
	EXPECT_EQ(initial->items.size(), 3);

	const QList<AppEvent> events = app->update(BrowserAction{BrowserAction::AppendSavedTracks{secondPage}});
	ASSERT_EQ(events.size(), 1);
	const auto diff = model.diffForEvent(events.first());
	ASSERT_TRUE(diff.has_value());
	EXPECT_EQ(diff->kind, ListDiff<SongRow>::Kind::Append);
	ASSERT_EQ(diff->items.size(), 2);
	EXPECT_EQ(diff->items.at(0).id, QStringLiteral("D"));
	EXPECT_EQ(diff->items.at(0).index, 4);
	EXPECT_EQ(diff->items.at(1).id, QStringLiteral("E"));
}

TEST_F(SavedTracksModelTest, WrongStartIndexResetsWholeList)
{
	loadPages();
	ASSERT_TRUE(model.initialDiff().has_value());

	const auto diff = model.diffForEvent(BrowserEvent{BrowserEvent::SavedTracksAppended{3}});
	ASSERT_TRUE(diff.has_value());
	EXPECT_EQ(diff->kind, ListDiff<SongRow>::Kind::Reset);
	EXPECT_EQ(diff->items.size(), 5);
}

TEST_F(SavedTracksModelTest, UnrelatedEventsGiveNoDiff)
{
	loadPages();
	EXPECT_FALSE(model.diffForEvent(PlaybackEvent{PlaybackEvent::PlaylistChanged{}}).has_value());
	EXPECT_FALSE(model.diffForEvent(SelectionEvent{SelectionEvent::SelectionChanged{}}).has_value());
	EXPECT_FALSE(model.diffForEvent(BrowserEvent{BrowserEvent::NavigationPopped{}}).has_value());
}

TEST_F(SavedTracksModelTest, PlayLoadsWholeListThenTrack)
{
	loadPages();
	model.playSong(QStringLiteral("B"));

	ASSERT_EQ(log().size(), 2);
	const auto *queue = actionAs<PlaybackAction, PlaybackAction::LoadPagedSongs>(log().at(0));
	ASSERT_NE(queue, nullptr);
	EXPECT_EQ(queue->source, PlaylistSource::savedTracks());
	EXPECT_EQ(songIds(queue->batch.songs), QStringList({"A", "B", "C", "D", "E"}));
	EXPECT_EQ(queue->batch.batch, secondPage.batch);

	const auto *load = actionAs<PlaybackAction, PlaybackAction::Load>(log().at(1));
	ASSERT_NE(load, nullptr);
	EXPECT_EQ(load->songId, QStringLiteral("B"));
	EXPECT_FALSE(app->isBorrowed());
}

TEST_F(SavedTracksModelTest, CurrentSongFollowsPlayback)
{
	loadPages();
	app->update(PlaybackAction{PlaybackAction::LoadPagedSongs{PlaylistSource::savedTracks(), makeBatch(3, 3, 5, makeSongs({"A", "B"}))}});
	app->update(PlaybackAction{PlaybackAction::Load{QStringLiteral("B")}});
	EXPECT_EQ(model.currentSongId(), QStringLiteral("B"));
}

TEST_F(SavedTracksModelTest, SelectingUnknownSongDispatchesNothing)
{
	loadPages();
	model.selectSong(QStringLiteral("X"));
	EXPECT_TRUE(log().isEmpty());

	model.selectSong(QStringLiteral("C"));
	ASSERT_EQ(log().size(), 1);
	const auto *select = actionAs<SelectionAction, SelectionAction::Select>(log().first());
	ASSERT_NE(select, nullptr);
	EXPECT_EQ(songIds(select->songs), QStringList({"C"}));
	EXPECT_EQ(select->songs.first().title, QStringLiteral("Song C"));

	model.deselectSong(QStringLiteral("C"));
	const auto *deselect = actionAs<SelectionAction, SelectionAction::Deselect>(log().last());
	ASSERT_NE(deselect, nullptr);
	EXPECT_EQ(deselect->ids, QStringList({"C"}));
}

TEST_F(SavedTracksModelTest, EnableSelectionTurnsModeOn)
{
	EXPECT_TRUE(model.enableSelection());
	ASSERT_EQ(log().size(), 1);
	const auto *mode = actionAs<AppAction, AppAction::ChangeSelectionMode>(log().first());
	ASSERT_NE(mode, nullptr);
	EXPECT_TRUE(mode->active);
}

TEST_F(SavedTracksModelTest, SelectionVisibleOnlyInQueueContext)
{
	loadPages();
	app->update(SelectionAction{SelectionAction::Select{makeSongs({"A"})}});
	{
		const auto selection = model.selection();
		ASSERT_TRUE(selection.has_value());
		EXPECT_EQ((*selection)->count(), 1);
	}
	EXPECT_TRUE(model.isSongSelected(QStringLiteral("A")));

	app->update(SelectionAction{SelectionAction::ChangeContext{SelectionContext::Playlist}});
	EXPECT_FALSE(model.selection().has_value());
	EXPECT_FALSE(model.isSongSelected(QStringLiteral("A")));

	app->update(SelectionAction{SelectionAction::ChangeContext{SelectionContext::Queue}});
	const auto back = model.selection();
	ASSERT_TRUE(back.has_value());
	EXPECT_EQ((*back)->count(), 0);
}

TEST_F(SavedTracksModelTest, BothInterfacesSeeTheSameSelection)
{
	PlaylistModel &playlist = model;
	SelectionToolsModel &tools = model;
	const auto a = playlist.selection();
	const auto b = tools.selection();
	ASSERT_TRUE(a.has_value());
	ASSERT_TRUE(b.has_value());
	EXPECT_EQ(a->get(), b->get());
}

TEST_F(SavedTracksModelTest, ToggleSelection)
{
	loadPages();
	model.toggleSongSelection(QStringLiteral("A"));
	ASSERT_NE((actionAs<SelectionAction, SelectionAction::Select>(log().last())), nullptr);

	app->update(SelectionAction{SelectionAction::Select{makeSongs({"A"})}});
	model.toggleSongSelection(QStringLiteral("A"));
	ASSERT_NE((actionAs<SelectionAction, SelectionAction::Deselect>(log().last())), nullptr);
}

TEST_F(SavedTracksModelTest, OnlySelectAllToolIsVisible)
{
	const auto selection = model.selection();
	ASSERT_TRUE(selection.has_value());
	const QList<SelectionTool> tools = model.toolsVisible(**selection);
	ASSERT_EQ(tools.size(), 1);
	EXPECT_EQ(tools.first().kind, SelectionTool::Kind::SelectAll);
	EXPECT_EQ(tools.first().label(), QStringLiteral("Select all"));
}

TEST_F(SavedTracksModelTest, SelectAllTogglesEverySong)
{
	loadPages();
	{
		const auto selection = model.selection();
		model.handleToolActivated(**selection, SelectionTool{SelectionTool::Kind::SelectAll});
	}
	ASSERT_EQ(log().size(), 1);
	const auto *select = actionAs<SelectionAction, SelectionAction::Select>(log().first());
	ASSERT_NE(select, nullptr);
	EXPECT_EQ(select->songs.size(), 5);

	app->update(log().first());
	{
		const auto selection = model.selection();
		model.handleToolActivated(**selection, SelectionTool{SelectionTool::Kind::SelectAll});
	}
	const auto *deselect = actionAs<SelectionAction, SelectionAction::Deselect>(log().last());
	ASSERT_NE(deselect, nullptr);
	EXPECT_EQ(deselect->ids, QStringList({"A", "B", "C", "D", "E"}));
}

TEST_F(SavedTracksModelTest, AddToQueueQueuesSelectionAndLeavesSelectionMode)
{
	loadPages();
	app->update(AppAction{AppAction::ChangeSelectionMode{true}});
	app->update(SelectionAction{SelectionAction::Select{makeSongs({"B", "D"})}});
	{
		const auto selection = model.selection();
		model.handleToolActivated(**selection, SelectionTool{SelectionTool::Kind::AddToQueue});
	}
	ASSERT_EQ(log().size(), 2);
	const auto *queue = actionAs<PlaybackAction, PlaybackAction::QueueSongs>(log().at(0));
	ASSERT_NE(queue, nullptr);
	EXPECT_EQ(songIds(queue->songs), QStringList({"B", "D"}));
	const auto *mode = actionAs<AppAction, AppAction::ChangeSelectionMode>(log().at(1));
	ASSERT_NE(mode, nullptr);
	EXPECT_FALSE(mode->active);
}

TEST_F(SavedTracksModelTest, ClearSelectionTool)
{
	{
		const auto selection = model.selection();
		model.handleToolActivated(**selection, SelectionTool{SelectionTool::Kind::ClearSelection});
	}
	ASSERT_EQ(log().size(), 1);
	EXPECT_NE((actionAs<SelectionAction, SelectionAction::Clear>(log().first())), nullptr);
}

TEST_F(SavedTracksModelTest, ActionsForSongDispatchThroughOwnHandles)
{
	loadPages();
	const auto actions = model.actionsFor(QStringLiteral("B"));
	ASSERT_TRUE(actions.has_value());
	EXPECT_EQ(actions->names(), QStringList({"view_artist_ar-B", "view_album", "copy_link"}));
	EXPECT_FALSE(model.actionsFor(QStringLiteral("X")).has_value());

	EXPECT_TRUE(actions->trigger(QStringLiteral("view_album")));
	const auto *album = actionAs<AppAction, AppAction::ViewAlbum>(log().last());
	ASSERT_NE(album, nullptr);
	EXPECT_EQ(album->albumId, QStringLiteral("al-B"));

	EXPECT_TRUE(actions->trigger(QStringLiteral("view_artist_ar-B")));
	const auto *artist = actionAs<AppAction, AppAction::ViewArtist>(log().last());
	ASSERT_NE(artist, nullptr);
	EXPECT_EQ(artist->artistId, QStringLiteral("ar-B"));

	EXPECT_TRUE(actions->trigger(QStringLiteral("copy_link")));
	const auto *link = actionAs<AppAction, AppAction::CopyLink>(log().last());
	ASSERT_NE(link, nullptr);
	EXPECT_EQ(link->url, QStringLiteral("https://music.163.com/#/song?id=B"));

	EXPECT_FALSE(actions->trigger(QStringLiteral("missing")));
}

TEST_F(SavedTracksModelTest, MenuEscapesArtistNames)
{
	app->update(BrowserAction{BrowserAction::AppendSavedTracks{makeBatch(
		0, 3, std::nullopt,
		{makeSong(QStringLiteral("S"), {Artist{QStringLiteral("1"), QStringLiteral("Tom & Jerry")}, Artist{QStringLiteral("2"), QStringLiteral("<b>")}})})}});

	const auto menu = model.menuFor(QStringLiteral("S"));
	ASSERT_TRUE(menu.has_value());
	ASSERT_EQ(menu->items.size(), 4);
	EXPECT_EQ(menu->items.at(0).label, QStringLiteral("View album"));
	EXPECT_EQ(menu->items.at(0).action, QStringLiteral("song.view_album"));
	EXPECT_EQ(menu->items.at(1).label, QStringLiteral("More from Tom &amp; Jerry"));
	EXPECT_EQ(menu->items.at(1).action, QStringLiteral("song.view_artist_1"));
	EXPECT_EQ(menu->items.at(2).label, QStringLiteral("More from &lt;b&gt;"));
	EXPECT_EQ(menu->items.at(3).action, QStringLiteral("song.copy_link"));
}

TEST_F(SavedTracksModelTest, LoadMoreIsNotIssuedTwiceForTheSamePage)
{
	app->update(BrowserAction{BrowserAction::AppendSavedTracks{firstPage}});
	EXPECT_TRUE(model.loadMore());
	EXPECT_TRUE(model.isLoading());
	EXPECT_FALSE(model.loadMore());
	EXPECT_EQ(recorder.futures->size(), 1);

	model.diffForEvent(BrowserEvent{BrowserEvent::SavedTracksFetchFailed{3, makeError(ErrorCategory::Network, 1, QStringLiteral("x"))}});
	EXPECT_FALSE(model.isLoading());
	EXPECT_TRUE(model.loadMore());
	EXPECT_EQ(recorder.futures->size(), 2);
}

TEST_F(SavedTracksModelTest, LoadMoreFetchResultIsAnAppendAction)
{
	app->update(BrowserAction{BrowserAction::AppendSavedTracks{firstPage}});
	ASSERT_TRUE(model.loadMore());
	ASSERT_EQ(recorder.futures->size(), 1);

	ActionFuture future = recorder.futures->first();
	ASSERT_TRUE(waitUntil([&future]() { return future.isFinished(); }));
	const Result<Action> result = future.result();
	ASSERT_TRUE(result.ok);
	const auto *append = actionAs<BrowserAction, BrowserAction::AppendSavedTracks>(result.value);
	ASSERT_NE(append, nullptr);
	EXPECT_EQ(songIds(append->batch.songs), QStringList({"D", "E"}));
	EXPECT_EQ(append->batch.batch.offset, 3);
}

// 通过真实派发循环驱动分页
class SavedTracksPagingTest : public ::testing::Test
{
protected:
	QSharedPointer<Testing::FakeMusicClient> client = QSharedPointer<Testing::FakeMusicClient>::create(makeSongs({"A", "B", "C", "D", "E"}));
	QSharedPointer<AppModel> app = QSharedPointer<AppModel>::create(client);
	AppController controller{app};
	SavedTracksModel model{app, controller.dispatcher(), 3};
	QList<ListDiff<SongRow>> diffs;
	QList<AppEvent> events;

	void SetUp() override
	{
		controller.subscribe([this](const AppEvent &event) {
			events.append(event);
			if (auto diff = model.diffForEvent(event))
				diffs.append(*diff);
		});
	}

	QStringList savedIds() const
	{
		const auto home = model.homeState();
		return home ? songIds((*home)->savedTracks) : QStringList();
	}

	bool cancelledFailureSeen(int offset) const
	{
		for (const AppEvent &event : events)
		{
			const auto *failed = eventAs<BrowserEvent, BrowserEvent::SavedTracksFetchFailed>(event);
			if (failed && failed->offset == offset && failed->error.category == ErrorCategory::Cancelled)
				return true;
		}
		return false;
	}
};

TEST_F(SavedTracksPagingTest, LoadMoreAppendsShortLastPage)
{
	ASSERT_TRUE(model.loadInitial());
	ASSERT_TRUE(waitUntil([this]() { return savedIds().size() == 3; }));
	ASSERT_EQ(diffs.size(), 1);
	EXPECT_EQ(diffs.last().kind, ListDiff<SongRow>::Kind::Reset);

	ASSERT_TRUE(model.loadMore());
	ASSERT_TRUE(waitUntil([this]() { return savedIds().size() == 5; }));

	ASSERT_EQ(client->requests.size(), 2);
	EXPECT_EQ(client->requests.at(1), qMakePair(3, 3));
	EXPECT_EQ(savedIds(), QStringList({"A", "B", "C", "D", "E"}));
	ASSERT_EQ(diffs.size(), 2);
	EXPECT_EQ(diffs.last().kind, ListDiff<SongRow>::Kind::Append);
	EXPECT_EQ(diffs.last().items.size(), 2);
	{
		const auto home = model.homeState();
		EXPECT_FALSE((*home)->lastSavedTracksBatch.next().has_value());
	}
	EXPECT_FALSE(model.loadMore());
}

TEST_F(SavedTracksPagingTest, FailedPageKeepsPagination)
{
	ASSERT_TRUE(model.loadInitial());
	ASSERT_TRUE(waitUntil([this]() { return savedIds().size() == 3; }));

	client->nextError = makeError(ErrorCategory::Network, 99, QStringLiteral("Timed out"));
	ASSERT_TRUE(model.loadMore());
	ASSERT_TRUE(waitUntil([this]() { return !model.isLoading(); }));

	EXPECT_EQ(savedIds(), QStringList({"A", "B", "C"}));
	bool failedSeen = false;
	for (const AppEvent &event : events)
	{
		if (const auto *failed = eventAs<BrowserEvent, BrowserEvent::SavedTracksFetchFailed>(event))
		{
			failedSeen = true;
			EXPECT_EQ(failed->offset, 3);
			EXPECT_EQ(failed->error.code, 99);
		}
	}
	EXPECT_TRUE(failedSeen);

	// 失败后可以重试同一页
	ASSERT_TRUE(model.loadMore());
	ASSERT_TRUE(waitUntil([this]() { return savedIds().size() == 5; }));
}

TEST_F(SavedTracksPagingTest, AbandonedPageCanBeRequestedAgain)
{
	ASSERT_TRUE(model.loadInitial());
	ASSERT_TRUE(waitUntil([this]() { return savedIds().size() == 3; }));

	client->dropNext = true;
	ASSERT_TRUE(model.loadMore());
	ASSERT_TRUE(waitUntil([this]() { return !model.isLoading(); }));
	EXPECT_TRUE(cancelledFailureSeen(3));
	EXPECT_EQ(savedIds(), QStringList({"A", "B", "C"}));
	{
		const auto home = model.homeState();
		ASSERT_TRUE(home.has_value());
		EXPECT_FALSE((*home)->lastError.has_value());
	}

	ASSERT_TRUE(model.loadMore());
	ASSERT_TRUE(waitUntil([this]() { return savedIds().size() == 5; }));
	EXPECT_EQ(client->requests.size(), 3);
}

TEST_F(SavedTracksPagingTest, DestroyingViewCancelsPendingPage)
{
	client->holdNext = true;
	auto view = std::make_unique<SavedTracksModel>(app, controller.dispatcher(), 3);
	ASSERT_TRUE(view->loadInitial());
	ASSERT_EQ(client->held.size(), 1);
	EXPECT_FALSE(client->held.first()->isCanceled());

	view.reset();
	EXPECT_TRUE(client->held.first()->isCanceled());

	// 客户端收尾后，取消仍以失败事件送达，其他视图照常工作
	client->held.first()->finish();
	ASSERT_TRUE(waitUntil([this]() { return cancelledFailureSeen(0); }));
	EXPECT_TRUE(savedIds().isEmpty());
	ASSERT_TRUE(model.loadInitial());
	ASSERT_TRUE(waitUntil([this]() { return savedIds().size() == 3; }));
}

}
}
