// SavedTracksModel：“我喜欢的音乐”列表的视图模型，负责分页拉取与增量渲染
#pragma once

#include <QFuture>
#include <QList>
#include <QSharedPointer>
#include <QString>

#include <memory>
#include <optional>

#include "action_dispatcher.h"
#include "app_model.h"
#include "list_diff.h"
#include "playlist_model.h"
#include "selection_tools.h"
#include "song_row.h"

namespace Harmony
{

class SavedTracksModel : public PlaylistModel, public SelectionToolsModel
{
public:
	SavedTracksModel(QSharedPointer<AppModel> app, std::unique_ptr<ActionDispatcher> dispatcher, int pageSize = 50);
	~SavedTracksModel() override;

	// 拉取第一页并整体替换
	bool loadInitial();
	// 拉取下一页并追加；没有下一页或该页已在请求中时返回 false
	bool loadMore();
	bool isLoading() const;

	std::optional<StateRef<HomeState>> homeState() const;
	std::optional<QList<SongRow>> rows() const;

	std::optional<QString> currentSongId() const override;
	void playSong(const QString &id) override;
	std::optional<ListDiff<SongRow>> diffForEvent(const AppEvent &event) override;
	std::optional<ListDiff<SongRow>> initialDiff() override;
	bool autoscrollToPlaying() const override;
	std::optional<SongActionGroup> actionsFor(const QString &id) const override;
	std::optional<SongMenu> menuFor(const QString &id) const override;
	void selectSong(const QString &id) override;
	void deselectSong(const QString &id) override;
	bool enableSelection() override;

	// 同时满足两个能力接口
	std::optional<StateRef<SelectionState>> selection() const override;

	ActionDispatcher &dispatcher() const override;
	QList<SelectionTool> toolsVisible(const SelectionState &selection) const override;
	void handleToolActivated(const SelectionState &selection, const SelectionTool &tool) override;

private:
	QSharedPointer<AppModel> m_app;
	std::unique_ptr<ActionDispatcher> m_dispatcher;
	int m_pageSize;
	ListDiffEngine<SongRow> m_diff;
	// 本视图正在请求的页，收到对应结果事件后清空
	std::optional<int> m_pendingOffset;
	// 最近一次发出的页请求，析构时取消
	QFuture<Result<SongBatch>> m_inflight;

	std::optional<SongDescription> findSong(const QString &id) const;
	bool requestPage(int offset, bool replace);
};

}
