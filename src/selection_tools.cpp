// 选择工具的通用处理
#include "selection_tools.h"

#include "labels.h"
#include "logger.h"

namespace Harmony
{

QString SelectionTool::label() const
{
	switch (kind)
	{
	case Kind::SelectAll:
		return Labels::selectAll();
	case Kind::AddToQueue:
		return Labels::addToQueue();
	case Kind::ClearSelection:
		return Labels::clearSelection();
	}
	return QString();
}

void SelectionToolsModel::defaultHandleToolActivated(const SelectionState &selection, const SelectionTool &tool)
{
	switch (tool.kind)
	{
	case SelectionTool::Kind::AddToQueue:
		if (selection.count() == 0)
			return;
		dispatcher().dispatch(PlaybackAction{PlaybackAction::QueueSongs{selection.selectedSongs()}});
		dispatcher().dispatch(AppAction{AppAction::ChangeSelectionMode{false}});
		return;
	case SelectionTool::Kind::ClearSelection:
		dispatcher().dispatch(SelectionAction{SelectionAction::Clear{}});
		return;
	case SelectionTool::Kind::SelectAll:
		break;
	}
	Logger::debug(QStringLiteral("Selection tool \"%1\" has no default handler").arg(tool.label()));
}

void SelectionToolsModel::handleSelectAllTool(const SelectionState &selection, const QList<SongDescription> &songs)
{
	if (songs.isEmpty())
		return;
	bool allSelected = true;
	for (const SongDescription &song : songs)
	{
		if (!selection.isSelected(song.id))
		{
			allSelected = false;
			break;
		}
	}
	if (allSelected)
	{
		QStringList ids;
		for (const SongDescription &song : songs)
			ids.append(song.id);
		dispatcher().dispatch(SelectionAction{SelectionAction::Deselect{ids}});
		return;
	}
	dispatcher().dispatch(SelectionAction{SelectionAction::Select{songs}});
}

}
