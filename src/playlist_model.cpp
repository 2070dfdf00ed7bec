// PlaylistModel 的通用选择辅助，基于各视图实现的 selection/selectSong/deselectSong
#include "playlist_model.h"

namespace Harmony
{

// 当前上下文不允许选择时视为未选中
bool PlaylistModel::isSongSelected(const QString &id) const
{
	const auto current = selection();
	return current && (*current)->isSelected(id);
}

void PlaylistModel::toggleSongSelection(const QString &id)
{
	// 先释放借用再派发
	const bool selected = isSongSelected(id);
	if (selected)
		deselectSong(id);
	else
		selectSong(id);
}

}
