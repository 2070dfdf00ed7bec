// 事件定义：状态修改完成后描述“发生了什么变化”
#pragma once

#include <QString>

#include <variant>

#include "app_actions.h"

namespace Harmony
{

struct BrowserEvent
{
	struct SavedTracksUpdated
	{
	};
	// startIndex 等于追加前 savedTracks 的长度
	struct SavedTracksAppended
	{
		int startIndex = 0;
	};
	struct SavedTracksFetchFailed
	{
		int offset = 0;
		Error error;
	};
	struct NavigationPushed
	{
		ScreenName screen;
	};
	struct NavigationPopped
	{
	};

	using Variant = std::variant<SavedTracksUpdated, SavedTracksAppended, SavedTracksFetchFailed, NavigationPushed, NavigationPopped>;
	Variant value;
};

struct PlaybackEvent
{
	struct PlaylistChanged
	{
	};
	struct TrackChanged
	{
		QString songId;
	};
	struct PlaybackStopped
	{
	};

	using Variant = std::variant<PlaylistChanged, TrackChanged, PlaybackStopped>;
	Variant value;
};

struct SelectionEvent
{
	struct SelectionChanged
	{
	};
	struct SelectionModeChanged
	{
		bool active = false;
	};
	struct SelectionContextChanged
	{
		SelectionContext context = SelectionContext::Default;
	};

	using Variant = std::variant<SelectionChanged, SelectionModeChanged, SelectionContextChanged>;
	Variant value;
};

struct NoticeEvent
{
	// 由 UI 层负责写入剪贴板
	struct LinkCopied
	{
		QString url;
	};
	struct ErrorReported
	{
		Error error;
	};

	using Variant = std::variant<LinkCopied, ErrorReported>;
	Variant value;
};

using AppEvent = std::variant<BrowserEvent, PlaybackEvent, SelectionEvent, NoticeEvent>;

// 取出某一类事件中的具体分支，不匹配时返回 nullptr
template <typename Group, typename Alternative>
const Alternative *eventAs(const AppEvent &event)
{
	const Group *group = std::get_if<Group>(&event);
	if (!group)
		return nullptr;
	return std::get_if<Alternative>(&group->value);
}

}
