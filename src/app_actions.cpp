// 动作名称，用于调试日志
#include "app_actions.h"

namespace Harmony
{

QString actionName(const Action &action)
{
	return std::visit(
		overloaded{
			[](const BrowserAction &a) {
				return std::visit(overloaded{
									  [](const BrowserAction::SetSavedTracks &) { return QStringLiteral("Browser.SetSavedTracks"); },
									  [](const BrowserAction::AppendSavedTracks &) { return QStringLiteral("Browser.AppendSavedTracks"); },
									  [](const BrowserAction::SavedTracksFetchFailed &) { return QStringLiteral("Browser.SavedTracksFetchFailed"); },
									  [](const BrowserAction::NavigationPush &) { return QStringLiteral("Browser.NavigationPush"); },
									  [](const BrowserAction::NavigationPop &) { return QStringLiteral("Browser.NavigationPop"); },
								  },
								  a.value);
			},
			[](const PlaybackAction &a) {
				return std::visit(overloaded{
									  [](const PlaybackAction::LoadPagedSongs &) { return QStringLiteral("Playback.LoadPagedSongs"); },
									  [](const PlaybackAction::Load &) { return QStringLiteral("Playback.Load"); },
									  [](const PlaybackAction::QueueSongs &) { return QStringLiteral("Playback.QueueSongs"); },
									  [](const PlaybackAction::Stop &) { return QStringLiteral("Playback.Stop"); },
								  },
								  a.value);
			},
			[](const SelectionAction &a) {
				return std::visit(overloaded{
									  [](const SelectionAction::Select &) { return QStringLiteral("Selection.Select"); },
									  [](const SelectionAction::Deselect &) { return QStringLiteral("Selection.Deselect"); },
									  [](const SelectionAction::Clear &) { return QStringLiteral("Selection.Clear"); },
									  [](const SelectionAction::ChangeContext &) { return QStringLiteral("Selection.ChangeContext"); },
								  },
								  a.value);
			},
			[](const AppAction &a) {
				return std::visit(overloaded{
									  [](const AppAction::ChangeSelectionMode &) { return QStringLiteral("App.ChangeSelectionMode"); },
									  [](const AppAction::ViewAlbum &) { return QStringLiteral("App.ViewAlbum"); },
									  [](const AppAction::ViewArtist &) { return QStringLiteral("App.ViewArtist"); },
									  [](const AppAction::CopyLink &) { return QStringLiteral("App.CopyLink"); },
									  [](const AppAction::FetchFailed &) { return QStringLiteral("App.FetchFailed"); },
								  },
								  a.value);
			},
		},
		action);
}

}
