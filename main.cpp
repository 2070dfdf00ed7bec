// 应用入口：初始化日志与配置，无界面地把全部收藏歌曲同步进状态树
#include <QCoreApplication>

#include "action_dispatcher.h"
#include "app_config.h"
#include "app_controller.h"
#include "app_model.h"
#include "http_client.h"
#include "logger.h"
#include "netease_client.h"
#include "saved_tracks_model.h"
#include "song_list_model.h"

// 程序主函数
int main(int argc, char *argv[])
{
	// 设置应用组织与名称，影响设置存储位置等
	QCoreApplication::setOrganizationName("Harmony");
	QCoreApplication::setApplicationName("harmony-sync");
	QCoreApplication app(argc, argv);

	const Harmony::AppConfig config = Harmony::AppConfig::load();

	// 默认使用配置中的级别，--debug 参数强制开启调试日志
	Harmony::Logger::Level logLevel = config.logLevel;
	if (app.arguments().contains(QStringLiteral("--debug")))
		logLevel = Harmony::Logger::Level::Debug;
	Harmony::Logger::init(logLevel);
	Harmony::Logger::info("Application starting");

	// HTTP 客户端由 NeteaseClient 共享持有，在主线程中延迟析构
	QSharedPointer<Harmony::HttpClient> http(new Harmony::HttpClient, &QObject::deleteLater);
	http->setDefaultHeaders({{"Accept", "application/json"}});
	http->setUserAgent("Mozilla/5.0 (X11; Linux x86_64) harmony-sync");

	QSharedPointer<Harmony::IMusicClient> client = QSharedPointer<Harmony::NeteaseClient>::create(http, config);
	auto model = QSharedPointer<Harmony::AppModel>::create(client);
	Harmony::AppController controller(model);
	Harmony::SavedTracksModel savedTracks(model, controller.dispatcher(), config.savedTracksPageSize);
	Harmony::SongListModel list;

	int exitCode = 0;
	controller.subscribe([&](const Harmony::AppEvent &event) {
		if (const auto diff = savedTracks.diffForEvent(event))
		{
			list.applyDiff(*diff);
			Harmony::Logger::info(QStringLiteral("Saved tracks: %1 rows").arg(list.rowCount()));
		}
		if (const auto *failed = Harmony::eventAs<Harmony::BrowserEvent, Harmony::BrowserEvent::SavedTracksFetchFailed>(event))
		{
			Harmony::Logger::error(QStringLiteral("Saved tracks page at %1 failed: %2").arg(failed->offset).arg(failed->error.toString()));
			exitCode = 1;
			QCoreApplication::exit(exitCode);
			return;
		}
		const bool pageArrived = Harmony::eventAs<Harmony::BrowserEvent, Harmony::BrowserEvent::SavedTracksUpdated>(event)
								 || Harmony::eventAs<Harmony::BrowserEvent, Harmony::BrowserEvent::SavedTracksAppended>(event);
		if (pageArrived && !savedTracks.loadMore())
		{
			Harmony::Logger::info(QStringLiteral("All %1 saved tracks loaded").arg(list.rowCount()));
			QCoreApplication::exit(exitCode);
		}
	});

	// 事件循环启动后再发起请求，保证 exit() 生效
	const bool posted = QMetaObject::invokeMethod(
		&app,
		[&savedTracks]() {
			if (!savedTracks.loadInitial())
			{
				Harmony::Logger::error("Could not start loading saved tracks");
				QCoreApplication::exit(1);
			}
		},
		Qt::QueuedConnection);
	if (!posted)
	{
		Harmony::Logger::error("Could not schedule the initial load");
		return 1;
	}

	// 进入 Qt 事件循环
	const int code = app.exec();
	Harmony::Logger::info("Application exiting");
	return code;
}
