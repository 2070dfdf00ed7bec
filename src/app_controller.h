// AppController：单线程派发循环，串行应用动作并同步通知订阅者
#pragma once

#include <QHash>
#include <QList>
#include <QObject>
#include <QSharedPointer>

#include <functional>
#include <memory>

#include "action_dispatcher.h"
#include "app_events.h"
#include "app_model.h"

namespace Harmony
{

class AppController : public QObject
{
	Q_OBJECT

public:
	using ListenerId = quint64;
	using Listener = std::function<void(const AppEvent &)>;

	explicit AppController(QSharedPointer<AppModel> model, QObject *parent = nullptr);

	QSharedPointer<AppModel> model() const;
	std::unique_ptr<ActionDispatcher> dispatcher();

	// 在所属线程调用；正在派发或状态被借用时排队，稍后按顺序应用
	void dispatch(const Action &action);
	// 在 UI 线程等待异步结果：成功派发其动作，失败派发 AppAction::FetchFailed
	void watch(const ActionFuture &future);

	ListenerId subscribe(Listener cb);
	void unsubscribe(ListenerId id);

	int pendingCount() const;

private:
	QSharedPointer<AppModel> m_model;
	QList<Action> m_pending;
	QHash<ListenerId, Listener> m_listeners;
	// 保持订阅顺序，通知按订阅先后进行
	QList<ListenerId> m_listenerOrder;
	ListenerId m_nextId = 0;
	bool m_draining = false;
	bool m_drainScheduled = false;

	void drain();
	void scheduleDrain();
	void notify(const AppEvent &event);
};

}
