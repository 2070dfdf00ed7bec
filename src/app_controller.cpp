// AppController 实现
#include "app_controller.h"

#include <utility>

#include "logger.h"

namespace Harmony
{

AppController::AppController(QSharedPointer<AppModel> model, QObject *parent)
	: QObject(parent)
	, m_model(std::move(model))
{
}

QSharedPointer<AppModel> AppController::model() const
{
	return m_model;
}

std::unique_ptr<ActionDispatcher> AppController::dispatcher()
{
	return std::make_unique<ActionDispatcherImpl>(this);
}

int AppController::pendingCount() const
{
	return static_cast<int>(m_pending.size());
}

void AppController::dispatch(const Action &action)
{
	m_pending.append(action);
	// 监听者内部再次派发：追加到队尾，由外层 drain 继续处理
	if (m_draining)
		return;
	if (m_model->isBorrowed())
	{
		Logger::debug(QStringLiteral("%1 deferred: state is borrowed").arg(actionName(action)));
		scheduleDrain();
		return;
	}
	drain();
}

// 异步结果回到控制器线程再派发；控制器销毁后续体不再执行
void AppController::watch(const ActionFuture &future)
{
	ActionFuture pending = future;
	pending
		.then(this,
			  [this](Result<Action> result) {
				  if (!result.ok)
				  {
					  dispatch(AppAction{AppAction::FetchFailed{result.error}});
					  return;
				  }
				  dispatch(result.value);
			  })
		.onCanceled(this, [this]() {
			// 取消同样走 dispatch，调用方据此结束加载状态
			Logger::debug(QStringLiteral("Async action cancelled before completion"));
			dispatch(AppAction{AppAction::FetchFailed{makeError(ErrorCategory::Cancelled, -2, QStringLiteral("Async action cancelled"))}});
		});
}

AppController::ListenerId AppController::subscribe(Listener cb)
{
	const ListenerId id = ++m_nextId;
	m_listeners.insert(id, std::move(cb));
	m_listenerOrder.append(id);
	return id;
}

void AppController::unsubscribe(ListenerId id)
{
	m_listeners.remove(id);
	m_listenerOrder.removeAll(id);
}

void AppController::scheduleDrain()
{
	if (m_drainScheduled)
		return;
	m_drainScheduled = true;
	const bool posted = QMetaObject::invokeMethod(
		this,
		[this]() {
			m_drainScheduled = false;
			drain();
		},
		Qt::QueuedConnection);
	if (!posted)
	{
		m_drainScheduled = false;
		Logger::error(QStringLiteral("Failed to schedule drain, %1 action(s) pending").arg(m_pending.size()));
	}
}

// 依次应用队列中的动作；状态被借用时中断，留待下一轮事件循环
void AppController::drain()
{
	if (m_draining)
		return;
	m_draining = true;
	while (!m_pending.isEmpty())
	{
		if (m_model->isBorrowed())
		{
			scheduleDrain();
			break;
		}
		const Action action = m_pending.takeFirst();
		const QList<AppEvent> events = m_model->update(action);
		for (const AppEvent &event : events)
			notify(event);
	}
	m_draining = false;
}

void AppController::notify(const AppEvent &event)
{
	// 复制一份，允许监听者在回调中订阅或退订
	const QList<ListenerId> order = m_listenerOrder;
	for (ListenerId id : order)
	{
		auto it = m_listeners.constFind(id);
		if (it == m_listeners.constEnd())
			continue;
		const Listener listener = it.value();
		listener(event);
	}
}

}
