// ActionDispatcherImpl 实现：跨线程调用会被投递回控制器所在线程
#include "action_dispatcher.h"

#include <QThread>

#include "app_controller.h"
#include "logger.h"

namespace Harmony
{

ActionDispatcherImpl::ActionDispatcherImpl(AppController *controller)
	: controller(controller)
{
}

void ActionDispatcherImpl::dispatch(const Action &action)
{
	AppController *target = controller.data();
	if (!target)
	{
		Logger::debug(QStringLiteral("%1 dropped: controller is gone").arg(actionName(action)));
		return;
	}
	if (QThread::currentThread() != target->thread())
	{
		// 以控制器为上下文投递，控制器销毁后该调用被丢弃
		const bool posted = QMetaObject::invokeMethod(
			target, [target, action]() { target->dispatch(action); }, Qt::QueuedConnection);
		if (!posted)
			Logger::error(QStringLiteral("%1 dropped: failed to post to the controller thread").arg(actionName(action)));
		return;
	}
	target->dispatch(action);
}

void ActionDispatcherImpl::callAndDispatch(const ActionFactory &factory)
{
	AppController *target = controller.data();
	if (!target)
	{
		Logger::debug(QStringLiteral("Async action dropped: controller is gone"));
		return;
	}
	target->watch(factory());
}

std::unique_ptr<ActionDispatcher> ActionDispatcherImpl::boxClone() const
{
	return std::make_unique<ActionDispatcherImpl>(controller.data());
}

}
