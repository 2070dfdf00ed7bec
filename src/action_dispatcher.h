// ActionDispatcher：派发同步动作，或在异步请求完成后派发结果动作
#pragma once

#include <QFuture>
#include <QPointer>

#include <functional>
#include <memory>

#include "app_actions.h"
#include "core_types.h"

namespace Harmony
{

class AppController;

using ActionFuture = QFuture<Result<Action>>;
using ActionFactory = std::function<ActionFuture()>;

class ActionDispatcher
{
public:
	virtual ~ActionDispatcher() = default;

	// 不阻塞调用方；可在任意 UI 回调中调用
	virtual void dispatch(const Action &action) = 0;
	// 立即调用 factory 发起异步操作，完成后在 UI 线程派发其结果
	virtual void callAndDispatch(const ActionFactory &factory) = 0;
	// 指向同一派发循环的独立句柄
	virtual std::unique_ptr<ActionDispatcher> boxClone() const = 0;
};

// 转发到 AppController 的派发句柄；控制器销毁后派发为空操作
class ActionDispatcherImpl : public ActionDispatcher
{
public:
	explicit ActionDispatcherImpl(AppController *controller);

	void dispatch(const Action &action) override;
	void callAndDispatch(const ActionFactory &factory) override;
	std::unique_ptr<ActionDispatcher> boxClone() const override;

private:
	QPointer<AppController> controller;
};

}
