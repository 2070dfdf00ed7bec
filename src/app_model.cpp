// AppModel 实现
#include "app_model.h"

#include <utility>

#include "logger.h"

namespace Harmony
{

AppModel::AppModel(QSharedPointer<IMusicClient> musicClient, AppState initialState)
	: m_state(std::move(initialState))
	, m_musicClient(std::move(musicClient))
{
}

StateRef<AppState> AppModel::read() const
{
	return StateRef<AppState>(&m_state, &m_borrows);
}

bool AppModel::isBorrowed() const
{
	return m_borrows > 0;
}

// 有读守卫未释放时拒绝修改，由调用方稍后重试
QList<AppEvent> AppModel::update(const Action &action)
{
	if (m_borrows > 0)
	{
		Logger::error(QStringLiteral("%1 rejected: state is borrowed by %2 reader(s)").arg(actionName(action)).arg(m_borrows));
		return {};
	}
	Logger::debug(QStringLiteral("Applying %1").arg(actionName(action)));
	return m_state.update(action);
}

QSharedPointer<IMusicClient> AppModel::musicClient() const
{
	return m_musicClient;
}

}
