// AppModel：持有唯一的 AppState，提供作用域内只读借用与唯一的修改入口
#pragma once

#include <QList>
#include <QSharedPointer>

#include <functional>
#include <optional>

#include "app_state.h"
#include "music_client.h"

namespace Harmony
{

// 作用域只读借用：存活期间 AppModel 拒绝修改状态
// 只能在当前同步调用内使用，不得保存到成员或跨事件循环持有
template <typename T>
class StateRef
{
public:
	StateRef(const T *value, int *borrows)
		: m_value(value)
		, m_borrows(borrows)
	{
		++*m_borrows;
	}

	StateRef(StateRef &&other) noexcept
		: m_value(other.m_value)
		, m_borrows(other.m_borrows)
	{
		other.m_borrows = nullptr;
	}

	StateRef(const StateRef &) = delete;
	StateRef &operator=(const StateRef &) = delete;
	StateRef &operator=(StateRef &&) = delete;

	~StateRef()
	{
		if (m_borrows)
			--*m_borrows;
	}

	const T &operator*() const { return *m_value; }
	const T *operator->() const { return m_value; }
	const T *get() const { return m_value; }

private:
	const T *m_value;
	int *m_borrows;
};

class AppModel
{
public:
	explicit AppModel(QSharedPointer<IMusicClient> musicClient, AppState initialState = AppState());

	AppModel(const AppModel &) = delete;
	AppModel &operator=(const AppModel &) = delete;

	StateRef<AppState> read() const;

	// 借用状态中的某个字段；projector 返回 nullptr 表示该子状态当前不可用
	template <typename T>
	std::optional<StateRef<T>> mapReadOpt(const std::function<const T *(const AppState &)> &projector) const
	{
		const T *value = projector(m_state);
		if (!value)
			return std::nullopt;
		return StateRef<T>(value, &m_borrows);
	}

	bool isBorrowed() const;

	// 唯一的修改入口；存在未释放的借用时拒绝修改并返回空事件列表
	QList<AppEvent> update(const Action &action);

	QSharedPointer<IMusicClient> musicClient() const;

private:
	AppState m_state;
	mutable int m_borrows = 0;
	QSharedPointer<IMusicClient> m_musicClient;
};

}
