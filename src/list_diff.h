// ListDiff：把 UI 列表同步到状态所需的最小有序补丁
#pragma once

#include <QList>
#include <QString>
#include <QStringList>

#include "logger.h"

namespace Harmony
{

template <typename T>
struct ListDiff
{
	enum class Kind
	{
		Append,
		Reset,
		Remove,
		Move
	};

	Kind kind = Kind::Reset;
	// Append 为新增的尾部元素，Reset 为完整列表
	QList<T> items;
	QStringList removedIds;
	int from = -1;
	int to = -1;

	static ListDiff append(const QList<T> &items)
	{
		ListDiff d;
		d.kind = Kind::Append;
		d.items = items;
		return d;
	}

	static ListDiff reset(const QList<T> &items)
	{
		ListDiff d;
		d.kind = Kind::Reset;
		d.items = items;
		return d;
	}

	static ListDiff remove(const QStringList &ids)
	{
		ListDiff d;
		d.kind = Kind::Remove;
		d.removedIds = ids;
		return d;
	}

	static ListDiff move(int from, int to)
	{
		ListDiff d;
		d.kind = Kind::Move;
		d.from = from;
		d.to = to;
		return d;
	}
};

// 记住上次渲染的长度；追加位置与之不符时退化为 Reset
// 尚未渲染过视为已渲染 0 行，只有从 0 开始的追加才能增量应用
template <typename T>
class ListDiffEngine
{
public:
	ListDiff<T> append(int startIndex, const QList<T> &all)
	{
		const int rendered = m_renderedCount >= 0 ? m_renderedCount : 0;
		if (startIndex != rendered || startIndex > all.size())
		{
			Logger::warning(QStringLiteral("Append at %1 does not match %2 rendered rows, resetting").arg(startIndex).arg(rendered));
			return reset(all);
		}
		m_renderedCount = static_cast<int>(all.size());
		return ListDiff<T>::append(all.mid(startIndex));
	}

	ListDiff<T> reset(const QList<T> &all)
	{
		m_renderedCount = static_cast<int>(all.size());
		return ListDiff<T>::reset(all);
	}

	// 尚未渲染时为 -1
	int renderedCount() const { return m_renderedCount; }

private:
	int m_renderedCount = -1;
};

}
