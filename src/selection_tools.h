// SelectionToolsModel：选择模式下的工具栏能力
#pragma once

#include <QList>
#include <QString>

#include <optional>

#include "action_dispatcher.h"
#include "app_model.h"

namespace Harmony
{

struct SelectionTool
{
	enum class Kind
	{
		SelectAll,
		AddToQueue,
		ClearSelection
	};

	Kind kind = Kind::SelectAll;

	QString label() const;

	bool operator==(const SelectionTool &other) const { return kind == other.kind; }
};

class SelectionToolsModel
{
public:
	virtual ~SelectionToolsModel() = default;

	virtual ActionDispatcher &dispatcher() const = 0;
	virtual std::optional<StateRef<SelectionState>> selection() const = 0;

	virtual QList<SelectionTool> toolsVisible(const SelectionState &selection) const = 0;
	virtual void handleToolActivated(const SelectionState &selection, const SelectionTool &tool) = 0;

protected:
	// 通用工具：加入队列并退出选择模式、清空选择
	void defaultHandleToolActivated(const SelectionState &selection, const SelectionTool &tool);
	// 已全部选中时取消全选
	void handleSelectAllTool(const SelectionState &selection, const QList<SongDescription> &songs);
};

}
