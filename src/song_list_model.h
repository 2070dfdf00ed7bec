// SongListModel：按 ListDiff 补丁增量更新的歌曲列表模型，供 QML 使用
#pragma once

#include <QAbstractListModel>

#include <optional>

#include "list_diff.h"
#include "song_row.h"

namespace Harmony
{

class SongListModel : public QAbstractListModel
{
	Q_OBJECT

public:
	enum Roles
	{
		IdRole = Qt::UserRole + 1,
		IndexRole,
		TitleRole,
		ArtistsRole,
		AlbumRole,
		DurationRole,
		IsPlayingRole
	};

	explicit SongListModel(QObject *parent = nullptr);

	int rowCount(const QModelIndex &parent = QModelIndex()) const override;
	QVariant data(const QModelIndex &index, int role) const override;
	QHash<int, QByteArray> roleNames() const override;

	void applyDiff(const ListDiff<SongRow> &diff);
	const QList<SongRow> &rows() const;
	Q_INVOKABLE QVariantMap get(int row) const;
	// 不存在时返回 -1
	int rowForId(const QString &id) const;

	void setCurrentSongId(const std::optional<QString> &id);
	int playingRow() const;

signals:
	// 当前播放行变化，-1 表示没有
	void playingRowChanged(int row);

private:
	QList<SongRow> m_rows;
	std::optional<QString> m_currentId;

	void removeIds(const QStringList &ids);
	void moveRow(int from, int to);
};

}
