// SongListModel 实现：把补丁翻译为 begin/end 通知
#include "song_list_model.h"

namespace Harmony
{

SongListModel::SongListModel(QObject *parent)
	: QAbstractListModel(parent)
{
}

int SongListModel::rowCount(const QModelIndex &parent) const
{
	if (parent.isValid())
		return 0;
	return static_cast<int>(m_rows.size());
}

QVariant SongListModel::data(const QModelIndex &index, int role) const
{
	if (!index.isValid() || index.row() < 0 || index.row() >= m_rows.size())
		return {};
	const SongRow &r = m_rows.at(index.row());

	switch (role)
	{
	case IdRole:
		return r.id;
	case IndexRole:
		return r.index;
	case Qt::DisplayRole:
	case TitleRole:
		return r.title;
	case ArtistsRole:
		return r.artists;
	case AlbumRole:
		return r.album;
	case DurationRole:
		return r.durationMs;
	case IsPlayingRole:
		return m_currentId.has_value() && *m_currentId == r.id;
	default:
		return {};
	}
}

QHash<int, QByteArray> SongListModel::roleNames() const
{
	QHash<int, QByteArray> roles;
	roles[IdRole] = "songId";
	roles[IndexRole] = "index";
	roles[TitleRole] = "title";
	roles[ArtistsRole] = "artists";
	roles[AlbumRole] = "album";
	roles[DurationRole] = "duration";
	roles[IsPlayingRole] = "isPlaying";
	return roles;
}

void SongListModel::applyDiff(const ListDiff<SongRow> &diff)
{
	switch (diff.kind)
	{
	case ListDiff<SongRow>::Kind::Append: {
		if (diff.items.isEmpty())
			return;
		const int pos = static_cast<int>(m_rows.size());
		beginInsertRows(QModelIndex(), pos, pos + static_cast<int>(diff.items.size()) - 1);
		m_rows.append(diff.items);
		endInsertRows();
		break;
	}
	case ListDiff<SongRow>::Kind::Reset:
		beginResetModel();
		m_rows = diff.items;
		endResetModel();
		break;
	case ListDiff<SongRow>::Kind::Remove:
		removeIds(diff.removedIds);
		break;
	case ListDiff<SongRow>::Kind::Move:
		moveRow(diff.from, diff.to);
		break;
	}
}

const QList<SongRow> &SongListModel::rows() const
{
	return m_rows;
}

QVariantMap SongListModel::get(int row) const
{
	QVariantMap map;
	if (row < 0 || row >= m_rows.size())
		return map;
	const SongRow &r = m_rows.at(row);
	map.insert(QStringLiteral("songId"), r.id);
	map.insert(QStringLiteral("index"), r.index);
	map.insert(QStringLiteral("title"), r.title);
	map.insert(QStringLiteral("artists"), r.artists);
	map.insert(QStringLiteral("album"), r.album);
	map.insert(QStringLiteral("duration"), r.durationMs);
	map.insert(QStringLiteral("isPlaying"), m_currentId.has_value() && *m_currentId == r.id);
	return map;
}

int SongListModel::rowForId(const QString &id) const
{
	for (int i = 0; i < m_rows.size(); ++i)
	{
		if (m_rows.at(i).id == id)
			return i;
	}
	return -1;
}

void SongListModel::setCurrentSongId(const std::optional<QString> &id)
{
	if (m_currentId == id)
		return;
	const int previous = playingRow();
	m_currentId = id;
	const int current = playingRow();
	const QList<int> roles{IsPlayingRole};
	if (previous >= 0)
		emit dataChanged(index(previous), index(previous), roles);
	if (current >= 0)
		emit dataChanged(index(current), index(current), roles);
	emit playingRowChanged(current);
}

int SongListModel::playingRow() const
{
	if (!m_currentId)
		return -1;
	return rowForId(*m_currentId);
}

void SongListModel::removeIds(const QStringList &ids)
{
	// 从后往前删，避免行号偏移
	for (int i = static_cast<int>(m_rows.size()) - 1; i >= 0; --i)
	{
		if (!ids.contains(m_rows.at(i).id))
			continue;
		beginRemoveRows(QModelIndex(), i, i);
		m_rows.removeAt(i);
		endRemoveRows();
	}
}

void SongListModel::moveRow(int from, int to)
{
	if (from < 0 || from >= m_rows.size() || to < 0 || to >= m_rows.size() || from == to)
		return;

	// 向下移动时 beginMoveRows 的目标位置需要 +1
	const int dest = (to > from) ? (to + 1) : to;
	if (beginMoveRows(QModelIndex(), from, from, QModelIndex(), dest))
	{
		m_rows.move(from, to);
		endMoveRows();
	}
}

}
