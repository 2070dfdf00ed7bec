#include "song_list_model.h"

#include <gtest/gtest.h>

#include "test_helpers.h"

namespace Harmony
{
namespace
{

QList<SongRow> rowsFor(const QStringList &ids, int firstIndex = 1)
{
	QList<SongRow> rows;
	for (int i = 0; i < ids.size(); ++i)
		rows.append(SongRow::fromSong(Testing::makeSong(ids.at(i)), firstIndex + i));
	return rows;
}

QStringList idsOf(const SongListModel &model)
{
	QStringList ids;
	for (const SongRow &row : model.rows())
		ids.append(row.id);
	return ids;
}

TEST(SongListModelTest, ResetThenAppend)
{
	SongListModel model;
	int resets = 0;
	QList<QPair<int, int>> inserted;
	QObject::connect(&model, &QAbstractItemModel::modelReset, [&resets]() { ++resets; });
	QObject::connect(&model, &QAbstractItemModel::rowsInserted, [&inserted](const QModelIndex &, int first, int last) {
		inserted.append({first, last});
	});

	model.applyDiff(ListDiff<SongRow>::reset(rowsFor({"A", "B", "C"})));
	EXPECT_EQ(resets, 1);
	EXPECT_EQ(model.rowCount(), 3);

	model.applyDiff(ListDiff<SongRow>::append(rowsFor({"D", "E"}, 4)));
	ASSERT_EQ(inserted.size(), 1);
	EXPECT_EQ(inserted.first(), qMakePair(3, 4));
	EXPECT_EQ(idsOf(model), QStringList({"A", "B", "C", "D", "E"}));
	EXPECT_EQ(model.data(model.index(4), SongListModel::IndexRole).toInt(), 5);
}

TEST(SongListModelTest, EmptyAppendIsIgnored)
{
	SongListModel model;
	int inserted = 0;
	QObject::connect(&model, &QAbstractItemModel::rowsInserted, [&inserted]() { ++inserted; });
	model.applyDiff(ListDiff<SongRow>::append({}));
	EXPECT_EQ(inserted, 0);
}

TEST(SongListModelTest, RemoveAndMove)
{
	SongListModel model;
	model.applyDiff(ListDiff<SongRow>::reset(rowsFor({"A", "B", "C", "D"})));

	model.applyDiff(ListDiff<SongRow>::remove({QStringLiteral("B"), QStringLiteral("D")}));
	EXPECT_EQ(idsOf(model), QStringList({"A", "C"}));

	model.applyDiff(ListDiff<SongRow>::move(0, 1));
	EXPECT_EQ(idsOf(model), QStringList({"C", "A"}));

	// 越界的移动被忽略
	model.applyDiff(ListDiff<SongRow>::move(0, 5));
	EXPECT_EQ(idsOf(model), QStringList({"C", "A"}));
}

TEST(SongListModelTest, RolesAndGet)
{
	SongListModel model;
	model.applyDiff(ListDiff<SongRow>::reset(rowsFor({"A"})));
	const QModelIndex first = model.index(0);
	EXPECT_EQ(model.data(first, SongListModel::IdRole).toString(), QStringLiteral("A"));
	EXPECT_EQ(model.data(first, SongListModel::TitleRole).toString(), QStringLiteral("Song A"));
	EXPECT_EQ(model.data(first, SongListModel::ArtistsRole).toString(), QStringLiteral("Artist A"));
	EXPECT_EQ(model.data(first, SongListModel::AlbumRole).toString(), QStringLiteral("Album A"));
	EXPECT_EQ(model.data(first, SongListModel::DurationRole).toLongLong(), 180000);
	EXPECT_FALSE(model.data(model.index(3), SongListModel::IdRole).isValid());

	const QVariantMap row = model.get(0);
	EXPECT_EQ(row.value(QStringLiteral("songId")).toString(), QStringLiteral("A"));
	EXPECT_TRUE(model.get(7).isEmpty());
	EXPECT_TRUE(model.roleNames().values().contains("isPlaying"));
}

TEST(SongListModelTest, PlayingRowTracksCurrentSong)
{
	SongListModel model;
	model.applyDiff(ListDiff<SongRow>::reset(rowsFor({"A", "B", "C"})));
	QList<int> playing;
	QObject::connect(&model, &SongListModel::playingRowChanged, [&playing](int row) { playing.append(row); });

	model.setCurrentSongId(QStringLiteral("B"));
	EXPECT_EQ(model.playingRow(), 1);
	EXPECT_TRUE(model.data(model.index(1), SongListModel::IsPlayingRole).toBool());
	EXPECT_FALSE(model.data(model.index(0), SongListModel::IsPlayingRole).toBool());

	model.setCurrentSongId(QStringLiteral("B"));
	model.setCurrentSongId(std::nullopt);
	EXPECT_EQ(model.playingRow(), -1);
	EXPECT_EQ(playing, QList<int>({1, -1}));
	EXPECT_EQ(model.rowForId(QStringLiteral("C")), 2);
	EXPECT_EQ(model.rowForId(QStringLiteral("X")), -1);
}

}
}
