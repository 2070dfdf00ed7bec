// 菜单与工具栏文案，统一经 QCoreApplication::translate 以便翻译
#include "labels.h"

#include <QCoreApplication>

namespace Harmony::Labels
{

QString viewAlbum()
{
	return QCoreApplication::translate("Labels", "View album");
}

// 调用方负责对歌手名转义
QString moreFromArtist(const QString &escapedName)
{
	return QCoreApplication::translate("Labels", "More from %1").arg(escapedName);
}

QString copyLink()
{
	return QCoreApplication::translate("Labels", "Copy link");
}

QString selectAll()
{
	return QCoreApplication::translate("Labels", "Select all");
}

QString addToQueue()
{
	return QCoreApplication::translate("Labels", "Add to queue");
}

QString clearSelection()
{
	return QCoreApplication::translate("Labels", "Clear selection");
}

}
