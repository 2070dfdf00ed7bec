// 菜单与工具栏文案，统一走 Qt 翻译
#pragma once

#include <QString>

namespace Harmony::Labels
{

QString viewAlbum();
QString moreFromArtist(const QString &escapedName);
QString copyLink();
QString selectAll();
QString addToQueue();
QString clearSelection();

}
