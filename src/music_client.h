// 音乐服务客户端接口：分页拉取用户收藏的歌曲
#pragma once

#include <QFuture>
#include <QString>

#include "core_types.h"

namespace Harmony
{

// 只读能力对象，可跨线程共享；实现需保证任意线程调用安全
class IMusicClient
{
public:
	virtual ~IMusicClient() = default;

	// 客户端唯一标识，例如 "netease"
	virtual QString id() const = 0;

	// 拉取 [offset, offset + limit) 范围内的收藏歌曲
	// 返回的 songs 不超过 limit 条，条数少于 limit 表示没有更多
	// 取消返回的 future 会尽力中止底层请求
	virtual QFuture<Result<SongBatch>> savedTracksPage(int offset, int limit) const = 0;
};

}
