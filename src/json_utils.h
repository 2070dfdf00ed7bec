// JSON 解析辅助：带字段路径的宽容读取，错误信息可定位到具体字段
#pragma once

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>

#include "core_types.h"

namespace Harmony
{
namespace Json
{

// 将响应体解析为 JSON 对象，失败时返回 Parser 错误
Result<QJsonObject> parseObject(const QByteArray &body);

// 对单个 JSON 对象的字段读取器，path 用于拼接错误信息，如 "songs[3].al"
class Reader
{
public:
	explicit Reader(const QJsonObject &obj, const QString &path = QString());

	// 字符串字段：数字与布尔同样接受并转换为字符串（网易云的 id 常为数字）
	Result<QString> string(const QString &key, bool required = true) const;
	// 64 位整数：接受数字或字符串数字
	Result<qint64> int64(const QString &key, bool required = true) const;
	Result<QJsonObject> object(const QString &key, bool required = true) const;
	Result<QJsonArray> array(const QString &key, bool required = true) const;

	bool has(const QString &key) const;
	QString path() const;
	// 生成子路径，例如 child("ar", 0) -> "songs[3].ar[0]"
	QString childPath(const QString &key, int index = -1) const;

private:
	QJsonObject obj;
	QString basePath;

	Error missingField(const QString &key) const;
	Error typeError(const QString &key, const QString &expected) const;
};

}
}
