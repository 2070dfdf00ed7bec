// JsonUtils 实现：统一 JSON 字段读取与错误构造
#include "json_utils.h"

#include <QJsonDocument>
#include <QJsonParseError>

namespace Harmony
{
namespace Json
{

Result<QJsonObject> parseObject(const QByteArray &body)
{
	QJsonParseError err{};
	QJsonDocument doc = QJsonDocument::fromJson(body, &err);
	if (err.error != QJsonParseError::NoError)
		return Result<QJsonObject>::failure(makeError(ErrorCategory::Parser, -1, QStringLiteral("Malformed JSON"), err.errorString()));
	if (!doc.isObject())
		return Result<QJsonObject>::failure(makeError(ErrorCategory::Parser, -1, QStringLiteral("JSON root is not an object")));
	return Result<QJsonObject>::success(doc.object());
}

Reader::Reader(const QJsonObject &obj, const QString &path)
	: obj(obj)
	, basePath(path)
{
}

bool Reader::has(const QString &key) const
{
	return obj.contains(key) && !obj.value(key).isNull();
}

QString Reader::path() const
{
	return basePath;
}

QString Reader::childPath(const QString &key, int index) const
{
	QString p = basePath.isEmpty() ? key : basePath + QLatin1Char('.') + key;
	if (index >= 0)
		p += QStringLiteral("[%1]").arg(index);
	return p;
}

Error Reader::missingField(const QString &key) const
{
	return makeError(ErrorCategory::Parser, 1, QStringLiteral("Missing field: ") + childPath(key));
}

Error Reader::typeError(const QString &key, const QString &expected) const
{
	return makeError(ErrorCategory::Parser, 2, QStringLiteral("Invalid type for field: %1, expected %2").arg(childPath(key), expected));
}

Result<QString> Reader::string(const QString &key, bool required) const
{
	if (!has(key))
	{
		if (required)
			return Result<QString>::failure(missingField(key));
		return Result<QString>::success(QString());
	}
	const QJsonValue v = obj.value(key);
	if (v.isString())
		return Result<QString>::success(v.toString());
	// toVariant 保证大整数 id 不会被格式化成科学计数法
	if (v.isDouble())
		return Result<QString>::success(v.toVariant().toString());
	if (v.isBool())
		return Result<QString>::success(v.toBool() ? QStringLiteral("true") : QStringLiteral("false"));
	return Result<QString>::failure(typeError(key, QStringLiteral("string")));
}

Result<qint64> Reader::int64(const QString &key, bool required) const
{
	if (!has(key))
	{
		if (required)
			return Result<qint64>::failure(missingField(key));
		return Result<qint64>::success(0);
	}
	const QJsonValue v = obj.value(key);
	if (v.isDouble())
		return Result<qint64>::success(v.toInteger());
	if (v.isString())
	{
		bool ok = false;
		const qint64 value = v.toString().toLongLong(&ok);
		if (ok)
			return Result<qint64>::success(value);
	}
	return Result<qint64>::failure(typeError(key, QStringLiteral("integer")));
}

Result<QJsonObject> Reader::object(const QString &key, bool required) const
{
	if (!has(key))
	{
		if (required)
			return Result<QJsonObject>::failure(missingField(key));
		return Result<QJsonObject>::success(QJsonObject());
	}
	const QJsonValue v = obj.value(key);
	if (v.isObject())
		return Result<QJsonObject>::success(v.toObject());
	return Result<QJsonObject>::failure(typeError(key, QStringLiteral("object")));
}

Result<QJsonArray> Reader::array(const QString &key, bool required) const
{
	if (!has(key))
	{
		if (required)
			return Result<QJsonArray>::failure(missingField(key));
		return Result<QJsonArray>::success(QJsonArray());
	}
	const QJsonValue v = obj.value(key);
	if (v.isArray())
		return Result<QJsonArray>::success(v.toArray());
	return Result<QJsonArray>::failure(typeError(key, QStringLiteral("array")));
}

}
}
