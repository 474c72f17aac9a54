#pragma once
#include <QDir>
#include <QFileInfo>
#include <QString>

namespace SqlCommon {
	inline QString baseConnName() { return QStringLiteral("fpattend"); }

	// 상위 디렉토리를 만들고 절대경로 반환
	inline QString prepareDbFile(const QString& dbFile)
	{
		const QFileInfo fi(dbFile);
		QDir().mkpath(fi.absolutePath());
		return fi.absoluteFilePath();
	}

	// 저장소 인스턴스마다 독립 커넥션
	inline QString connectionNameFor(const void* owner)
	{
		return QString("%1_%2").arg(baseConnName())
							   .arg(static_cast<qulonglong>(reinterpret_cast<quintptr>(owner)));
	}
} // namespace SqlCommon
