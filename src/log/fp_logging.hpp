#pragma once
#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(LC_EXTRACT)
Q_DECLARE_LOGGING_CATEGORY(LC_MATCH)
Q_DECLARE_LOGGING_CATEGORY(LC_GALLERY)
Q_DECLARE_LOGGING_CATEGORY(LC_LEDGER)
Q_DECLARE_LOGGING_CATEGORY(LC_SESSION)

namespace FpLogging {
	// main 에서 1회. verbose=false 면 debug 카테고리 off
	void applyFilterRules(bool verbose);

	// qDebug 계열 출력을 파일에도 남긴다 (빈 경로면 콘솔만)
	bool installFileLog(const QString& filePath);
}
