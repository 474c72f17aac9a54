#pragma once
#include <QDate>
#include <QString>
#include <QVector>
#include "include/types.hpp"

// 출석 기록. 날짜별 파티션, append-only (중복 제거/정렬 변경 없음)
class AttendanceLedger {
public:
	virtual ~AttendanceLedger() = default;

	virtual FpStatus record(const AttendanceEntry& entry) = 0;
	// 도착 순서 그대로
	virtual FpStatus entriesFor(const QDate& date, QVector<AttendanceEntry>& out) const = 0;
	// 기록이 있는 날짜 (오름차순)
	virtual FpStatus partitions(QVector<QDate>& out) const = 0;
};

// 하루치 파티션을 Id,Name,Date,Time,Score CSV 로 내보낸다
FpStatus exportPartitionCsv(const AttendanceLedger& ledger, const QDate& date, const QString& path);

// CSV 한 칸 (필요하면 따옴표로 감쌈)
QString csvField(const QString& s);

// attendance_YYYY-MM-DD.csv
QString defaultCsvName(const QDate& date);
