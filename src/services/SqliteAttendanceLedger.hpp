#pragma once
#include <QMutex>
#include <QSqlDatabase>
#include <QString>
#include "services/AttendanceLedger.hpp"

// Qt SQL(QSQLITE) 기반 출석부. 날짜 컬럼이 파티션 키
class SqliteAttendanceLedger : public AttendanceLedger {
public:
	explicit SqliteAttendanceLedger(const QString& dbFile);
	~SqliteAttendanceLedger() override;

	SqliteAttendanceLedger(const SqliteAttendanceLedger&) = delete;
	SqliteAttendanceLedger& operator=(const SqliteAttendanceLedger&) = delete;

	// 스키마 준비. 파일이 DB 가 아니면 StoreCorrupt
	FpStatus initializeDatabase();

	FpStatus record(const AttendanceEntry& entry) override;
	FpStatus entriesFor(const QDate& date, QVector<AttendanceEntry>& out) const override;
	FpStatus partitions(QVector<QDate>& out) const override;

	const QString& dbFile() const { return dbFile_; }

private:
	QSqlDatabase ensureOpenConnection() const;

	QString dbFile_;
	QString connName_;
	mutable QMutex dbMutex;
};
