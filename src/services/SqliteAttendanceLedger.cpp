#include "services/SqliteAttendanceLedger.hpp"
#include "services/SqlCommon.hpp"

#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>
#include <QDebug>

#include "log/fp_logging.hpp"

namespace {
const QString kTimeFormat = QStringLiteral("HH:mm:ss");
} // namespace

SqliteAttendanceLedger::SqliteAttendanceLedger(const QString& dbFile)
	: dbFile_(SqlCommon::prepareDbFile(dbFile)),
	  connName_(SqlCommon::connectionNameFor(this))
{
}

SqliteAttendanceLedger::~SqliteAttendanceLedger()
{
	if (!QSqlDatabase::contains(connName_)) return;
	{
		QSqlDatabase db = QSqlDatabase::database(connName_, /*open=*/false);
		if (db.isOpen()) db.close();
	}
	QSqlDatabase::removeDatabase(connName_);
}

QSqlDatabase SqliteAttendanceLedger::ensureOpenConnection() const
{
	QSqlDatabase db;

	if (!QSqlDatabase::contains(connName_)) {
		db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), connName_);
		db.setDatabaseName(dbFile_);
	} else {
		db = QSqlDatabase::database(connName_, /*open=*/false);
	}

	if (!db.isOpen() && !db.open()) {
		qCritical() << "[SQL] DB open failed:" << db.lastError().text()
					<< " path=" << db.databaseName()
					<< " drivers=" << QSqlDatabase::drivers();
	}
	return db;
}

FpStatus SqliteAttendanceLedger::initializeDatabase()
{
	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = ensureOpenConnection();
	if (!db.isOpen()) return FpStatus::IoFailure;

	QSqlQuery q(db);
	// 헤더가 깨진 파일은 첫 쿼리에서 실패한다
	if (!q.exec("PRAGMA journal_mode=WAL;")) {
		qCritical() << "[SQL] not a usable database:" << dbFile_ << q.lastError().text();
		return FpStatus::StoreCorrupt;
	}
	if (!q.exec("PRAGMA synchronous=NORMAL;")) {
		qWarning() << "[SQL] synchronous pragma failed:" << q.lastError().text();
	}

	if (!q.exec(
		"CREATE TABLE IF NOT EXISTS attendance ("
		"id INTEGER PRIMARY KEY AUTOINCREMENT, "
		"subject_id   INTEGER NOT NULL, "
		"subject_name TEXT    NOT NULL, "
		"date         TEXT    NOT NULL, "
		"time         TEXT    NOT NULL, "
		"score        INTEGER NOT NULL)"
	)) {
		qCritical() << "[SQL] Failed to create attendance:" << q.lastError().text();
		return FpStatus::StoreCorrupt;
	}

	if (!q.exec("CREATE INDEX IF NOT EXISTS idx_att_date ON attendance(date)")) {
		qWarning() << "[SQL] date index create failed:" << q.lastError().text();
	}

	qCDebug(LC_LEDGER) << "[SQL] attendance ready. path=" << db.databaseName()
					   << " driver=" << db.driverName();
	return FpStatus::Ok;
}

FpStatus SqliteAttendanceLedger::record(const AttendanceEntry& entry)
{
	if (entry.subjectId <= 0 || !entry.date.isValid() || !entry.time.isValid()) {
		qWarning() << "[SQL] invalid attendance entry id=" << entry.subjectId;
		return FpStatus::InvalidInput;
	}

	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = ensureOpenConnection();
	if (!db.isOpen()) return FpStatus::IoFailure;

	QSqlQuery q(db);
	q.prepare("INSERT INTO attendance (subject_id, subject_name, date, time, score) "
			  "VALUES (?, ?, ?, ?, ?)");
	q.addBindValue(entry.subjectId);
	q.addBindValue(entry.subjectName.isNull() ? QString("") : entry.subjectName);
	q.addBindValue(entry.date.toString(Qt::ISODate));
	q.addBindValue(entry.time.toString(kTimeFormat));
	q.addBindValue(entry.score);

	if (!q.exec()) {
		qCritical() << "[SQL] Insert attendance failed:" << q.lastError().text();
		return FpStatus::IoFailure;
	}

	qCDebug(LC_LEDGER) << "[SQL] recorded" << entry.subjectId << entry.subjectName
					   << entry.date.toString(Qt::ISODate) << entry.time.toString(kTimeFormat);
	return FpStatus::Ok;
}

FpStatus SqliteAttendanceLedger::entriesFor(const QDate& date, QVector<AttendanceEntry>& out) const
{
	out.clear();
	if (!date.isValid()) return FpStatus::InvalidInput;

	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = ensureOpenConnection();
	if (!db.isOpen()) return FpStatus::IoFailure;

	QSqlQuery q(db);
	q.prepare("SELECT subject_id, subject_name, date, time, score "
			  "FROM attendance WHERE date = ? ORDER BY id ASC");
	q.addBindValue(date.toString(Qt::ISODate));

	if (!q.exec()) {
		qCritical() << "[SQL] select attendance failed:" << q.lastError().text();
		return FpStatus::StoreCorrupt;
	}

	while (q.next()) {
		AttendanceEntry e;
		e.subjectId   = q.value(0).toInt();
		e.subjectName = q.value(1).toString();
		e.date        = QDate::fromString(q.value(2).toString(), Qt::ISODate);
		e.time        = QTime::fromString(q.value(3).toString(), kTimeFormat);
		e.score       = q.value(4).toInt();
		if (!e.date.isValid() || !e.time.isValid()) {
			qCritical() << "[SQL] malformed attendance row for" << date.toString(Qt::ISODate);
			return FpStatus::StoreCorrupt;
		}
		out.push_back(e);
	}
	return FpStatus::Ok;
}

FpStatus SqliteAttendanceLedger::partitions(QVector<QDate>& out) const
{
	out.clear();

	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = ensureOpenConnection();
	if (!db.isOpen()) return FpStatus::IoFailure;

	QSqlQuery q(db);
	if (!q.exec("SELECT DISTINCT date FROM attendance ORDER BY date ASC")) {
		qCritical() << "[SQL] select partitions failed:" << q.lastError().text();
		return FpStatus::StoreCorrupt;
	}
	while (q.next()) {
		const QDate d = QDate::fromString(q.value(0).toString(), Qt::ISODate);
		if (!d.isValid()) return FpStatus::StoreCorrupt;
		out.push_back(d);
	}
	return FpStatus::Ok;
}
