#include "services/AttendanceLedger.hpp"

#include <QSaveFile>
#include <QDebug>

#include "include/common_path.hpp"

// 쉼표/따옴표/개행이 있으면 RFC4180 방식으로 감싼다
QString csvField(const QString& s)
{
	if (!s.contains(',') && !s.contains('"') && !s.contains('\n')) return s;
	QString q = s;
	q.replace(QStringLiteral("\""), QStringLiteral("\"\""));
	return QStringLiteral("\"%1\"").arg(q);
}

QString defaultCsvName(const QDate& date)
{
	return QStringLiteral(ATTENDANCE_CSV_PREFIX) + date.toString(Qt::ISODate) + QStringLiteral(".csv");
}

FpStatus exportPartitionCsv(const AttendanceLedger& ledger, const QDate& date, const QString& path)
{
	if (!date.isValid()) return FpStatus::InvalidInput;

	QVector<AttendanceEntry> rows;
	const FpStatus st = ledger.entriesFor(date, rows);
	if (st != FpStatus::Ok) return st;

	QByteArray out("Id,Name,Date,Time,Score\n");
	for (const AttendanceEntry& e : rows) {
		// 이름에 %n 이 있어도 안전하도록 한 번에 치환
		out += QStringLiteral("%1,%2,%3,%4,%5\n")
				.arg(QString::number(e.subjectId),
					 csvField(e.subjectName),
					 e.date.toString(Qt::ISODate),
					 e.time.toString(QStringLiteral("HH:mm:ss")),
					 QString::number(e.score))
				.toUtf8();
	}

	QSaveFile sf(path);
	if (!sf.open(QIODevice::WriteOnly | QIODevice::Text)) {
		qWarning() << "[Attendance] export open failed:" << path << sf.errorString();
		return FpStatus::IoFailure;
	}
	if (sf.write(out) != out.size() || !sf.commit()) {
		qWarning() << "[Attendance] export write failed:" << path << sf.errorString();
		return FpStatus::IoFailure;
	}

	qInfo() << "[Attendance] exported" << rows.size() << "rows to" << path;
	return FpStatus::Ok;
}
