#include "log/fp_logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QTextStream>
#include <QDebug>
#include <cstdio>

Q_LOGGING_CATEGORY(LC_EXTRACT, "fp.extract")
Q_LOGGING_CATEGORY(LC_MATCH,   "fp.match")
Q_LOGGING_CATEGORY(LC_GALLERY, "fp.gallery")
Q_LOGGING_CATEGORY(LC_LEDGER,  "fp.ledger")
Q_LOGGING_CATEGORY(LC_SESSION, "fp.session")

namespace {
QString			g_logPath;
QMutex			g_logMutex;
QtMessageHandler g_prevHandler = nullptr;

void fileMessageHandler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
	if (g_prevHandler) g_prevHandler(type, ctx, msg);

	QMutexLocker lk(&g_logMutex);
	QFile f(g_logPath);
	if (!f.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
		std::fprintf(stderr, "log file open failed: %s\n", qPrintable(g_logPath));
		return;
	}
	QTextStream ts(&f);
	ts << "[" << QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd hh:mm:ss"))
	   << "] " << qFormatLogMessage(type, ctx, msg) << '\n';
}
} // namespace

namespace FpLogging {

void applyFilterRules(bool verbose)
{
	if (verbose) {
		QLoggingCategory::setFilterRules(QStringLiteral("fp.*.debug=true"));
		return;
	}
	QLoggingCategory::setFilterRules(
			"fp.extract.debug=false\n"
			"fp.match.debug=false\n"
			"fp.gallery.debug=false\n"
			"fp.ledger.debug=false\n"
			"fp.session.debug=false\n"
	);
}

bool installFileLog(const QString& filePath)
{
	if (filePath.isEmpty()) return true;

	// 디렉토리가 없으면 생성
	const QFileInfo fi(filePath);
	if (!QDir().mkpath(fi.absolutePath())) {
		qWarning() << "[FpLogging] log directory create failed:" << fi.absolutePath();
		return false;
	}

	g_logPath = fi.absoluteFilePath();
	g_prevHandler = qInstallMessageHandler(fileMessageHandler);
	return true;
}

} // namespace FpLogging
