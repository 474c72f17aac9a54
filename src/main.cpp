#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDate>
#include <QDir>
#include <QTextStream>
#include <QDebug>
#include <exception>
#include <memory>

#include "config/FpConfig.hpp"
#include "capture/ImageSource.hpp"
#include "capture/LiveCapture.hpp"
#include "app/PreviewTrigger.hpp"
#include "services/AttendanceSession.hpp"
#include "services/FileGalleryStore.hpp"
#include "services/SqliteAttendanceLedger.hpp"
#include "log/fp_logging.hpp"

namespace {

enum ReturnCode { RC_OK = 0, RC_FAIL = 1, RC_USAGE = 2 };

QTextStream& out()
{
	static QTextStream ts(stdout);
	return ts;
}

// 이미지 경로가 있으면 파일, 없으면 카메라
// 숫자 옵션이 잘못되면 nullptr
std::unique_ptr<ImageSource> makeSource(const QCommandLineParser& p, const QString& prompt)
{
	const QStringList images = p.values("image");
	if (!images.isEmpty()) return std::make_unique<FileSelection>(images);

	bool okCam = true, okWarm = true;
	const int camIndex = p.value("camera").toInt(&okCam);
	const int warmup   = p.value("warmup").toInt(&okWarm);
	if (!okCam || camIndex < 0 || !okWarm || warmup < 0) {
		qCritical() << "[fpattend] --camera and --warmup must be non-negative integers";
		return nullptr;
	}

	auto cam = std::make_unique<LiveCapture>();
	if (p.isSet("device")) cam->setDevice(p.value("device"));
	else                   cam->setCameraIndex(camIndex);

	if (p.isSet("preview")) cam->setTrigger(makePreviewTrigger(prompt, prompt));
	else                    cam->setTrigger(LiveCapture::autoTrigger(warmup));
	return cam;
}

int reportFailure(const char* what, FpStatus st)
{
	qWarning() << "[fpattend]" << what << "failed:" << fpStatusName(st);
	out() << what << ": " << fpStatusName(st) << Qt::endl;
	return RC_FAIL;
}

int runEnroll(const QCommandLineParser& p, AttendanceSession& session)
{
	bool okId = false;
	Subject s;
	s.id   = p.value("id").toInt(&okId);
	s.name = p.value("name").trimmed();
	if (!okId || s.id <= 0 || s.name.isEmpty()) {
		out() << "enroll requires --id <positive integer> and --name <name>" << Qt::endl;
		return RC_USAGE;
	}

	auto source = makeSource(p, QStringLiteral("Register - SPACE to capture, ESC to finish"));
	if (!source) return RC_USAGE;
	const EnrollOutcome r = session.enroll(s, *source);
	closePreviewWindows();

	if (r.status != FpStatus::Ok) return reportFailure("enroll", r.status);

	out() << "Registered " << s.name << " with ID " << s.id
		  << " (" << r.usableCaptures << "/" << r.attempts << " usable captures)" << Qt::endl;
	return RC_OK;
}

int runAuth(const QCommandLineParser& p, AttendanceSession& session)
{
	auto source = makeSource(p, QStringLiteral("Login - SPACE to capture"));
	if (!source) return RC_USAGE;
	const AuthOutcome r = session.authenticate(*source);
	closePreviewWindows();

	if (r.status == FpStatus::NoEnrolledSubjects) {
		out() << "No registered users" << Qt::endl;
		return RC_FAIL;
	}
	if (r.status != FpStatus::Ok && r.verdict.decision != Decision::Accept) return reportFailure("auth", r.status);

	if (r.verdict.decision == Decision::Accept) {
		out() << r.verdict.best.name << " (ID: " << r.verdict.best.id << ") authenticated! Score: "
			  << r.verdict.best.score << Qt::endl;
		if (!r.recorded) return reportFailure("attendance record", r.status);
		return RC_OK;
	}

	out() << "Unknown fingerprint. Best score: " << r.verdict.best.score;
	if (r.verdict.best.id > 0) out() << " (closest: " << r.verdict.best.name << ", ID " << r.verdict.best.id << ")";
	out() << Qt::endl;
	return RC_FAIL;
}

int runList(const GalleryStore& gallery)
{
	QVector<Subject> subjects;
	const FpStatus st = gallery.listSubjects(subjects);
	if (st != FpStatus::Ok) return reportFailure("list", st);

	out() << "Id,Name" << Qt::endl;
	for (const Subject& s : subjects) out() << s.id << "," << csvField(s.name) << Qt::endl;
	return RC_OK;
}

bool parseDateOption(const QCommandLineParser& p, QDate& date)
{
	if (!p.isSet("date")) { date = QDate::currentDate(); return true; }
	date = QDate::fromString(p.value("date"), Qt::ISODate);
	return date.isValid();
}

int runAttendance(const QCommandLineParser& p, const AttendanceLedger& ledger)
{
	QDate date;
	if (!parseDateOption(p, date)) {
		out() << "--date must be YYYY-MM-DD" << Qt::endl;
		return RC_USAGE;
	}

	QVector<AttendanceEntry> rows;
	const FpStatus st = ledger.entriesFor(date, rows);
	if (st != FpStatus::Ok) return reportFailure("attendance", st);

	out() << "Id,Name,Date,Time,Score" << Qt::endl;
	for (const AttendanceEntry& e : rows) {
		out() << e.subjectId << "," << csvField(e.subjectName) << "," << e.date.toString(Qt::ISODate) << ","
			  << e.time.toString("HH:mm:ss") << "," << e.score << Qt::endl;
	}
	return RC_OK;
}

int runExport(const QCommandLineParser& p, const AttendanceLedger& ledger, const FpConfig& cfg)
{
	QDate date;
	if (!parseDateOption(p, date)) {
		out() << "--date must be YYYY-MM-DD" << Qt::endl;
		return RC_USAGE;
	}

	const QString path = p.isSet("out") ? p.value("out") : QDir(cfg.dataDir).filePath(defaultCsvName(date));
	const FpStatus st = exportPartitionCsv(ledger, date, path);
	if (st != FpStatus::Ok) return reportFailure("export", st);

	out() << "Exported " << date.toString(Qt::ISODate) << " to " << path << Qt::endl;
	return RC_OK;
}

} // namespace

int main(int argc, char *argv[])
{
	try {
		QCoreApplication app(argc, argv);
		QCoreApplication::setApplicationName(QStringLiteral("fpattend"));
		QCoreApplication::setApplicationVersion(QStringLiteral("1.0"));

		qSetMessagePattern(QStringLiteral("%{time hh:mm:ss.zzz} %{type} %{category} - %{message}"));

		QCommandLineParser parser;
		parser.setApplicationDescription(QStringLiteral("Fingerprint authentication and attendance"));
		parser.addHelpOption();
		parser.addVersionOption();
		parser.addPositionalArgument("command", "enroll | auth | list | attendance | export");
		parser.addOptions({
			{ "config",    "JSON config file.", "file" },
			{ "data-dir",  "Gallery/attendance root directory.", "dir" },
			{ "detector",  "auto, sift or orb.", "name" },
			{ "threshold", "Accept threshold (match count).", "n" },
			{ "ratio",     "Ratio test threshold in (0,1).", "r" },
			{ "captures",  "Usable captures per enrollment.", "n" },
			{ "attempts",  "Acquisition attempts per enrollment (weak captures included).", "n" },
			{ "id",        "Subject id (enroll).", "id" },
			{ "name",      "Subject name (enroll).", "name" },
			{ "image",     "Image file; repeat for several enrollment captures.", "file" },
			{ "camera",    "Camera index.", "index", "0" },
			{ "device",    "Camera device path.", "path" },
			{ "preview",   "Show a preview window (SPACE capture, ESC cancel)." },
			{ "warmup",    "Frames to skip before automatic capture.", "n", "5" },
			{ "date",      "Attendance date YYYY-MM-DD (default today).", "date" },
			{ "out",       "CSV output path (export).", "file" },
			{ "log-file",  "Also append log output to this file.", "file" },
			{ "verbose",   "Enable debug logging." },
		});
		parser.process(app);

		FpLogging::applyFilterRules(parser.isSet("verbose"));
		if (!FpLogging::installFileLog(parser.value("log-file"))) return RC_USAGE;

		const QStringList args = parser.positionalArguments();
		if (args.size() != 1) parser.showHelp(RC_USAGE);
		const QString command = args.first();

		// 설정: 기본값 → 파일 → 커맨드라인
		FpConfig cfg;
		QString err;
		if (parser.isSet("config") && !loadConfigFile(parser.value("config"), cfg, &err)) {
			qCritical() << "[fpattend] config:" << err;
			return RC_USAGE;
		}
		for (const char* opt : { "data-dir", "detector", "threshold", "ratio", "captures", "attempts" }) {
			if (parser.isSet(opt) && !applyOverride(cfg, opt, parser.value(opt), &err)) {
				qCritical() << "[fpattend] option:" << err;
				return RC_USAGE;
			}
		}
		if (!validateConfig(cfg, &err)) {
			qCritical() << "[fpattend] config:" << err;
			return RC_USAGE;
		}

		// 저장소 준비
		FileGalleryStore gallery(cfg.galleryDir());
		if (!gallery.init()) {
			qCritical() << "[fpattend] gallery init failed:" << cfg.galleryDir();
			return RC_FAIL;
		}
		SqliteAttendanceLedger ledger(cfg.attendanceDbPath());
		const FpStatus dbst = ledger.initializeDatabase();
		if (dbst != FpStatus::Ok) return reportFailure("attendance database", dbst);

		if (command == "list")       return runList(gallery);
		if (command == "attendance") return runAttendance(parser, ledger);
		if (command == "export")     return runExport(parser, ledger, cfg);

		const DetectorStrategy strategy = resolveDetectorStrategy(cfg);
		AttendanceSession session(cfg, strategy, gallery, ledger);

		if (command == "enroll") return runEnroll(parser, session);
		if (command == "auth")   return runAuth(parser, session);

		out() << "unknown command: " << command << Qt::endl;
		return RC_USAGE;
	} catch (const std::exception& e) {
		qCritical() << "[" << __func__ << "] Fatal exception: " << e.what();
	} catch (...) {
		qCritical() << "[" << __func__ << "] Unknown fatal exception!";
	}

	return RC_FAIL;
}
