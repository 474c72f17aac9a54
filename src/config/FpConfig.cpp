#include "config/FpConfig.hpp"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QDebug>
#include <climits>
#include <cmath>

#include "feature/FeatureExtractor.hpp"

namespace {
void setError(QString* error, const QString& msg)
{
	if (error) *error = msg;
}

// 키가 없으면 그대로 두고, 타입이 다르면 실패
bool readInt(const QJsonObject& o, const QString& key, int& out, QString* error)
{
	if (!o.contains(key)) return true;
	const QJsonValue v = o.value(key);
	const double d = v.toDouble();
	if (!v.isDouble() || d < INT_MIN || d > INT_MAX || d != std::floor(d)) {
		setError(error, QStringLiteral("%1 must be an integer").arg(key));
		return false;
	}
	out = int(d);
	return true;
}

bool readFloat(const QJsonObject& o, const QString& key, float& out, QString* error)
{
	if (!o.contains(key)) return true;
	const QJsonValue v = o.value(key);
	if (!v.isDouble()) {
		setError(error, QStringLiteral("%1 must be a number").arg(key));
		return false;
	}
	out = float(v.toDouble());
	return true;
}

bool readBool(const QJsonObject& o, const QString& key, bool& out, QString* error)
{
	if (!o.contains(key)) return true;
	const QJsonValue v = o.value(key);
	if (!v.isBool()) {
		setError(error, QStringLiteral("%1 must be true or false").arg(key));
		return false;
	}
	out = v.toBool();
	return true;
}

bool readString(const QJsonObject& o, const QString& key, QString& out, QString* error)
{
	if (!o.contains(key)) return true;
	const QJsonValue v = o.value(key);
	if (!v.isString()) {
		setError(error, QStringLiteral("%1 must be a string").arg(key));
		return false;
	}
	out = v.toString();
	return true;
}
} // namespace

QString FpConfig::galleryDir() const
{
	return QDir(dataDir).filePath(QStringLiteral(GALLERY_DIR));
}

QString FpConfig::attendanceDbPath() const
{
	return QDir(dataDir).filePath(QStringLiteral(ATTENDANCE_DB));
}

bool loadConfigFile(const QString& path, FpConfig& cfg, QString* error)
{
	QFile f(path);
	if (!f.open(QIODevice::ReadOnly)) {
		setError(error, QStringLiteral("open failed: %1 (%2)").arg(path, f.errorString()));
		return false;
	}

	QJsonParseError perr;
	const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
	f.close();
	if (perr.error != QJsonParseError::NoError) {
		setError(error, QStringLiteral("JSON parse error: %1").arg(perr.errorString()));
		return false;
	}
	if (!doc.isObject()) {
		setError(error, QStringLiteral("config root must be an object"));
		return false;
	}

	const QJsonObject o = doc.object();
	FpConfig next = cfg;

	const bool typed =
		readInt(o, "accept_threshold",			next.acceptThreshold, error) &&
		readInt(o, "min_feature_elements",		next.minFeatureElements, error) &&
		readFloat(o, "ratio_test_threshold",	next.ratioTestThreshold, error) &&
		readInt(o, "max_enrollment_captures",	next.maxEnrollmentCaptures, error) &&
		readInt(o, "max_enrollment_attempts",	next.maxEnrollmentAttempts, error) &&
		readInt(o, "max_features",				next.maxFeatures, error) &&
		readBool(o, "approximate_search",		next.approximateSearch, error) &&
		readString(o, "detector",				next.detector, error) &&
		readString(o, "data_dir",				next.dataDir, error);
	if (!typed) return false;

	if (!validateConfig(next, error)) return false;

	cfg = next;
	qInfo() << "[Config] loaded" << path;
	return true;
}

bool applyOverride(FpConfig& cfg, const QString& option, const QString& value, QString* error)
{
	if (option == "data-dir") { cfg.dataDir = value;  return true; }
	if (option == "detector") { cfg.detector = value; return true; }

	bool ok = false;
	if (option == "ratio") {
		const float r = value.toFloat(&ok);
		if (ok) cfg.ratioTestThreshold = r;
	}
	else {
		int* field = nullptr;
		if (option == "threshold")		field = &cfg.acceptThreshold;
		else if (option == "captures")	field = &cfg.maxEnrollmentCaptures;
		else if (option == "attempts")	field = &cfg.maxEnrollmentAttempts;
		else {
			setError(error, QStringLiteral("unknown option --%1").arg(option));
			return false;
		}
		const int n = value.toInt(&ok);
		if (ok) *field = n;
	}

	if (!ok) {
		setError(error, QStringLiteral("--%1: not a number: %2").arg(option, value));
		return false;
	}
	return true;
}

bool validateConfig(const FpConfig& cfg, QString* error)
{
	if (!(cfg.ratioTestThreshold > 0.0f && cfg.ratioTestThreshold < 1.0f)) {
		setError(error, QStringLiteral("ratio_test_threshold must be in (0,1)"));
		return false;
	}
	if (cfg.minFeatureElements <= 0) {
		setError(error, QStringLiteral("min_feature_elements must be positive"));
		return false;
	}
	if (cfg.maxEnrollmentCaptures <= 0) {
		setError(error, QStringLiteral("max_enrollment_captures must be positive"));
		return false;
	}
	if (cfg.maxEnrollmentAttempts < cfg.maxEnrollmentCaptures) {
		setError(error, QStringLiteral("max_enrollment_attempts must be at least max_enrollment_captures"));
		return false;
	}
	if (cfg.maxFeatures <= 0) {
		setError(error, QStringLiteral("max_features must be positive"));
		return false;
	}
	const QString det = cfg.detector.toLower();
	if (det != "auto" && det != "sift" && det != "orb") {
		setError(error, QStringLiteral("detector must be auto, sift or orb"));
		return false;
	}
	if (cfg.dataDir.isEmpty()) {
		setError(error, QStringLiteral("data_dir must not be empty"));
		return false;
	}
	return true;
}

DetectorStrategy resolveDetectorStrategy(const FpConfig& cfg)
{
	const QString det = cfg.detector.toLower();
	if (det == "orb") return DetectorStrategy::Fallback;

	const DetectorStrategy probed = probeDetectorStrategy();
	if (det == "sift" && probed != DetectorStrategy::Primary) {
		qWarning() << "[Config] SIFT requested but unavailable, using ORB";
	}
	return probed;
}
