#include "services/FileGalleryStore.hpp"

#include <QDir>
#include <QFile>
#include <QLockFile>
#include <QSaveFile>
#include <QSet>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QDebug>
#include <algorithm>

#include <opencv2/core.hpp>

#include "include/common_path.hpp"
#include "log/fp_logging.hpp"

namespace {
constexpr int kFormatVersion = 1;

bool parseStrategy(const std::string& s, DetectorStrategy& out)
{
	if (s == detectorStrategyName(DetectorStrategy::Primary))  { out = DetectorStrategy::Primary;  return true; }
	if (s == detectorStrategyName(DetectorStrategy::Fallback)) { out = DetectorStrategy::Fallback; return true; }
	return false;
}
} // namespace

FileGalleryStore::FileGalleryStore(const QString& rootDir)
	: root_(rootDir)
{
}

bool FileGalleryStore::init()
{
	const QString tdir = QDir(root_).filePath(QStringLiteral(TEMPLATES_DIR));
	if (!QDir().mkpath(tdir)) {
		qCritical() << "[Gallery] mkpath failed:" << tdir;
		return false;
	}
	qCDebug(LC_GALLERY) << "[Gallery] root=" << root_;
	return true;
}

QString FileGalleryStore::templatePath(int id) const
{
	return QDir(root_).filePath(QStringLiteral(TEMPLATES_DIR) + QString::number(id) + QStringLiteral(TEMPLATE_EXT));
}

QString FileGalleryStore::directoryPath() const
{
	return QDir(root_).filePath(QStringLiteral(SUBJECTS_JSON));
}

QString FileGalleryStore::lockPath() const
{
	return directoryPath() + QStringLiteral(".lock");
}

// === subject 디렉토리 ===
FpStatus FileGalleryStore::loadDirectory(QVector<Subject>& out) const
{
	out.clear();

	QFile f(directoryPath());
	if (!f.exists()) return FpStatus::Ok;		// 아직 등록 없음
	if (!f.open(QIODevice::ReadOnly)) {
		qWarning() << "[Gallery] open failed ->" << directoryPath() << f.errorString();
		return FpStatus::StoreCorrupt;
	}

	QJsonParseError perr;
	const QJsonDocument jd = QJsonDocument::fromJson(f.readAll(), &perr);
	f.close();
	if (perr.error != QJsonParseError::NoError || !jd.isObject()) {
		qCritical() << "[Gallery] subject directory parse error:" << perr.errorString();
		return FpStatus::StoreCorrupt;
	}

	const QJsonValue itemsV = jd.object().value(QStringLiteral("items"));
	if (!itemsV.isArray()) {
		qCritical() << "[Gallery] subject directory has no items array";
		return FpStatus::StoreCorrupt;
	}

	QSet<int> seen;
	for (const QJsonValue& v : itemsV.toArray()) {
		const QJsonObject o = v.toObject();
		const QJsonValue idV = o.value(QStringLiteral("id"));
		const QJsonValue nameV = o.value(QStringLiteral("name"));
		if (!idV.isDouble() || !nameV.isString()) {
			qCritical() << "[Gallery] malformed subject record";
			return FpStatus::StoreCorrupt;
		}

		Subject s;
		s.id   = idV.toInt(-1);
		s.name = nameV.toString();
		if (s.id <= 0 || seen.contains(s.id)) {
			qCritical() << "[Gallery] invalid or duplicated subject id" << s.id;
			return FpStatus::StoreCorrupt;
		}
		seen.insert(s.id);
		out.push_back(s);
	}
	return FpStatus::Ok;
}

bool FileGalleryStore::commitDirectory(const QVector<Subject>& subjects)
{
	QJsonArray items;
	for (const Subject& s : subjects) {
		QJsonObject o;
		o["id"]       = s.id;
		o["name"]     = s.name;
		o["template"] = QStringLiteral(TEMPLATES_DIR) + QString::number(s.id) + QStringLiteral(TEMPLATE_EXT);
		items.append(o);
	}

	QJsonObject root;
	root["version"] = kFormatVersion;
	root["count"]   = int(items.size());
	root["items"]   = items;

	const QByteArray out = QJsonDocument(root).toJson(QJsonDocument::Indented);

	// QSaveFile: 임시 파일에 쓰고 commit 시 rename
	QSaveFile sf(directoryPath());
	if (!sf.open(QIODevice::WriteOnly)) {
		qWarning() << "[Gallery] directory open failed:" << sf.errorString();
		return false;
	}
	if (sf.write(out) != out.size()) {
		qWarning() << "[Gallery] directory write failed:" << sf.errorString();
		sf.cancelWriting();
		return false;
	}
	if (!sf.commit()) {
		qWarning() << "[Gallery] directory commit failed:" << sf.errorString();
		return false;
	}
	return true;
}

// === 템플릿 파일 ===
bool FileGalleryStore::writeTemplateFile(const QString& path, const FingerTemplate& tpl) const
{
	try {
		cv::FileStorage fs(path.toStdString(),
				cv::FileStorage::WRITE | cv::FileStorage::FORMAT_YAML);
		if (!fs.isOpened()) {
			qWarning() << "[Gallery] FileStorage open failed:" << path;
			return false;
		}
		fs << "version"     << kFormatVersion;
		fs << "detector"    << std::string(detectorStrategyName(tpl.strategy));
		fs << "captures"    << tpl.captures;
		fs << "descriptors" << tpl.primary.descriptors;
		cv::write(fs, "keypoints", tpl.primary.keypoints);
		fs << "centroid"    << tpl.centroid;
		fs.release();
	} catch (const cv::Exception& e) {
		qWarning() << "[Gallery] template write failed:" << path << e.what();
		return false;
	}
	return true;
}

FpStatus FileGalleryStore::readTemplateFile(const QString& path, FingerTemplate& out) const
{
	if (!QFile::exists(path)) {
		qCritical() << "[Gallery] template missing for listed subject:" << path;
		return FpStatus::StoreCorrupt;
	}

	try {
		cv::FileStorage fs(path.toStdString(), cv::FileStorage::READ);
		if (!fs.isOpened()) {
			qCritical() << "[Gallery] template unreadable:" << path;
			return FpStatus::StoreCorrupt;
		}

		FingerTemplate t;
		std::string det;
		fs["detector"] >> det;
		if (!parseStrategy(det, t.strategy)) {
			qCritical() << "[Gallery] unknown detector tag" << QString::fromStdString(det) << "in" << path;
			return FpStatus::StoreCorrupt;
		}
		fs["captures"]    >> t.captures;
		fs["descriptors"] >> t.primary.descriptors;
		cv::read(fs["keypoints"], t.primary.keypoints);
		fs["centroid"]    >> t.centroid;

		if (t.primary.empty()) {
			qCritical() << "[Gallery] template has no descriptors:" << path;
			return FpStatus::StoreCorrupt;
		}
		out = std::move(t);
	} catch (const cv::Exception& e) {
		qCritical() << "[Gallery] template parse failed:" << path << e.what();
		return FpStatus::StoreCorrupt;
	}
	return FpStatus::Ok;
}

// === GalleryStore ===
FpStatus FileGalleryStore::put(const Subject& subject, const FingerTemplate& tpl)
{
	const FpStatus v = validateEnrollment(subject, tpl);
	if (v != FpStatus::Ok) return v;

	if (!QDir().mkpath(QDir(root_).filePath(QStringLiteral(TEMPLATES_DIR)))) return FpStatus::IoFailure;

	// 디렉토리 읽기 ~ 커밋 구간은 다른 put(다른 프로세스 포함)과 겹치면 안 됨
	QLockFile lock(lockPath());
	if (!lock.tryLock(lockTimeoutMs_)) {
		qWarning() << "[Gallery] directory lock busy:" << lockPath() << "error=" << int(lock.error());
		return FpStatus::IoFailure;
	}

	QVector<Subject> subjects;
	const FpStatus ls = loadDirectory(subjects);
	if (ls != FpStatus::Ok) return ls;

	for (const Subject& s : subjects) {
		if (s.id == subject.id) {
			qWarning() << "[Gallery] duplicate id" << subject.id;
			return FpStatus::DuplicateId;
		}
	}

	// 1) 템플릿을 임시 파일에 기록
	const QString finalPath = templatePath(subject.id);
	const QString tmpPath   = finalPath + QStringLiteral(".tmp");
	if (!writeTemplateFile(tmpPath, tpl)) {
		QFile::remove(tmpPath);
		return FpStatus::IoFailure;
	}

	// 2) 제자리로 rename (이전 중단으로 남은 미커밋 파일은 교체)
	if (QFile::exists(finalPath)) {
		qCDebug(LC_GALLERY) << "[Gallery] replacing uncommitted template" << finalPath;
		QFile::remove(finalPath);
	}
	if (!QFile::rename(tmpPath, finalPath)) {
		qWarning() << "[Gallery] rename tmp->final failed:" << tmpPath;
		QFile::remove(tmpPath);
		return FpStatus::IoFailure;
	}

	// 3) 디렉토리 커밋. 실패하면 템플릿도 회수
	subjects.push_back(subject);
	if (!commitDirectory(subjects)) {
		QFile::remove(finalPath);
		return FpStatus::IoFailure;
	}

	qInfo() << "[Gallery] enrolled id=" << subject.id << "name=" << subject.name
			<< "detector=" << detectorStrategyName(tpl.strategy);
	return FpStatus::Ok;
}

FpStatus FileGalleryStore::getTemplate(int id, FingerTemplate& out) const
{
	QVector<Subject> subjects;
	const FpStatus ls = loadDirectory(subjects);
	if (ls != FpStatus::Ok) return ls;

	const bool listed = std::any_of(subjects.begin(), subjects.end(),
			[&] (const Subject& s) { return s.id == id; });
	if (!listed) return FpStatus::NotFound;

	return readTemplateFile(templatePath(id), out);
}

FpStatus FileGalleryStore::listSubjects(QVector<Subject>& out) const
{
	return loadDirectory(out);
}

bool FileGalleryStore::exists(int id, FpStatus* status) const
{
	QVector<Subject> subjects;
	const FpStatus ls = loadDirectory(subjects);
	if (status) *status = ls;
	if (ls != FpStatus::Ok) return false;

	return std::any_of(subjects.begin(), subjects.end(),
			[&] (const Subject& s) { return s.id == id; });
}
