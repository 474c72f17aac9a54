#pragma once
#include <QString>
#include <QVector>
#include "services/GalleryStore.hpp"

// 디스크 갤러리
//   <root>/templates/<id>.yml   cv::FileStorage YAML (float 9자리 → 손실 없음)
//   <root>/subjects.json        subject 디렉토리 (커밋 지점)
// 디렉토리에 없는 템플릿 파일은 미커밋 상태로 보고 무시한다
class FileGalleryStore : public GalleryStore {
public:
	explicit FileGalleryStore(const QString& rootDir);

	bool init();		// 디렉토리 생성
	const QString& rootDir() const { return root_; }

	FpStatus put(const Subject& subject, const FingerTemplate& tpl) override;
	FpStatus getTemplate(int id, FingerTemplate& out) const override;
	FpStatus listSubjects(QVector<Subject>& out) const override;
	bool exists(int id, FpStatus* status = nullptr) const override;

	QString templatePath(int id) const;
	QString directoryPath() const;
	QString lockPath() const;

	// put 이 디렉토리 잠금을 기다리는 최대 시간 (ms)
	void setLockTimeout(int ms) { lockTimeoutMs_ = ms; }

protected:
	// subjects.json 전체를 원자적으로 교체
	virtual bool commitDirectory(const QVector<Subject>& subjects);

	bool writeTemplateFile(const QString& path, const FingerTemplate& tpl) const;
	FpStatus readTemplateFile(const QString& path, FingerTemplate& out) const;
	FpStatus loadDirectory(QVector<Subject>& out) const;

private:
	QString root_;
	int lockTimeoutMs_ = 5000;
};
