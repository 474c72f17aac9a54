#pragma once
#include <map>
#include <QVector>
#include "include/types.hpp"

// 등록 갤러리 (subject 디렉토리 + 템플릿)
// put 은 둘을 한 쌍으로만 반영하고, 읽기는 항상 커밋된 상태만 본다
class GalleryStore {
public:
	virtual ~GalleryStore() = default;

	// 이미 있는 id 는 DuplicateId (덮어쓰기 없음)
	virtual FpStatus put(const Subject& subject, const FingerTemplate& tpl) = 0;
	virtual FpStatus getTemplate(int id, FingerTemplate& out) const = 0;
	// 등록 순서 유지
	virtual FpStatus listSubjects(QVector<Subject>& out) const = 0;
	virtual bool exists(int id, FpStatus* status = nullptr) const = 0;
};

// 프로세스 메모리 갤러리 (descriptor 버퍼만 다루는 호출자/테스트용)
class MemoryGalleryStore : public GalleryStore {
public:
	FpStatus put(const Subject& subject, const FingerTemplate& tpl) override;
	FpStatus getTemplate(int id, FingerTemplate& out) const override;
	FpStatus listSubjects(QVector<Subject>& out) const override;
	bool exists(int id, FpStatus* status = nullptr) const override;

private:
	QVector<Subject>				subjects_;
	std::map<int, FingerTemplate>	templates_;
};

// put 사전 검증 (id > 0, 이름, 비어 있지 않은 primary)
FpStatus validateEnrollment(const Subject& subject, const FingerTemplate& tpl);
