#pragma once
#include <vector>
#include <QString>
#include <QDate>
#include <QTime>
#include <opencv2/core.hpp>

// 코어 연산 결과 코드. 모든 실패는 이 값으로 호출자에게 돌려준다
enum class FpStatus {
	Ok = 0,
	InsufficientFeatures,	// 특징점 부족 → 재촬영 유도
	DuplicateId,			// 등록 ID 충돌
	NotFound,				// 미등록 ID 조회
	NoEnrolledSubjects,		// 갤러리 비어 있음
	AcquisitionFailed,		// 영상 획득 실패
	Cancelled,				// 사용자가 획득 취소
	StoreCorrupt,			// 저장소 파싱 실패
	IoFailure,				// 저장소 쓰기 실패
	InvalidInput,			// 잘못된 ID/이름/파라미터
	DetectorUnavailable		// 특징 검출기 생성 실패 → 재촬영해도 소용없음
};

inline const char* fpStatusName(FpStatus s)
{
	switch (s) {
		case FpStatus::Ok:						return "Ok";
		case FpStatus::InsufficientFeatures:	return "InsufficientFeatures";
		case FpStatus::DuplicateId:				return "DuplicateId";
		case FpStatus::NotFound:				return "NotFound";
		case FpStatus::NoEnrolledSubjects:		return "NoEnrolledSubjects";
		case FpStatus::AcquisitionFailed:		return "AcquisitionFailed";
		case FpStatus::Cancelled:				return "Cancelled";
		case FpStatus::StoreCorrupt:			return "StoreCorrupt";
		case FpStatus::IoFailure:				return "IoFailure";
		case FpStatus::InvalidInput:			return "InvalidInput";
		case FpStatus::DetectorUnavailable:		return "DetectorUnavailable";
	}
	return "Unknown";
}

// Primary = SIFT(float, L2), Fallback = ORB(binary, Hamming)
enum class DetectorStrategy {
	Primary = 0,
	Fallback
};

inline const char* detectorStrategyName(DetectorStrategy s)
{
	return s == DetectorStrategy::Primary ? "sift" : "orb";
}

// 최종 판정
enum class Decision {
	Reject = 0,
	Accept
};

// 한 장의 영상에서 뽑은 특징 집합
struct DescriptorSet {
	std::vector<cv::KeyPoint>	keypoints;		// 기하 정보 (매칭 점수에는 미사용)
	cv::Mat						descriptors;	// N x D, 행 하나가 특징 벡터 1개

	bool empty() const { return descriptors.empty() || descriptors.rows == 0; }
	int  elementCount() const { return empty() ? 0 : descriptors.rows * descriptors.cols; }
};

// 디스크립터 타입으로 생성한 검출기를 역추정
inline DetectorStrategy strategyOf(const DescriptorSet& set)
{
	return set.descriptors.depth() == CV_8U ? DetectorStrategy::Fallback : DetectorStrategy::Primary;
}

// 등록 결과물
struct FingerTemplate {
	DetectorStrategy	strategy = DetectorStrategy::Fallback;
	DescriptorSet		primary;			// 첫 번째 유효 캡처 그대로 (매칭용)
	cv::Mat				centroid;			// 유효 캡처 평균, CV_32F (보관용)
	int					captures = 0;		// centroid 에 반영된 캡처 수
};

struct Subject {
	int		id = -1;
	QString	name;
};

// 매칭 결과
struct MatchResult {
	int		id    = -1;
	QString	name;
	int		score = 0;		// ratio test 통과 개수
};

struct AttendanceEntry {
	int		subjectId = -1;
	QString	subjectName;
	QDate	date;
	QTime	time;
	int		score = 0;
};
