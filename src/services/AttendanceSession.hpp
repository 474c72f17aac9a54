#pragma once
#include <vector>
#include <QDateTime>

#include "include/types.hpp"
#include "config/FpConfig.hpp"
#include "feature/FeatureExtractor.hpp"
#include "enroll/TemplateBuilder.hpp"
#include "match/FingerMatcher.hpp"
#include "match/DecisionEngine.hpp"

class GalleryStore;
class AttendanceLedger;
class ImageSource;

struct EnrollOutcome {
	FpStatus	status = FpStatus::Ok;
	Subject		subject;
	int			attempts = 0;			// 획득 시도 횟수
	int			usableCaptures = 0;
};

struct AuthOutcome {
	FpStatus		status = FpStatus::Ok;
	Verdict			verdict;
	bool			recorded = false;	// 출석부에 기록됐는지
	AttendanceEntry	entry;
};

// 등록/인증 1회 흐름을 묶는 세션. 화면/장치 핸들은 갖지 않는다
// 한 흐름이 끝나기 전에 다른 흐름을 시작하지 않는 것을 전제 (non-reentrant)
class AttendanceSession {
public:
	AttendanceSession(const FpConfig& cfg, DetectorStrategy strategy,
					  GalleryStore& gallery, AttendanceLedger& ledger);

	AttendanceSession(const AttendanceSession&) = delete;
	AttendanceSession& operator=(const AttendanceSession&) = delete;

	// 중복 ID 는 캡처 전에 거절
	EnrollOutcome enroll(const Subject& subject, ImageSource& source);
	EnrollOutcome enrollDescriptors(const Subject& subject, const std::vector<DescriptorSet>& captures);

	// Accept 일 때만 출석부 기록
	AuthOutcome authenticate(ImageSource& source, const QDateTime& now = QDateTime::currentDateTime());
	AuthOutcome authenticateDescriptors(const DescriptorSet& query, const QDateTime& now = QDateTime::currentDateTime());

	DetectorStrategy strategy() const { return extractor_.strategy(); }
	const FeatureExtractor& extractor() const { return extractor_; }
	const FpConfig& config() const { return cfg_; }

private:
	FpStatus checkEnrollable(const Subject& subject) const;

	FpConfig			cfg_;
	GalleryStore&		gallery_;
	AttendanceLedger&	ledger_;
	FeatureExtractor	extractor_;
	TemplateBuilder		builder_;
	FingerMatcher		matcher_;
	DecisionEngine		engine_;
};
