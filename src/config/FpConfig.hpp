#pragma once
#include <QString>
#include "include/types.hpp"
#include "include/recog_params.hpp"
#include "include/common_path.hpp"

// 실행 파라미터. JSON 설정 파일 → 커맨드라인 순으로 덮어쓴다
struct FpConfig {
	int		acceptThreshold			= 0;	// 0 이하면 검출기 기본값 (ORB 20 / SIFT 30)
	int		minFeatureElements		= recog::MIN_FEATURE_ELEMENTS;
	float	ratioTestThreshold		= recog::RATIO_TEST_THR;
	int		maxEnrollmentCaptures	= recog::MAX_ENROLL_CAPTURES;
	int		maxEnrollmentAttempts	= recog::MAX_ENROLL_ATTEMPTS;
	int		maxFeatures				= recog::MAX_FEATURES;
	bool	approximateSearch		= false;
	QString	detector				= QStringLiteral("auto");	// auto | sift | orb
	QString	dataDir					= QStringLiteral(FP_DATA_ROOT);

	QString galleryDir() const;
	QString attendanceDbPath() const;
};

bool loadConfigFile(const QString& path, FpConfig& cfg, QString* error = nullptr);
bool validateConfig(const FpConfig& cfg, QString* error = nullptr);

// 커맨드라인 옵션 하나를 덮어쓴다 (data-dir, detector, threshold, ratio, captures, attempts)
// 숫자 옵션이 숫자가 아니면 false, cfg 는 그 필드만 바뀌지 않는다
bool applyOverride(FpConfig& cfg, const QString& option, const QString& value, QString* error = nullptr);

// detector 옵션 + 실제 사용 가능 여부로 전략 결정
DetectorStrategy resolveDetectorStrategy(const FpConfig& cfg);
