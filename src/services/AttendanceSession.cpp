#include "services/AttendanceSession.hpp"

#include <QDebug>

#include "capture/ImageSource.hpp"
#include "services/GalleryStore.hpp"
#include "services/AttendanceLedger.hpp"
#include "log/fp_logging.hpp"

namespace {
FeatureExtractor::Options extractorOptions(const FpConfig& cfg, DetectorStrategy s)
{
	FeatureExtractor::Options o;
	o.strategy    = s;
	o.maxFeatures = cfg.maxFeatures;
	return o;
}
} // namespace

AttendanceSession::AttendanceSession(const FpConfig& cfg, DetectorStrategy strategy,
									 GalleryStore& gallery, AttendanceLedger& ledger)
	: cfg_(cfg),
	  gallery_(gallery),
	  ledger_(ledger),
	  extractor_(extractorOptions(cfg, strategy)),
	  builder_(extractor_.strategy(), cfg.minFeatureElements),
	  matcher_(FingerMatcher::Params{ cfg.ratioTestThreshold, cfg.approximateSearch }),
	  engine_(matcher_, DecisionParams{ cfg.acceptThreshold, cfg.minFeatureElements })
{
	qCDebug(LC_SESSION) << "[Session] detector=" << detectorStrategyName(extractor_.strategy())
						<< "threshold=" << cfg_.acceptThreshold
						<< "ratio=" << cfg_.ratioTestThreshold;
}

FpStatus AttendanceSession::checkEnrollable(const Subject& subject) const
{
	if (subject.id <= 0 || subject.name.trimmed().isEmpty()) {
		qWarning() << "[Session] invalid subject id=" << subject.id;
		return FpStatus::InvalidInput;
	}

	FpStatus st = FpStatus::Ok;
	const bool dup = gallery_.exists(subject.id, &st);
	if (st != FpStatus::Ok) return st;
	if (dup) {
		qWarning() << "[Session] ID already exists:" << subject.id;
		return FpStatus::DuplicateId;
	}
	return FpStatus::Ok;
}

// === 등록 ===
EnrollOutcome AttendanceSession::enroll(const Subject& subject, ImageSource& source)
{
	EnrollOutcome r;
	r.subject = subject;

	// 1) 캡처 전에 ID 검사
	r.status = checkEnrollable(subject);
	if (r.status != FpStatus::Ok) return r;

	// 2) 최대 N 장의 usable 캡처 수집 (취소 또는 시도 횟수 소진 시 모인 만큼)
	std::vector<DescriptorSet> captures;
	while (int(captures.size()) < cfg_.maxEnrollmentCaptures) {
		if (r.attempts >= cfg_.maxEnrollmentAttempts) {
			qWarning() << "[Session] enrollment attempts exhausted:" << r.attempts
					   << "usable=" << int(captures.size());
			break;
		}

		cv::Mat image;
		const FpStatus as = source.acquire(image);
		if (as == FpStatus::Cancelled) break;
		++r.attempts;
		if (as != FpStatus::Ok) {
			qWarning() << "[Session] acquisition failed during enrollment:" << source.describe();
			r.status = as;
			return r;
		}

		DescriptorSet ds;
		const FpStatus es = extractor_.extract(image, ds);
		if (es != FpStatus::Ok && es != FpStatus::InsufficientFeatures) {
			r.status = es;
			return r;
		}
		if (es != FpStatus::Ok || !FeatureExtractor::isUsable(ds, cfg_.minFeatureElements)) {
			qInfo() << "[Session] Poor quality capture, elements=" << ds.elementCount();
			continue;
		}

		captures.push_back(std::move(ds));
		qInfo() << "[Session] Capture" << int(captures.size()) << "successful";
	}

	// 3) 템플릿 생성 + 저장
	const EnrollOutcome built = enrollDescriptors(subject, captures);
	r.status = built.status;
	r.usableCaptures = built.usableCaptures;
	return r;
}

EnrollOutcome AttendanceSession::enrollDescriptors(const Subject& subject, const std::vector<DescriptorSet>& captures)
{
	EnrollOutcome r;
	r.subject  = subject;
	r.attempts = int(captures.size());

	r.status = checkEnrollable(subject);
	if (r.status != FpStatus::Ok) return r;

	for (const DescriptorSet& c : captures) {
		if (FeatureExtractor::isUsable(c, cfg_.minFeatureElements)) ++r.usableCaptures;
	}

	FingerTemplate tpl;
	r.status = builder_.build(captures, tpl);
	if (r.status != FpStatus::Ok) return r;

	r.status = gallery_.put(subject, tpl);
	if (r.status == FpStatus::Ok) {
		qInfo() << "[Session] Registered" << subject.name << "with ID" << subject.id;
	}
	return r;
}

// === 인증 ===
AuthOutcome AttendanceSession::authenticate(ImageSource& source, const QDateTime& now)
{
	AuthOutcome r;

	cv::Mat image;
	r.status = source.acquire(image);
	if (r.status != FpStatus::Ok) return r;

	DescriptorSet live;
	r.status = extractor_.extract(image, live);
	if (r.status != FpStatus::Ok) return r;

	return authenticateDescriptors(live, now);
}

AuthOutcome AttendanceSession::authenticateDescriptors(const DescriptorSet& query, const QDateTime& now)
{
	AuthOutcome r;
	r.verdict = engine_.decide(query, gallery_);
	r.status  = r.verdict.status;
	if (r.status != FpStatus::Ok) return r;

	if (r.verdict.decision != Decision::Accept) {
		qInfo() << "[Session] Unknown fingerprint. Best score:" << r.verdict.best.score;
		return r;
	}

	r.entry.subjectId   = r.verdict.best.id;
	r.entry.subjectName = r.verdict.best.name;
	r.entry.date        = now.date();
	r.entry.time        = now.time();
	r.entry.score       = r.verdict.best.score;

	r.status   = ledger_.record(r.entry);
	r.recorded = (r.status == FpStatus::Ok);

	qInfo() << "[Session]" << r.entry.subjectName << "(ID:" << r.entry.subjectId << ") authenticated! Score:"
			<< r.entry.score << (r.recorded ? "" : "(attendance write failed)");
	return r;
}
