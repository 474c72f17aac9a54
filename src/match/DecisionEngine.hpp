#pragma once
#include "include/types.hpp"
#include "match/FingerMatcher.hpp"

class GalleryStore;

// 판정 파라미터
struct DecisionParams {
	int acceptThreshold    = 0;		// 0 이하면 검출기 기본값
	int minFeatureElements = recog::MIN_FEATURE_ELEMENTS;
};

struct Verdict {
	FpStatus	status   = FpStatus::Ok;		// InsufficientFeatures / NoEnrolledSubjects / StoreCorrupt
	Decision	decision = Decision::Reject;
	MatchResult	best;							// Reject 여도 가장 가까운 후보
	int			threshold  = 0;
	int			candidates = 0;
};

class DecisionEngine {
public:
	explicit DecisionEngine(const FingerMatcher& matcher, const DecisionParams& p = DecisionParams())
		: matcher_(matcher), p_(p) {}

	// 갤러리 전체와 매칭 후 best >= threshold 면 Accept
	Verdict decide(const DescriptorSet& query, const GalleryStore& gallery, int threshold) const;
	Verdict decide(const DescriptorSet& query, const GalleryStore& gallery) const;

	Decision decideScore(int bestScore, int threshold) const;
	static int defaultThreshold(DetectorStrategy s);

	const DecisionParams& params() const { return p_; }
	void setParams(const DecisionParams& p) { p_ = p; }

private:
	const FingerMatcher& matcher_;
	DecisionParams p_;
};
