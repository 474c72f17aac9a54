#pragma once
#include <opencv2/core.hpp>
#include <opencv2/features2d.hpp>
#include "include/types.hpp"
#include "include/recog_params.hpp"

// 지문 영상 → DescriptorSet
// 전처리(gray → CLAHE → blur → Otsu → 극성 통일) 후 SIFT 또는 ORB 로 검출/기술
class FeatureExtractor {
public:
		struct Options {
				DetectorStrategy strategy = DetectorStrategy::Fallback;
				int    maxFeatures = recog::MAX_FEATURES;
				double claheClip   = recog::CLAHE_CLIP;
				int    claheTile   = recog::CLAHE_TILE;
				int    blurKernel  = recog::BLUR_KSIZE;		// 홀수
		};

		explicit FeatureExtractor(const Options& opt);
		bool isReady() const;
		DetectorStrategy strategy() const { return opt_.strategy; }

		// 빈 영상은 AcquisitionFailed, 검출기가 없으면 DetectorUnavailable
		// 특징이 적어도 Ok (usable 판단은 호출자)
		FpStatus extract(const cv::Mat& image, DescriptorSet& out) const;

		// 검출기에 들어가는 이진 영상 (ridge = 255)
		cv::Mat preprocess(const cv::Mat& src) const;

		static bool isUsable(const DescriptorSet& set, int minElements = recog::MIN_FEATURE_ELEMENTS);

private:
		Options opt_;
		cv::Ptr<cv::Feature2D> detector_;
		bool ready_ = false;
};

// 시작 시 1회: SIFT 생성 가능하면 Primary, 아니면 Fallback
DetectorStrategy probeDetectorStrategy();
