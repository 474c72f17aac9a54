#include "FeatureExtractor.hpp"

#include <opencv2/imgproc.hpp>
#include <QDebug>

#include "log/fp_logging.hpp"

FeatureExtractor::FeatureExtractor(const Options& opt) : opt_(opt)
{
	if (opt_.maxFeatures <= 0) {
		qCritical() << "[FeatureExtractor] invalid maxFeatures=" << opt_.maxFeatures;
		return;
	}

	try {
		if (opt_.strategy == DetectorStrategy::Primary) {
			detector_ = cv::SIFT::create(opt_.maxFeatures);
		}
		else {
			detector_ = cv::ORB::create(opt_.maxFeatures);
		}
		ready_ = !detector_.empty();
	} catch (const cv::Exception& e) {
		qWarning() << "[FeatureExtractor] detector create failed:" << e.what();
		ready_ = false;
	}

	// Primary 생성 실패 → ORB 로 대체하고 전략 기록도 바꿈
	if (!ready_ && opt_.strategy == DetectorStrategy::Primary) {
		qWarning() << "[FeatureExtractor] SIFT unavailable, falling back to ORB";
		opt_.strategy = DetectorStrategy::Fallback;
		detector_ = cv::ORB::create(opt_.maxFeatures);
		ready_ = !detector_.empty();
	}

	qCDebug(LC_EXTRACT) << "[FeatureExtractor] ready=" << ready_
						<< "detector=" << detectorStrategyName(opt_.strategy)
						<< "maxFeatures=" << opt_.maxFeatures;
}

bool FeatureExtractor::isReady() const { return ready_; }

bool FeatureExtractor::isUsable(const DescriptorSet& set, int minElements)
{
	return set.elementCount() > minElements;
}

cv::Mat FeatureExtractor::preprocess(const cv::Mat& src) const
{
	if (src.empty()) {
		qWarning() << "[preprocess] ERR: src empty";
		return cv::Mat();
	}

	// ── 1) grayscale ─────────────────────────────────────────────────────
	cv::Mat gray;
	switch (src.channels()) {
		case 1:  gray = src; break;
		case 3:  cv::cvtColor(src, gray, cv::COLOR_BGR2GRAY); break;
		case 4:  cv::cvtColor(src, gray, cv::COLOR_BGRA2GRAY); break;
		default:
			qWarning() << "[preprocess] ERR: unsupported channels=" << src.channels();
			return cv::Mat();
	}
	if (gray.depth() != CV_8U) {
		cv::normalize(gray, gray, 0, 255, cv::NORM_MINMAX, CV_8U);
	}

	// ── 2) 조명 불균일 보정 (CLAHE) ────────────────────────────────────────
	cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(opt_.claheClip, cv::Size(opt_.claheTile, opt_.claheTile));
	cv::Mat enhanced;
	clahe->apply(gray, enhanced);

	// ── 3) 센서 노이즈 완화 ──────────────────────────────────────────────
	cv::Mat blurred;
	cv::GaussianBlur(enhanced, blurred, cv::Size(opt_.blurKernel, opt_.blurKernel), 0);

	// ── 4) Otsu 이진화 ───────────────────────────────────────────────────
	cv::Mat binary;
	cv::threshold(blurred, binary, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);

	// ── 5) 극성 통일: ridge 가 항상 밝은 쪽 ───────────────────────────────
	if (cv::mean(binary)[0] < recog::POLARITY_MEAN) {
		cv::bitwise_not(binary, binary);
	}
	return binary;
}

FpStatus FeatureExtractor::extract(const cv::Mat& image, DescriptorSet& out) const
{
	out = DescriptorSet{};
	if (image.empty()) {
		qWarning() << "[extract] empty image";
		return FpStatus::AcquisitionFailed;
	}
	if (!ready_) {
		qCritical() << "[extract] detector not ready";
		return FpStatus::DetectorUnavailable;
	}

	const cv::Mat binary = preprocess(image);
	if (binary.empty()) return FpStatus::AcquisitionFailed;

	try {
		detector_->detectAndCompute(binary, cv::noArray(), out.keypoints, out.descriptors);
	}
	catch (const cv::Exception& e) {
		qWarning() << "[extract][cv::Exception]" << e.what();
		out = DescriptorSet{};
		return FpStatus::InsufficientFeatures;
	}

	qCDebug(LC_EXTRACT) << "[extract]" << detectorStrategyName(opt_.strategy)
						<< "keypoints=" << int(out.keypoints.size())
						<< "elements=" << out.elementCount();
	return FpStatus::Ok;
}

DetectorStrategy probeDetectorStrategy()
{
	try {
		cv::Ptr<cv::SIFT> sift = cv::SIFT::create();
		if (!sift.empty()) return DetectorStrategy::Primary;
	} catch (const cv::Exception& e) {
		qWarning() << "[probeDetectorStrategy] SIFT probe failed:" << e.what();
	}
	return DetectorStrategy::Fallback;
}
