#include "match/FingerMatcher.hpp"

#include <opencv2/flann.hpp>
#include <QtCore/QDebug>

#include "log/fp_logging.hpp"

bool FingerMatcher::passesRatioTest(float nearest, float second, float ratio)
{
	return nearest < ratio * second;
}

bool FingerMatcher::knnExact(const cv::Mat& q, const cv::Mat& c, int normType,
								 std::vector<std::vector<cv::DMatch>>& out) const
{
	try {
		cv::BFMatcher bf(normType, /*crossCheck=*/false);
		bf.knnMatch(q, c, out, 2);
		return true;
	} catch (const cv::Exception& e) {
		qWarning() << "[FingerMatcher] BF knnMatch failed:" << e.what();
		return false;
	}
}

bool FingerMatcher::knnApproximate(const cv::Mat& q, const cv::Mat& c, int normType,
									   std::vector<std::vector<cv::DMatch>>& out) const
{
	try {
		cv::Ptr<cv::DescriptorMatcher> flann;
		if (normType == cv::NORM_HAMMING) {
			flann = cv::makePtr<cv::FlannBasedMatcher>(cv::makePtr<cv::flann::LshIndexParams>(6, 12, 1));
		}
		else {
			flann = cv::makePtr<cv::FlannBasedMatcher>();
		}
		flann->knnMatch(q, c, out, 2);
		return true;
	} catch (const cv::Exception& e) {
		qCDebug(LC_MATCH) << "[FingerMatcher] FLANN failed, using brute force:" << e.what();
		out.clear();
		return false;
	}
}

int FingerMatcher::match(const DescriptorSet& query, const DescriptorSet& candidate) const
{
	// 겹칠 게 없으면 0 (에러 아님)
	if (query.empty() || candidate.empty()) return 0;

	cv::Mat q = query.descriptors;
	cv::Mat c = candidate.descriptors;
	if (q.cols != c.cols || q.depth() != c.depth()) {
		qWarning() << "[FingerMatcher] descriptor mismatch: cols" << q.cols << "vs" << c.cols
				   << "depth" << q.depth() << "vs" << c.depth();
		return 0;
	}

	// 이진(ORB) → Hamming, 실수(SIFT) → L2
	int normType = cv::NORM_L2;
	if (q.depth() == CV_8U) {
		normType = cv::NORM_HAMMING;
	}
	else if (q.depth() != CV_32F) {
		q.convertTo(q, CV_32F);
		c.convertTo(c, CV_32F);
	}

	std::vector<std::vector<cv::DMatch>> knn;
	bool ok = false;
	if (p_.approximate) ok = knnApproximate(q, c, normType, knn);
	if (!ok) ok = knnExact(q, c, normType, knn);
	if (!ok) return 0;

	int good = 0;
	for (const auto& pair : knn) {
		if (pair.size() < 2) continue;
		if (passesRatioTest(pair[0].distance, pair[1].distance, p_.ratio)) ++good;
	}

	qCDebug(LC_MATCH) << "[FingerMatcher] query=" << q.rows << "candidate=" << c.rows
					  << "good=" << good;
	return good;
}
