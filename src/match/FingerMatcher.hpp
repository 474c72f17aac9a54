#pragma once
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/features2d.hpp>
#include "include/types.hpp"
#include "include/recog_params.hpp"

// kNN(k=2) + ratio test 매칭기. 점수 = 통과한 대응 개수
// 항상 query = 라이브 캡처, candidate = 저장된 템플릿 순서로 호출할 것
class FingerMatcher {
	public:
		struct Params {
			float ratio       = recog::RATIO_TEST_THR;
			bool  approximate = false;		// FLANN 사용 (실패 시 brute force)
		};

		FingerMatcher() = default;
		explicit FingerMatcher(const Params& p) : p_(p) {}

		int match(const DescriptorSet& query, const DescriptorSet& candidate) const;

		// d1 < ratio * d2
		static bool passesRatioTest(float nearest, float second, float ratio);

		const Params& params() const { return p_; }
		void setParams(const Params& p) { p_ = p; }

	private:
		bool knnExact(const cv::Mat& q, const cv::Mat& c, int normType,
					  std::vector<std::vector<cv::DMatch>>& out) const;
		bool knnApproximate(const cv::Mat& q, const cv::Mat& c, int normType,
							std::vector<std::vector<cv::DMatch>>& out) const;

		Params p_;
};
