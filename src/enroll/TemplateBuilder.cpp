#include "enroll/TemplateBuilder.hpp"

#include <algorithm>
#include <QDebug>

#include "feature/FeatureExtractor.hpp"
#include "log/fp_logging.hpp"

FpStatus TemplateBuilder::build(const std::vector<DescriptorSet>& captures, FingerTemplate& out) const
{
	// 1) usable + 같은 검출기 캡처만 남김
	std::vector<const DescriptorSet*> usable;
	for (size_t i = 0; i < captures.size(); ++i) {
		const DescriptorSet& c = captures[i];
		if (!FeatureExtractor::isUsable(c, minElements_)) {
			qCDebug(LC_SESSION) << "[TemplateBuilder] capture" << i << "dropped: elements=" << c.elementCount();
			continue;
		}
		if (strategyOf(c) != strategy_) {
			qWarning() << "[TemplateBuilder] capture" << i << "dropped: detector mismatch";
			continue;
		}
		usable.push_back(&c);
	}

	if (usable.empty()) {
		qWarning() << "[TemplateBuilder] No usable captures (" << int(captures.size()) << "given)";
		return FpStatus::InsufficientFeatures;
	}

	// 2) 평균 descriptor: 첫 캡처와 길이/타입이 같은 것만, 행 수는 최소값에 맞춤
	const cv::Mat& first = usable.front()->descriptors;
	std::vector<const cv::Mat*> compatible;
	int rows = first.rows;
	for (const DescriptorSet* c : usable) {
		if (c->descriptors.cols != first.cols || c->descriptors.type() != first.type()) {
			qWarning() << "[TemplateBuilder] shape mismatch:" << c->descriptors.cols << "vs" << first.cols;
			continue;
		}
		rows = std::min(rows, c->descriptors.rows);
		compatible.push_back(&c->descriptors);
	}

	cv::Mat sum = cv::Mat::zeros(rows, first.cols, CV_32F);
	for (const cv::Mat* m : compatible) {
		cv::Mat f;
		m->rowRange(0, rows).convertTo(f, CV_32F);
		sum += f;
	}
	sum /= static_cast<float>(compatible.size());

	FingerTemplate t;
	t.strategy	= strategy_;
	t.primary.keypoints   = usable.front()->keypoints;
	t.primary.descriptors = first.clone();
	t.centroid	= sum;
	t.captures	= int(compatible.size());

	qCDebug(LC_SESSION) << "[TemplateBuilder] built: usable=" << int(usable.size())
						<< "centroid captures=" << t.captures
						<< "primary elements=" << t.primary.elementCount();
	out = std::move(t);
	return FpStatus::Ok;
}
