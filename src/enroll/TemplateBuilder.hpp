#pragma once
#include <vector>
#include "include/types.hpp"
#include "include/recog_params.hpp"

// 여러 번의 등록 캡처를 FingerTemplate 하나로 합친다
class TemplateBuilder {
public:
	TemplateBuilder(DetectorStrategy strategy, int minFeatureElements = recog::MIN_FEATURE_ELEMENTS)
		: strategy_(strategy), minElements_(minFeatureElements) {}

	// 유효 캡처가 하나도 없으면 InsufficientFeatures, out 은 건드리지 않음
	FpStatus build(const std::vector<DescriptorSet>& captures, FingerTemplate& out) const;

	DetectorStrategy strategy() const { return strategy_; }

private:
	DetectorStrategy strategy_;
	int minElements_;
};
