#pragma once
#include <functional>
#include <opencv2/videoio.hpp>
#include "capture/ImageSource.hpp"

// 카메라 프레임을 폴링하다가 trigger 가 Capture 를 돌려주면 그 프레임을 반환
class LiveCapture : public ImageSource {
public:
	enum class TriggerAction { Continue, Capture, Cancel };
	using Trigger = std::function<TriggerAction(const cv::Mat& bgr)>;

	LiveCapture();
	~LiveCapture() override;

	void setDevice(const QString& devPath) { devPath_ = devPath; useIndex_ = -1; }
	void setCameraIndex(int idx) { useIndex_ = idx; devPath_.clear(); }
	void setResolution(int w, int h) { w_ = w; h_ = h; }
	void setTrigger(Trigger t) { trigger_ = std::move(t); }
	void setMaxReadFailures(int n) { maxReadFailures_ = n; }

	FpStatus acquire(cv::Mat& out) override;
	QString describe() const override;

	void close();

	// warm-up 프레임을 버린 뒤 자동 촬영
	static Trigger autoTrigger(int warmupFrames);

private:
	bool openCamera();

	cv::VideoCapture cap_;
	QString devPath_;
	int useIndex_{0};
	int w_{640}, h_{480};
	int maxReadFailures_{30};
	const int readRetrySleepMs_{10};
	Trigger trigger_;
};
