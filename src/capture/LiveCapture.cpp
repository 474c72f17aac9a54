#include "capture/LiveCapture.hpp"

#include <memory>
#include <QDebug>
#include <QThread>

LiveCapture::LiveCapture()
	: trigger_(autoTrigger(5))
{
}

LiveCapture::~LiveCapture()
{
	close();
}

bool LiveCapture::openCamera()
{
	if (cap_.isOpened()) return true;

	try {
		if (!devPath_.isEmpty()) {
			if (!cap_.open(devPath_.toStdString())) return false;
		} else {
			if (!cap_.open(useIndex_)) return false;
		}
	} catch (const cv::Exception& e) {
		qWarning() << "[LiveCapture] open failed:" << e.what();
		return false;
	}

	if (w_ > 0) cap_.set(cv::CAP_PROP_FRAME_WIDTH,  w_);
	if (h_ > 0) cap_.set(cv::CAP_PROP_FRAME_HEIGHT, h_);
	qInfo() << "[LiveCapture] opened" << describe()
			<< " -> " << int(cap_.get(cv::CAP_PROP_FRAME_WIDTH)) << "x" << int(cap_.get(cv::CAP_PROP_FRAME_HEIGHT));
	return true;
}

void LiveCapture::close()
{
	if (cap_.isOpened()) cap_.release();
}

FpStatus LiveCapture::acquire(cv::Mat& out)
{
	if (!openCamera()) {
		qWarning() << "[LiveCapture] camera unavailable:" << describe();
		return FpStatus::AcquisitionFailed;
	}
	if (!trigger_) {
		qCritical() << "[LiveCapture] no trigger set";
		return FpStatus::AcquisitionFailed;
	}

	int failCount = 0;
	while (true) {
		cv::Mat bgr;
		if (!cap_.read(bgr) || bgr.empty()) {
			if (++failCount >= maxReadFailures_) {
				qWarning() << "[LiveCapture] read fail threshold reached";
				return FpStatus::AcquisitionFailed;
			}
			QThread::msleep(readRetrySleepMs_);
			continue;
		}
		failCount = 0;

		switch (trigger_(bgr)) {
			case TriggerAction::Capture:
				out = bgr.clone();
				return FpStatus::Ok;
			case TriggerAction::Cancel:
				return FpStatus::Cancelled;
			case TriggerAction::Continue:
				break;
		}
	}
}

QString LiveCapture::describe() const
{
	return devPath_.isEmpty() ? QString("[index]%1").arg(useIndex_) : devPath_;
}

LiveCapture::Trigger LiveCapture::autoTrigger(int warmupFrames)
{
	auto seen = std::make_shared<int>(0);
	return [seen, warmupFrames](const cv::Mat&) {
		if (++(*seen) > warmupFrames) {
			*seen = 0;
			return TriggerAction::Capture;
		}
		return TriggerAction::Continue;
	};
}
