#pragma once
#include <QString>
#include <QStringList>
#include <opencv2/core.hpp>
#include "include/types.hpp"

// 영상 획득 인터페이스. 코어는 결과 cv::Mat 만 본다
//   Ok                : out 에 영상 1장
//   Cancelled         : 사용자가 끝냄 / 더 줄 영상 없음
//   AcquisitionFailed : 장치/파일에서 영상을 만들지 못함
class ImageSource {
public:
	virtual ~ImageSource() = default;
	virtual FpStatus acquire(cv::Mat& out) = 0;
	virtual QString describe() const = 0;
};

// 파일 선택: 주어진 경로를 순서대로 한 장씩
class FileSelection : public ImageSource {
public:
	explicit FileSelection(const QStringList& paths) : paths_(paths) {}

	FpStatus acquire(cv::Mat& out) override;
	QString describe() const override;

	int remaining() const { return int(paths_.size()) - next_; }

private:
	QStringList paths_;
	int next_ = 0;
};
