#include "capture/ImageSource.hpp"

#include <QFileInfo>
#include <QDebug>
#include <opencv2/imgcodecs.hpp>

FpStatus FileSelection::acquire(cv::Mat& out)
{
	if (next_ >= paths_.size()) return FpStatus::Cancelled;

	const QString path = paths_.at(next_++);
	if (!QFileInfo::exists(path)) {
		qWarning() << "[FileSelection] not found:" << path;
		return FpStatus::AcquisitionFailed;
	}

	try {
		out = cv::imread(path.toStdString(), cv::IMREAD_COLOR);
	} catch (const cv::Exception& e) {
		qWarning() << "[FileSelection] imread failed:" << path << e.what();
		out.release();
	}
	if (out.empty()) {
		qWarning() << "[FileSelection] unreadable image:" << path;
		return FpStatus::AcquisitionFailed;
	}

	qDebug() << "[FileSelection] loaded" << path << out.cols << "x" << out.rows;
	return FpStatus::Ok;
}

QString FileSelection::describe() const
{
	return QStringLiteral("files(%1)").arg(paths_.size());
}
