#include "app/PreviewTrigger.hpp"

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

namespace {
constexpr int KEY_SPACE = 32;
constexpr int KEY_ESC   = 27;
}

LiveCapture::Trigger makePreviewTrigger(const QString& windowTitle, const QString& prompt)
{
	const std::string title = windowTitle.toStdString();
	const std::string text  = prompt.toStdString();

	return [title, text](const cv::Mat& bgr) {
		cv::Mat view = bgr.clone();
		cv::putText(view, text, cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 0.7,
					cv::Scalar(0, 255, 0), 2);
		cv::imshow(title, view);

		const int key = cv::waitKey(1);
		if (key == KEY_SPACE) return LiveCapture::TriggerAction::Capture;
		if (key == KEY_ESC)   return LiveCapture::TriggerAction::Cancel;
		return LiveCapture::TriggerAction::Continue;
	};
}

void closePreviewWindows()
{
	cv::destroyAllWindows();
}
