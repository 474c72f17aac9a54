#pragma once
#include <QString>
#include "capture/LiveCapture.hpp"

// highgui 미리보기 창. SPACE = 촬영, ESC = 취소
LiveCapture::Trigger makePreviewTrigger(const QString& windowTitle, const QString& prompt);
void closePreviewWindows();
