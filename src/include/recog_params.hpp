#pragma once

namespace recog {
	inline constexpr int	MIN_FEATURE_ELEMENTS	= 100;		// 이 값 초과여야 usable
	inline constexpr float	RATIO_TEST_THR			= 0.75f;	// Lowe ratio
	inline constexpr int	MAX_ENROLL_CAPTURES		= 5;
	inline constexpr int	MAX_ENROLL_ATTEMPTS		= 4 * MAX_ENROLL_CAPTURES;	// 약한 캡처 포함 총 획득 횟수
	inline constexpr int	MAX_FEATURES			= 1000;
	inline constexpr int	ACCEPT_THR_BINARY		= 20;		// ORB
	inline constexpr int	ACCEPT_THR_FLOAT		= 30;		// SIFT

	// 전처리
	inline constexpr double	CLAHE_CLIP				= 2.0;
	inline constexpr int	CLAHE_TILE				= 8;
	inline constexpr int	BLUR_KSIZE				= 5;
	inline constexpr double	POLARITY_MEAN			= 127.0;
}
