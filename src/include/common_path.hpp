#pragma once

// Common path (data_dir 기준 상대 경로)
#define FP_DATA_ROOT							"./fingerprint_data/"

// Gallery
#define GALLERY_DIR								"gallery/"
#define TEMPLATES_DIR							"templates/"
#define SUBJECTS_JSON							"subjects.json"
#define TEMPLATE_EXT							".yml"

// Attendance (Sqlite DB)
#define ATTENDANCE_DB							"attendance.db"
#define ATTENDANCE_CSV_PREFIX					"attendance_"
