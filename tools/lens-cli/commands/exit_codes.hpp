#pragma once

namespace lens::cli {

// Standard exit codes for CLI commands
// Named with LENS_ prefix to avoid conflict with system macros
constexpr int LENS_EXIT_SUCCESS = 0;
constexpr int LENS_EXIT_USER_ERROR = 1;     // Invalid arguments, unreadable script text
constexpr int LENS_EXIT_INVALID = 2;        // Script failed validation
constexpr int LENS_EXIT_IO_ERROR = 3;       // File read errors
constexpr int LENS_EXIT_INTERNAL = 4;       // Internal/unexpected errors

}  // namespace lens::cli
