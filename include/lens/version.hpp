#pragma once

#define LENS_VERSION_MAJOR 1
#define LENS_VERSION_MINOR 0
#define LENS_VERSION_PATCH 0
#define LENS_VERSION_STRING "scriptlens 1.0.0"
