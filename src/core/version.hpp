#pragma once

#define TOOLGATE_VERSION_MAJOR 0
#define TOOLGATE_VERSION_MINOR 1
#define TOOLGATE_VERSION_PATCH 0
#define TOOLGATE_VERSION_STRING "0.1.0"
