#pragma once
#define VERSION_MAJOR 0
#define VERSION_MINOR 1
#define VERSION_PATCH 0
