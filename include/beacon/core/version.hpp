#pragma once

#define BEACON_VERSION_MAJOR 1
#define BEACON_VERSION_MINOR 0
#define BEACON_VERSION_PATCH 0
#define BEACON_VERSION "1.0.0"
