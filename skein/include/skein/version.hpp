#pragma once

#define SKEIN_VERSION "1.0.0"
#define SKEIN_PROTOCOL_VERSION "2024-11-05"
