#pragma once

// Build files pass the project version; these are the fallbacks
#ifndef CONVOFLOW_VERSION_MAJOR
#define CONVOFLOW_VERSION_MAJOR 0
#endif
#ifndef CONVOFLOW_VERSION_MINOR
#define CONVOFLOW_VERSION_MINOR 1
#endif
#ifndef CONVOFLOW_VERSION_PATCH
#define CONVOFLOW_VERSION_PATCH 0
#endif
