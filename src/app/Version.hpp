#pragma once

// Overridden from CMake with the project version
#ifndef FIELDVERIFY_VERSION_STRING
#define FIELDVERIFY_VERSION_STRING "0.1.0"
#endif
