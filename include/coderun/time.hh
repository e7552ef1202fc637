#pragma once

#include <string>

// Returns current local time in format of "%Y-%m-%d %H:%M:%S" (see strftime(3))
std::string local_datetime();
