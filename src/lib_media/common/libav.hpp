#pragma once

#include <string>

std::string avStrError(int err);

// routes the libav messages to the global log, once per process
void setupLibavLogging();
