#pragma once

#include "log_sink.hpp"
#include <string>

extern LogSink* g_Log;

void setGlobalLogConsole(bool color_enable);
void setGlobalLogCSV(const char* path);

Level getGlobalLogLevel();
void setGlobalLogLevel(Level level);

Level parseLogLevel(const char* slevel);

// discards everything, for tests and quiet embedding
LogSink* getNullLog();
