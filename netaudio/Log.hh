#pragma once

#include <glib.h>

#include <string>

namespace netaudio
{

// Send all glib logging to stderr as "[LEVEL] message" lines. Debug messages
// are only shown once SetVerbose() is called or G_MESSAGES_DEBUG is in the
// environment. g_critical() and g_error() both come out as [ERROR].
void InstallLogHandler();
void SetVerbose(bool verbose);

std::string FormatLogLine(GLogLevelFlags level, const char* message);

}
