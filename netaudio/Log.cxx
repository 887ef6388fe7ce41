#include "Log.hh"

#include <atomic>
#include <cstdlib>
#include <iostream>

using namespace netaudio;

namespace
{
   std::atomic<bool> s_verbose{false};

   void LogHandler(const gchar* /*domain*/, GLogLevelFlags level, const gchar* message, gpointer /*userdata*/)
   {
      if ((level & G_LOG_LEVEL_DEBUG) && !s_verbose)
         return;
      // One write per line, so lines from different threads don't interleave.
      std::cerr << FormatLogLine(level, message) + '\n';
   }
}


void netaudio::InstallLogHandler()
{
   if (getenv("G_MESSAGES_DEBUG"))
      s_verbose = true;
   g_log_set_default_handler(LogHandler, nullptr);
}


void netaudio::SetVerbose(bool verbose)
{
   if (verbose)
      s_verbose = true;
}


std::string netaudio::FormatLogLine(GLogLevelFlags level, const char* message)
{
   const char* prefix = "[DEBUG] ";
   if (level & (G_LOG_LEVEL_ERROR | G_LOG_LEVEL_CRITICAL))
      prefix = "[ERROR] ";
   else if (level & G_LOG_LEVEL_WARNING)
      prefix = "[WARNING] ";
   else if (level & (G_LOG_LEVEL_MESSAGE | G_LOG_LEVEL_INFO))
      prefix = "[INFO] ";
   return std::string(prefix) + (message ? message : "");
}
