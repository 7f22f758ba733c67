#include "LoggingPlugin.hpp"
#include "server.hpp"

int main(int argc, char** argv)
{
  return plugrt::framework::serve([](const plugrt::framework::RuntimeConfig&) { return LoggingPlugin::create(); }, argc, argv);
}
