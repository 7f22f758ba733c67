#include "SimplePlugin.hpp"
#include "server.hpp"

int main(int argc, char** argv)
{
  return plugrt::framework::serve([](const plugrt::framework::RuntimeConfig&) { return SimplePlugin::create(); }, argc, argv);
}
