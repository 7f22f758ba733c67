#include "AuthPlugin.hpp"
#include "server.hpp"

int main(int argc, char** argv)
{
  return plugrt::framework::serve([](const plugrt::framework::RuntimeConfig& config) { return AuthPlugin::create(config); }, argc, argv);
}
