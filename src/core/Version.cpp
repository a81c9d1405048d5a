#include "Version.h"

namespace Quasar {

const char* getVersion()
{
    // QUASAR_VERSION is injected by the build from project(VERSION)
    return QUASAR_VERSION;
}

} // namespace Quasar
