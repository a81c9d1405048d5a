#ifndef QUASAR_CORE_VERSION_H
#define QUASAR_CORE_VERSION_H

namespace Quasar {
    /**
     * @brief Get the application version string.
     * @return The version string (e.g., "1.2.3").
     */
    const char* getVersion();
}

#endif // QUASAR_CORE_VERSION_H
