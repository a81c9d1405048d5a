#ifndef QUASAR_SETTINGS_H
#define QUASAR_SETTINGS_H

#include <QString>
#include <array>

/**
 * @brief Persistent application settings backed by QSettings.
 *
 * Default location is the native store for organisation "Quasar", application
 * "Quasar". A path given to load()/save() selects an INI file instead.
 */
struct Settings {
    std::array<double, 3> lumaWeights { 0.3, 0.6, 0.1 };
    int defaultDepth = 8;
    bool singleChannelGray = true;
    int lutSize = 131072;
    int lutCacheEntries = 8;
    QString editorCommand;
    int editorExportDepth = 16;
    QString logDirectory;       // Empty means <app dir>/logs
    int maxLogFiles = 5;

    /**
     * @brief Read and validate every key.
     * Invalid entries fall back to their defaults with a warning. The number of
     * such entries is stored in *invalidCount; callers should save() when it is non-zero.
     */
    static Settings load(const QString& iniPath = QString(), int* invalidCount = nullptr);

    bool save(const QString& iniPath = QString(), QString* errorMsg = nullptr) const;

    /// Push luma weights into ColorModel and size the stretch LUT cache.
    void apply() const;

    QString resolvedLogDirectory() const;
};

#endif // QUASAR_SETTINGS_H
