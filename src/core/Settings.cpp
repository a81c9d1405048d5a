#include "Settings.h"
#include "ErrorHandling.h"
#include "Logger.h"
#include "../algos/ColorModel.h"
#include "../algos/StretchLUT.h"

#include <QCoreApplication>
#include <QSettings>
#include <QStringList>
#include <memory>

namespace {

std::unique_ptr<QSettings> openStore(const QString& iniPath) {
    if (iniPath.isEmpty()) return std::make_unique<QSettings>("Quasar", "Quasar");
    return std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
}

void rejectKey(const QString& key, const QVariant& value, int& invalid) {
    ++invalid;
    Logger::warning(QString("Invalid setting %1 = '%2', using the default").arg(key, value.toString()), "Settings");
}

int readInt(QSettings& s, const QString& key, int def, bool (*ok)(int), int& invalid) {
    if (!s.contains(key)) return def;
    const QVariant v = s.value(key);
    bool parsed = false;
    const int n = v.toString().toInt(&parsed);
    if (!parsed || !ok(n)) {
        rejectKey(key, v, invalid);
        return def;
    }
    return n;
}

bool readBool(QSettings& s, const QString& key, bool def, int& invalid) {
    if (!s.contains(key)) return def;
    const QVariant v = s.value(key);
    const QString text = v.toString().trimmed().toLower();
    if (text == "true" || text == "1") return true;
    if (text == "false" || text == "0") return false;
    rejectKey(key, v, invalid);
    return def;
}

bool isDepth8or16(int d) { return d == 8 || d == 16; }
bool isLutSize(int n) { return n >= 2 && n <= (1 << 24); }
bool isPositive(int n) { return n >= 1; }

} // namespace

Settings Settings::load(const QString& iniPath, int* invalidCount) {
    auto store = openStore(iniPath);
    QSettings& s = *store;
    Settings cfg;
    int invalid = 0;

    if (s.contains("color/luma_weights")) {
        const QVariant v = s.value("color/luma_weights");
        // QSettings splits comma separated INI values into a string list
        QStringList parts = v.toStringList();
        if (parts.size() == 1) parts = parts.front().split(',');
        bool ok = parts.size() == 3;
        std::array<double, 3> w {};
        for (int i = 0; ok && i < 3; ++i) {
            w[i] = parts[i].trimmed().toDouble(&ok);
            if (ok && w[i] < 0.0) ok = false;
        }
        if (ok && w[0] + w[1] + w[2] <= 0.0) ok = false;
        if (ok) cfg.lumaWeights = w;
        else rejectKey("color/luma_weights", parts.join(','), invalid);
    }

    cfg.defaultDepth = readInt(s, "io/default_depth", cfg.defaultDepth, isDepth8or16, invalid);
    cfg.singleChannelGray = readBool(s, "io/single_channel_gray", cfg.singleChannelGray, invalid);
    cfg.lutSize = readInt(s, "stretch/lut_size", cfg.lutSize, isLutSize, invalid);
    cfg.lutCacheEntries = readInt(s, "stretch/lut_cache_entries", cfg.lutCacheEntries, isPositive, invalid);
    cfg.editorCommand = s.value("editor/command", cfg.editorCommand).toString();
    cfg.editorExportDepth = readInt(s, "editor/export_depth", cfg.editorExportDepth, isDepth8or16, invalid);
    cfg.logDirectory = s.value("log/directory", cfg.logDirectory).toString();
    cfg.maxLogFiles = readInt(s, "log/max_files", cfg.maxLogFiles, isPositive, invalid);

    if (invalidCount) *invalidCount = invalid;
    return cfg;
}

bool Settings::save(const QString& iniPath, QString* errorMsg) const {
    auto store = openStore(iniPath);
    QSettings& s = *store;

    s.setValue("color/luma_weights", QString("%1,%2,%3").arg(lumaWeights[0]).arg(lumaWeights[1]).arg(lumaWeights[2]));
    s.setValue("io/default_depth", defaultDepth);
    s.setValue("io/single_channel_gray", singleChannelGray);
    s.setValue("stretch/lut_size", lutSize);
    s.setValue("stretch/lut_cache_entries", lutCacheEntries);
    s.setValue("editor/command", editorCommand);
    s.setValue("editor/export_depth", editorExportDepth);
    s.setValue("log/directory", logDirectory);
    s.setValue("log/max_files", maxLogFiles);
    s.sync();

    if (s.status() != QSettings::NoError) {
        if (errorMsg) *errorMsg = formatError("Cannot write settings", s.fileName(), static_cast<int>(s.status()));
        return false;
    }
    return true;
}

void Settings::apply() const {
    ColorModel::setLumaWeights(lumaWeights[0], lumaWeights[1], lumaWeights[2]);
    StretchLUTCache::instance().setCapacity(lutCacheEntries);
    Logger::info(QString("Settings applied (luma %1, %2, %3; LUT cache %4 entries)")
                     .arg(lumaWeights[0]).arg(lumaWeights[1]).arg(lumaWeights[2]).arg(lutCacheEntries),
                 "Settings");
}

QString Settings::resolvedLogDirectory() const {
    if (!logDirectory.isEmpty()) return logDirectory;
    return QCoreApplication::applicationDirPath() + "/logs";
}
