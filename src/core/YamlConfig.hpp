#pragma once

#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVariantMap>
#include <yaml-cpp/yaml.h>

namespace cvn {

class YamlConfig {
public:
    YamlConfig();

    /// Deep-merge the file over the built-in defaults. Throws YAML::Exception
    /// on unreadable or malformed files.
    void load(const QString& filePath);
    void save(const QString& filePath) const;

    static QString defaultConfigPath();

    // Media server
    uint16_t mediaServerPort() const;
    void setMediaServerPort(uint16_t v);
    /// Resolved asset directory; empty config value maps to ~/.cast-voice-notifier/messages
    QString assetDir() const;
    void setAssetDir(const QString& v);
    QString advertiseAddress() const;
    void setAdvertiseAddress(const QString& v);
    int chunkBytes() const;

    // Notification
    QString defaultTarget() const;
    void setDefaultTarget(const QString& v);
    int notificationVolume() const;
    void setNotificationVolume(int v);
    QString language() const;
    void setLanguage(const QString& v);
    int dequeueTimeoutMs() const;

    // Speech synthesis
    QStringList ttsCommand() const;
    void setTtsCommand(const QStringList& v);
    int ttsTimeoutMs() const;
    int bitrateBps() const;

    // Playback completion
    double activeTimeoutSeconds() const;
    double settleSeconds() const;
    double pollIntervalSeconds() const;
    double flushGraceSeconds() const;
    double minTimeoutSeconds() const;
    double estimateMarginSeconds() const;
    double durationMarginSeconds() const;

    // Restore
    int restoreReadyAttempts() const;
    double restoreReadyIntervalSeconds() const;

    // Shutdown
    double workerTimeoutSeconds() const;
    double drainTimeoutSeconds() const;

    // Cast connection
    int heartbeatIntervalMs() const;
    int heartbeatTimeoutMs() const;
    int reconnectIntervalMs() const;

    QString ipcSocketPath() const;
    void setIpcSocketPath(const QString& v);

    QString logLevel() const;
    void setLogLevel(const QString& v);

    // Static endpoints; each entry is a QVariantMap with {id, name, model, host, port}
    QList<QVariantMap> targets() const;
    void setTargets(const QList<QVariantMap>& targets);

    // Generic dot-path access (e.g. "playback.settle_s")
    QVariant valueByPath(const QString& dottedKey) const;
    bool setValueByPath(const QString& dottedKey, const QVariant& value);

private:
    YAML::Node root_;

    void initDefaults();
    static YAML::Node buildDefaultsNode();
};

} // namespace cvn
