#include "core/YamlConfig.hpp"
#include <QDir>
#include <fstream>

namespace cvn {

namespace {

// Mappings recurse; sequences and scalars from the overlay replace the base.
YAML::Node overlayYaml(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);
    if (!base.IsDefined() || base.IsNull() || !base.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node merged = YAML::Clone(base);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        merged[key] = merged[key] ? overlayYaml(merged[key], it->second)
                                  : YAML::Clone(it->second);
    }
    return merged;
}

QVariant scalarToVariant(const YAML::Node& node)
{
    if (!node.IsScalar()) return {};

    const QString s = QString::fromStdString(node.Scalar());
    if (s == QLatin1String("true")) return QVariant(true);
    if (s == QLatin1String("false")) return QVariant(false);

    bool ok = false;
    int i = s.toInt(&ok);
    if (ok) return QVariant(i);
    double d = s.toDouble(&ok);
    if (ok) return QVariant(d);

    return QVariant(s);
}

QString str(const YAML::Node& node, const char* fallback)
{
    return QString::fromStdString(node.as<std::string>(fallback));
}

} // namespace

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["media_server"]["port"] = 15555;
    root_["media_server"]["asset_dir"] = "";
    root_["media_server"]["advertise_address"] = "";
    root_["media_server"]["chunk_bytes"] = 16384;

    root_["notification"]["default_target"] = "";
    root_["notification"]["volume"] = 50;
    root_["notification"]["language"] = "en";
    root_["notification"]["dequeue_timeout_ms"] = 1000;

    YAML::Node command(YAML::NodeType::Sequence);
    for (const char* arg : {"gtts-cli", "--lang", "{lang}", "--output", "{output}", "{text}"})
        command.push_back(arg);
    root_["tts"]["command"] = command;
    root_["tts"]["timeout_ms"] = 30000;
    root_["tts"]["bitrate_bps"] = 64000;

    root_["playback"]["active_timeout_s"] = 10.0;
    root_["playback"]["settle_s"] = 1.5;
    root_["playback"]["poll_interval_s"] = 0.5;
    root_["playback"]["flush_grace_s"] = 2.0;
    root_["playback"]["min_timeout_s"] = 15.0;
    root_["playback"]["estimate_margin_s"] = 10.0;
    root_["playback"]["duration_margin_s"] = 5.0;

    root_["restore"]["ready_attempts"] = 10;
    root_["restore"]["ready_interval_s"] = 1.0;

    root_["shutdown"]["worker_timeout_s"] = 30.0;
    root_["shutdown"]["drain_timeout_s"] = 5.0;

    root_["cast"]["heartbeat_interval_ms"] = 5000;
    root_["cast"]["heartbeat_timeout_ms"] = 15000;
    root_["cast"]["reconnect_interval_ms"] = 5000;

    root_["ipc"]["socket_path"] = "/tmp/cast-voice-notifier.sock";

    root_["logging"]["level"] = "info";

    root_["targets"] = YAML::Node(YAML::NodeType::Sequence);
}

void YamlConfig::load(const QString& filePath)
{
    initDefaults();
    YAML::Node defaults = YAML::Clone(root_);
    root_ = overlayYaml(defaults, YAML::LoadFile(filePath.toStdString()));
}

void YamlConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    fout << root_;
}

QString YamlConfig::defaultConfigPath()
{
    return QDir::homePath() + "/.cast-voice-notifier/config.yaml";
}

// --- Media server ---

uint16_t YamlConfig::mediaServerPort() const
{
    return static_cast<uint16_t>(root_["media_server"]["port"].as<int>(15555));
}

void YamlConfig::setMediaServerPort(uint16_t v)
{
    root_["media_server"]["port"] = static_cast<int>(v);
}

QString YamlConfig::assetDir() const
{
    QString dir = str(root_["media_server"]["asset_dir"], "");
    if (dir.isEmpty())
        return QDir::homePath() + "/.cast-voice-notifier/messages";
    if (dir.startsWith("~/"))
        return QDir::homePath() + dir.mid(1);
    return dir;
}

void YamlConfig::setAssetDir(const QString& v)
{
    root_["media_server"]["asset_dir"] = v.toStdString();
}

QString YamlConfig::advertiseAddress() const
{
    return str(root_["media_server"]["advertise_address"], "");
}

void YamlConfig::setAdvertiseAddress(const QString& v)
{
    root_["media_server"]["advertise_address"] = v.toStdString();
}

int YamlConfig::chunkBytes() const
{
    return root_["media_server"]["chunk_bytes"].as<int>(16384);
}

// --- Notification ---

QString YamlConfig::defaultTarget() const
{
    return str(root_["notification"]["default_target"], "");
}

void YamlConfig::setDefaultTarget(const QString& v)
{
    root_["notification"]["default_target"] = v.toStdString();
}

int YamlConfig::notificationVolume() const
{
    return qBound(0, root_["notification"]["volume"].as<int>(50), 100);
}

void YamlConfig::setNotificationVolume(int v)
{
    root_["notification"]["volume"] = v;
}

QString YamlConfig::language() const
{
    return str(root_["notification"]["language"], "en");
}

void YamlConfig::setLanguage(const QString& v)
{
    root_["notification"]["language"] = v.toStdString();
}

int YamlConfig::dequeueTimeoutMs() const
{
    return root_["notification"]["dequeue_timeout_ms"].as<int>(1000);
}

// --- Speech synthesis ---

QStringList YamlConfig::ttsCommand() const
{
    QStringList result;
    if (root_["tts"]["command"].IsSequence()) {
        for (const auto& node : root_["tts"]["command"])
            result.append(QString::fromStdString(node.as<std::string>()));
    }
    return result;
}

void YamlConfig::setTtsCommand(const QStringList& v)
{
    YAML::Node node(YAML::NodeType::Sequence);
    for (const auto& arg : v)
        node.push_back(arg.toStdString());
    root_["tts"]["command"] = node;
}

int YamlConfig::ttsTimeoutMs() const
{
    return root_["tts"]["timeout_ms"].as<int>(30000);
}

int YamlConfig::bitrateBps() const
{
    return root_["tts"]["bitrate_bps"].as<int>(64000);
}

// --- Playback completion ---

double YamlConfig::activeTimeoutSeconds() const
{
    return root_["playback"]["active_timeout_s"].as<double>(10.0);
}

double YamlConfig::settleSeconds() const
{
    return root_["playback"]["settle_s"].as<double>(1.5);
}

double YamlConfig::pollIntervalSeconds() const
{
    return root_["playback"]["poll_interval_s"].as<double>(0.5);
}

double YamlConfig::flushGraceSeconds() const
{
    return root_["playback"]["flush_grace_s"].as<double>(2.0);
}

double YamlConfig::minTimeoutSeconds() const
{
    return root_["playback"]["min_timeout_s"].as<double>(15.0);
}

double YamlConfig::estimateMarginSeconds() const
{
    return root_["playback"]["estimate_margin_s"].as<double>(10.0);
}

double YamlConfig::durationMarginSeconds() const
{
    return root_["playback"]["duration_margin_s"].as<double>(5.0);
}

// --- Restore ---

int YamlConfig::restoreReadyAttempts() const
{
    return root_["restore"]["ready_attempts"].as<int>(10);
}

double YamlConfig::restoreReadyIntervalSeconds() const
{
    return root_["restore"]["ready_interval_s"].as<double>(1.0);
}

// --- Shutdown ---

double YamlConfig::workerTimeoutSeconds() const
{
    return root_["shutdown"]["worker_timeout_s"].as<double>(30.0);
}

double YamlConfig::drainTimeoutSeconds() const
{
    return root_["shutdown"]["drain_timeout_s"].as<double>(5.0);
}

// --- Cast connection ---

int YamlConfig::heartbeatIntervalMs() const
{
    return root_["cast"]["heartbeat_interval_ms"].as<int>(5000);
}

int YamlConfig::heartbeatTimeoutMs() const
{
    return root_["cast"]["heartbeat_timeout_ms"].as<int>(15000);
}

int YamlConfig::reconnectIntervalMs() const
{
    return root_["cast"]["reconnect_interval_ms"].as<int>(5000);
}

// --- IPC / logging ---

QString YamlConfig::ipcSocketPath() const
{
    return str(root_["ipc"]["socket_path"], "/tmp/cast-voice-notifier.sock");
}

void YamlConfig::setIpcSocketPath(const QString& v)
{
    root_["ipc"]["socket_path"] = v.toStdString();
}

QString YamlConfig::logLevel() const
{
    return str(root_["logging"]["level"], "info");
}

void YamlConfig::setLogLevel(const QString& v)
{
    root_["logging"]["level"] = v.toStdString();
}

// --- Targets ---

QList<QVariantMap> YamlConfig::targets() const
{
    QList<QVariantMap> result;
    auto targets = root_["targets"];
    if (!targets.IsSequence()) return result;

    for (const auto& target : targets) {
        QVariantMap map;
        for (const char* key : {"id", "name", "model", "host"}) {
            if (target[key])
                map[key] = QString::fromStdString(target[key].as<std::string>());
        }
        if (target["port"])
            map["port"] = target["port"].as<int>();
        result.append(map);
    }
    return result;
}

void YamlConfig::setTargets(const QList<QVariantMap>& targets)
{
    YAML::Node node(YAML::NodeType::Sequence);
    for (const auto& target : targets) {
        YAML::Node t;
        for (const char* key : {"id", "name", "model", "host"}) {
            if (target.contains(key))
                t[key] = target[key].toString().toStdString();
        }
        if (target.contains("port"))
            t["port"] = target["port"].toInt();
        node.push_back(t);
    }
    root_["targets"] = node;
}

// --- Generic dot-path access ---

QVariant YamlConfig::valueByPath(const QString& dottedKey) const
{
    if (dottedKey.isEmpty()) return {};

    YAML::Node node = YAML::Clone(root_);
    for (const auto& part : dottedKey.split('.')) {
        if (!node.IsMap()) return {};
        node.reset(node[part.toStdString()]);
        if (!node.IsDefined() || node.IsNull()) return {};
    }
    return scalarToVariant(node);
}

YAML::Node YamlConfig::buildDefaultsNode()
{
    YamlConfig tmp;
    return YAML::Clone(tmp.root_);
}

bool YamlConfig::setValueByPath(const QString& dottedKey, const QVariant& value)
{
    if (dottedKey.isEmpty()) return false;

    const QStringList parts = dottedKey.split('.');

    // Only scalar leaves present in the defaults schema are writable
    YAML::Node schema = buildDefaultsNode();
    for (const auto& part : parts) {
        if (!schema.IsMap()) return false;
        schema.reset(schema[part.toStdString()]);
        if (!schema.IsDefined()) return false;
    }
    if (!schema.IsScalar()) return false;

    YAML::Node node = root_;
    for (int i = 0; i < parts.size() - 1; ++i)
        node.reset(node[parts[i].toStdString()]);

    const std::string leaf = parts.last().toStdString();
    switch (value.typeId()) {
    case QMetaType::Bool:
        node[leaf] = value.toBool();
        break;
    case QMetaType::Int:
        node[leaf] = value.toInt();
        break;
    case QMetaType::Double:
    case QMetaType::Float:
        node[leaf] = value.toDouble();
        break;
    default:
        node[leaf] = value.toString().toStdString();
        break;
    }
    return true;
}

} // namespace cvn
