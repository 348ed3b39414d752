#include "core/notify/NotificationCenter.hpp"
#include "core/YamlConfig.hpp"
#include "core/media/MediaServer.hpp"
#include "core/net/NetworkUtil.hpp"
#include "core/notify/TargetRegistry.hpp"
#include <QDateTime>
#include <QDeadlineTimer>
#include <QDir>
#include <boost/log/trivial.hpp>

namespace cvn {

namespace {

StateKeeper::Config stateKeeperConfig(const YamlConfig& config)
{
    StateKeeper::Config c;
    c.notificationVolume = config.notificationVolume() / 100.0;
    c.readyAttempts = config.restoreReadyAttempts();
    c.readyIntervalSeconds = config.restoreReadyIntervalSeconds();
    return c;
}

DetectorConfig detectorConfig(const YamlConfig& config)
{
    DetectorConfig c;
    c.bitrateBps = config.bitrateBps();
    c.activeTimeoutSeconds = config.activeTimeoutSeconds();
    c.settleSeconds = config.settleSeconds();
    c.pollIntervalSeconds = config.pollIntervalSeconds();
    c.flushGraceSeconds = config.flushGraceSeconds();
    c.minTimeoutSeconds = config.minTimeoutSeconds();
    c.estimateMarginSeconds = config.estimateMarginSeconds();
    c.durationMarginSeconds = config.durationMarginSeconds();
    return c;
}

constexpr int TERMINATE_GRACE_MS = 5000;

} // namespace

NotificationCenter::NotificationCenter(const YamlConfig& config, TargetRegistry& registry,
                                       ISpeechSynthesizer& synthesizer, QObject* parent)
    : QObject(parent)
    , defaultTarget_(config.defaultTarget())
    , assetDir_(config.assetDir())
    , configuredPort_(config.mediaServerPort())
    , stateKeeper_(stateKeeperConfig(config))
    , detector_(detectorConfig(config))
{
    shutdownConfig_.workerTimeoutMs = static_cast<int>(config.workerTimeoutSeconds() * 1000);
    shutdownConfig_.drainTimeoutMs = static_cast<int>(config.drainTimeoutSeconds() * 1000);

    server_ = new MediaServer(assetDir_, config.chunkBytes(), this);

    NotificationWorker::Config workerConfig;
    workerConfig.assetDir = assetDir_;
    workerConfig.language = config.language();
    workerConfig.dequeueTimeoutMs = config.dequeueTimeoutMs();

    // advertiseAddress_ and mediaPort_ are fixed before the worker starts
    auto urlBuilder = [this](const QString& fileName) {
        return mediaUrl(advertiseAddress_, mediaPort_, fileName,
                        QDateTime::currentMSecsSinceEpoch());
    };

    worker_ = std::make_unique<NotificationWorker>(queue_, registry, synthesizer, stateKeeper_,
                                                   detector_, cancel_, workerConfig, urlBuilder);
    connect(worker_.get(), &NotificationWorker::notificationFinished,
            this, &NotificationCenter::notificationFinished);
}

NotificationCenter::~NotificationCenter()
{
    shutdown();

    if (worker_->isRunning()) {
        BOOST_LOG_TRIVIAL(error) << "[NotificationCenter] worker still running, waiting "
                                 << TERMINATE_GRACE_MS << " ms more";
        if (!worker_->wait(QDeadlineTimer(TERMINATE_GRACE_MS))) {
            BOOST_LOG_TRIVIAL(error) << "[NotificationCenter] terminating stuck worker";
            worker_->terminate();
            worker_->wait();
        }
    }
}

bool NotificationCenter::start(const QString& advertiseAddress)
{
    if (started_)
        return true;

    if (advertiseAddress.isEmpty()) {
        BOOST_LOG_TRIVIAL(error) << "[NotificationCenter] no advertise address, notifications disabled";
        return false;
    }

    if (!QDir().mkpath(assetDir_)) {
        BOOST_LOG_TRIVIAL(error) << "[NotificationCenter] cannot create asset directory "
                                 << assetDir_.toStdString();
        return false;
    }

    if (!server_->start(configuredPort_))
        return false;

    advertiseAddress_ = advertiseAddress;
    mediaPort_ = server_->port();
    started_ = true;
    worker_->start();

    BOOST_LOG_TRIVIAL(info) << "[NotificationCenter] serving " << assetDir_.toStdString()
                            << " at http://" << advertiseAddress_.toStdString() << ":" << mediaPort_;
    return true;
}

bool NotificationCenter::notify(const QString& target, const QString& text, QString* error)
{
    auto reject = [error](const QString& reason) {
        BOOST_LOG_TRIVIAL(error) << "[NotificationCenter] notification rejected: " << reason.toStdString();
        if (error)
            *error = reason;
        return false;
    };

    if (!started_ || cancel_.isCancelled())
        return reject(QStringLiteral("notifications are not running"));

    const QString resolved = target.trimmed().isEmpty() ? defaultTarget_ : target.trimmed();
    if (resolved.isEmpty())
        return reject(QStringLiteral("no target given and no default target configured"));
    if (text.trimmed().isEmpty())
        return reject(QStringLiteral("empty notification text"));

    NotificationRequest request;
    request.target = resolved;
    request.text = text;
    request.enqueuedAtMs = QDateTime::currentMSecsSinceEpoch();
    queue_.enqueue(request);

    BOOST_LOG_TRIVIAL(info) << "[NotificationCenter] queued notification for '"
                            << resolved.toStdString() << "' (" << queue_.size() << " pending)";
    return true;
}

ShutdownReport NotificationCenter::shutdown()
{
    if (stopped_)
        return lastReport_;
    stopped_ = true;

    ShutdownCoordinator coordinator(cancel_, queue_, worker_.get(), server_, shutdownConfig_);
    lastReport_ = coordinator.shutdown();
    return lastReport_;
}

} // namespace cvn
