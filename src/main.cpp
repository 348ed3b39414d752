#include <signal.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLocalSocket>
#include <QTextStream>
#include <memory>
#include <boost/log/trivial.hpp>
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/cast/CastTargetManager.hpp"
#include "core/discovery/StaticEndpointFeed.hpp"
#include "core/net/NetworkUtil.hpp"
#include "core/notify/NotificationCenter.hpp"
#include "core/notify/TargetRegistry.hpp"
#include "core/services/IpcServer.hpp"
#include "core/tts/CommandSpeechSynthesizer.hpp"

namespace {

// Send one notify request to a running daemon and print its reply.
int runClient(const QString& socketPath, const QString& target, const QString& text)
{
    QTextStream out(stdout);
    QTextStream err(stderr);

    QLocalSocket socket;
    socket.connectToServer(socketPath);
    if (!socket.waitForConnected(3000)) {
        err << "cannot reach daemon at " << socketPath << ": " << socket.errorString() << "\n";
        return 2;
    }

    QJsonObject data;
    data["text"] = text;
    if (!target.isEmpty())
        data["target"] = target;
    QJsonObject request;
    request["command"] = QStringLiteral("notify");
    request["data"] = data;

    socket.write(QJsonDocument(request).toJson(QJsonDocument::Compact) + "\n");
    socket.flush();

    QByteArray reply;
    while (!reply.contains('\n') && socket.waitForReadyRead(5000))
        reply.append(socket.readAll());
    socket.disconnectFromServer();

    if (reply.isEmpty()) {
        err << "no reply from daemon\n";
        return 2;
    }

    out << reply.trimmed() << "\n";
    return QJsonDocument::fromJson(reply.trimmed()).object().value("ok").toBool() ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("cast-voice-notifier");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Speaks text notifications on Cast audio devices.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({"c", "config"}, "Configuration file.", "path",
                                    cvn::YamlConfig::defaultConfigPath());
    QCommandLineOption sayOption({"s", "say"}, "Send a notification to the running daemon.", "text");
    QCommandLineOption targetOption({"t", "target"}, "Target id or name for --say.", "name");
    parser.addOption(configOption);
    parser.addOption(sayOption);
    parser.addOption(targetOption);
    parser.process(app);

    cvn::YamlConfig config;
    const QString configPath = parser.value(configOption);
    if (QFile::exists(configPath)) {
        try {
            config.load(configPath);
        } catch (const std::exception& e) {
            cvn::initLogging(config.logLevel());
            BOOST_LOG_TRIVIAL(fatal) << "[main] cannot load " << configPath.toStdString() << ": " << e.what();
            return 1;
        }
    }

    if (parser.isSet(sayOption))
        return runClient(config.ipcSocketPath(), parser.value(targetOption), parser.value(sayOption));

    cvn::initLogging(config.logLevel());
    BOOST_LOG_TRIVIAL(info) << "[main] cast-voice-notifier " << app.applicationVersion().toStdString()
                            << " starting, config " << configPath.toStdString();

    // --- Targets ---
    cvn::TargetRegistry registry;
    cvn::StaticEndpointFeed feed(cvn::StaticEndpointFeed::fromConfig(config.targets()));
    cvn::CastTargetConfig targetConfig;
    targetConfig.heartbeatIntervalMs = config.heartbeatIntervalMs();
    targetConfig.heartbeatTimeoutMs = config.heartbeatTimeoutMs();
    targetConfig.reconnectIntervalMs = config.reconnectIntervalMs();
    cvn::CastTargetManager targetManager(feed, registry, targetConfig);

    // --- Speech synthesis ---
    cvn::CommandSpeechSynthesizer synthesizer(config.ttsCommand(), config.ttsTimeoutMs());

    // --- Notification pipeline ---
    QString advertise = config.advertiseAddress();
    if (advertise.isEmpty()) {
        advertise = cvn::detectOutboundAddress();
        if (advertise.isEmpty()) {
            BOOST_LOG_TRIVIAL(error) << "[main] cannot determine a local address for the media server; "
                                        "set media_server.advertise_address";
            return 1;
        }
        BOOST_LOG_TRIVIAL(info) << "[main] advertising media server on " << advertise.toStdString();
    }

    auto center = std::make_unique<cvn::NotificationCenter>(config, registry, synthesizer);
    if (!center->start(advertise))
        return 1;

    // --- IPC ---
    cvn::IpcServer ipc;
    ipc.setNotificationCenter(center.get());
    ipc.setTargetRegistry(&registry);
    if (!ipc.start(config.ipcSocketPath()))
        BOOST_LOG_TRIVIAL(warning) << "[main] IPC unavailable, only internal triggers will work";

    feed.start();

    // SIGINT / SIGTERM → leave the event loop and run the shutdown sequence
    auto requestQuit = [](int) {
        QMetaObject::invokeMethod(QCoreApplication::instance(), "quit", Qt::QueuedConnection);
    };
    signal(SIGINT, requestQuit);
    signal(SIGTERM, requestQuit);

    int ret = app.exec();

    BOOST_LOG_TRIVIAL(info) << "[main] shutting down";
    ipc.stop();
    cvn::ShutdownReport report = center->shutdown();
    center.reset();
    feed.stop();
    targetManager.stopAll();

    if (!report.clean())
        ret = ret == 0 ? 3 : ret;
    return ret;
}
