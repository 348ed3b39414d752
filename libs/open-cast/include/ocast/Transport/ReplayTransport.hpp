#pragma once

#include <ocast/Transport/ITransport.hpp>
#include <QList>

namespace ocast {

// In-memory transport for tests: records writes, lets the test inject
// received bytes and connection events.
class ReplayTransport : public ITransport {
    Q_OBJECT
public:
    explicit ReplayTransport(QObject* parent = nullptr);
    ~ReplayTransport() override;

    void start() override;
    void stop() override;
    void write(const QByteArray& data) override;
    bool isConnected() const override;

    // Test API
    void feedData(const QByteArray& data);
    void simulateConnect();
    void simulateDisconnect();
    bool isStarted() const { return started_; }
    int startCount() const { return startCount_; }
    QList<QByteArray> writtenData() const;
    void clearWritten();

private:
    bool started_ = false;
    bool connected_ = false;
    int startCount_ = 0;
    QList<QByteArray> written_;
};

} // namespace ocast
