#ifndef STATUSDISPLAY_H
#define STATUSDISPLAY_H

#include "NmeaMonitor.h"
#include "Relay.h"
#include "RelayConfig.h"
#include "SerialControlTunnel.h"
#include "SubscriberRegistry.h"

#include <QElapsedTimer>
#include <QObject>
#include <QStringList>
#include <QTimer>

#include <memory>

// Periodic console status block and stats line. Runs on the main thread and
// only reads the thread safe stats accessors.
class StatusDisplay : public QObject
{
    Q_OBJECT

public:
    enum ReceptionStatus {
        NoData,
        Stalled,
        Validating,
        ValidAndFlowing,
        Converging,
        RoverUsing
    };

    explicit StatusDisplay(const DisplayConfig &config, QObject *parent = nullptr);

    void setRelay(Relay *relay);
    void setRegistry(SubscriberRegistry *registry);
    void setMonitor(NmeaMonitor *monitor);
    void setTunnel(std::shared_ptr<SerialControlTunnel> tunnel);

    void start();
    void stop();

    QStringList statusBlock() const;
    QString statsLine() const;

    static ReceptionStatus classifyReception(const RelayStats &stats, const RoverStatus *rover,
                                             const QDateTime &now);
    static QString receptionName(ReceptionStatus status);
    static bool roverUsingCorrections(const RoverStatus &rover);
    static QString typeSummary(const QMap<int, quint64> &typeCounts);

private slots:
    void refresh();

private:
    DisplayConfig m_config;
    QTimer m_timer;
    QElapsedTimer m_statsClock;

    Relay *m_relay;
    SubscriberRegistry *m_registry;
    NmeaMonitor *m_monitor;
    std::shared_ptr<SerialControlTunnel> m_tunnel;
};

#endif // STATUSDISPLAY_H
