#ifndef SUBSCRIBERREGISTRY_H
#define SUBSCRIBERREGISTRY_H

#include "Endpoint.h"

#include <QDateTime>
#include <QVector>

#include <memory>
#include <mutex>

struct TrafficStats
{
    quint64 bytesSent = 0;      // summed over the sinks that took the write
    quint64 broadcasts = 0;
    quint64 sinksRegistered = 0;
    quint64 sinksDropped = 0;
    QDateTime lastActivity;
};

// Set of egress endpoints that receive every broadcast chunk in order.
class SubscriberRegistry
{
public:
    enum SlotMode {
        MultiSlot,
        SingleSlot      // latest connection wins
    };

    explicit SubscriberRegistry(SlotMode mode = MultiSlot, const QString &name = QString());
    ~SubscriberRegistry();

    SubscriberRegistry(const SubscriberRegistry &) = delete;
    SubscriberRegistry &operator=(const SubscriberRegistry &) = delete;

    int registerSink(const std::shared_ptr<Endpoint> &sink);

    // Writes data to every sink and prunes the ones that fail. Returns the
    // number of sinks that received it.
    int broadcast(const QByteArray &data);

    // Idempotent. Closes the sink if it was still registered.
    bool remove(int id);

    int count() const;
    bool contains(int id) const;
    void closeAll();

    SlotMode slotMode() const;
    QString name() const;
    TrafficStats stats() const;

private:
    struct Subscriber
    {
        int id;
        std::shared_ptr<Endpoint> sink;
    };

    const SlotMode m_mode;
    const QString m_name;

    mutable std::mutex m_mutex;
    std::mutex m_broadcastMutex;
    QVector<Subscriber> m_subscribers;
    int m_nextId;
    TrafficStats m_stats;
};

#endif // SUBSCRIBERREGISTRY_H
