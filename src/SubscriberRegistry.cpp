#include "SubscriberRegistry.h"
#include "LogCategories.h"

SubscriberRegistry::SubscriberRegistry(SlotMode mode, const QString &name)
    : m_mode(mode),
    m_name(name.isEmpty() ? QString("sinks") : name),
    m_nextId(1)
{
}

SubscriberRegistry::~SubscriberRegistry()
{
    closeAll();
}

int SubscriberRegistry::registerSink(const std::shared_ptr<Endpoint> &sink)
{
    QVector<Subscriber> replaced;
    int id;
    int total;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        if (m_mode == SingleSlot) {
            replaced = m_subscribers;
            m_subscribers.clear();
        }
        id = m_nextId++;
        m_subscribers.append(Subscriber{id, sink});
        ++m_stats.sinksRegistered;
        total = m_subscribers.size();
    }

    for (const Subscriber &old : replaced) {
        qCInfo(lcRelay).noquote() << QString("%1: replacing %2 with %3")
                                         .arg(m_name, old.sink->description(), sink->description());
        old.sink->close();
    }

    qCInfo(lcRelay).noquote() << QString("%1: %2 connected (total: %3)")
                                     .arg(m_name, sink->description()).arg(total);
    return id;
}

int SubscriberRegistry::broadcast(const QByteArray &data)
{
    // Serialized so concurrent callers cannot reorder chunks on a sink.
    std::lock_guard<std::mutex> order(m_broadcastMutex);

    QVector<Subscriber> snapshot;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        snapshot = m_subscribers;
    }

    QVector<int> failed;
    int delivered = 0;
    for (const Subscriber &sub : snapshot) {
        if (sub.sink->write(data) == data.size()) {
            ++delivered;
        } else {
            qCWarning(lcRelay).noquote() << QString("%1: dropping %2: %3")
                                                .arg(m_name, sub.sink->description(), sub.sink->errorString());
            failed.append(sub.id);
        }
    }

    {
        std::lock_guard<std::mutex> lk(m_mutex);
        ++m_stats.broadcasts;
        if (delivered > 0) {
            m_stats.bytesSent += quint64(data.size()) * quint64(delivered);
            m_stats.lastActivity = QDateTime::currentDateTime();
        }
    }

    for (int id : failed) {
        if (remove(id)) {
            std::lock_guard<std::mutex> lk(m_mutex);
            ++m_stats.sinksDropped;
        }
    }

    return delivered;
}

bool SubscriberRegistry::remove(int id)
{
    std::shared_ptr<Endpoint> sink;
    int remaining = 0;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        for (int i = 0; i < m_subscribers.size(); ++i) {
            if (m_subscribers.at(i).id == id) {
                sink = m_subscribers.at(i).sink;
                m_subscribers.remove(i);
                break;
            }
        }
        remaining = m_subscribers.size();
    }

    if (!sink)
        return false;

    sink->close();
    qCInfo(lcRelay).noquote() << QString("%1: %2 disconnected (remaining: %3)")
                                     .arg(m_name, sink->description()).arg(remaining);
    return true;
}

int SubscriberRegistry::count() const
{
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_subscribers.size();
}

bool SubscriberRegistry::contains(int id) const
{
    std::lock_guard<std::mutex> lk(m_mutex);
    for (const Subscriber &sub : m_subscribers) {
        if (sub.id == id)
            return true;
    }
    return false;
}

void SubscriberRegistry::closeAll()
{
    QVector<Subscriber> all;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        all.swap(m_subscribers);
    }

    for (const Subscriber &sub : all)
        sub.sink->close();
}

SubscriberRegistry::SlotMode SubscriberRegistry::slotMode() const
{
    return m_mode;
}

QString SubscriberRegistry::name() const
{
    return m_name;
}

TrafficStats SubscriberRegistry::stats() const
{
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_stats;
}
