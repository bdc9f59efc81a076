#ifndef SCRIPTEDENDPOINT_H
#define SCRIPTEDENDPOINT_H

#include "Endpoint.h"

#include <QByteArray>
#include <QList>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string.h>
#include <thread>

// In-memory Endpoint that plays back a list of read results and records
// everything written to it.
class ScriptedEndpoint : public Endpoint
{
public:
    // What read() does once the script is used up.
    enum Exhausted {
        Eof,
        Timeout,
        Block       // waits for more script or close()
    };

    explicit ScriptedEndpoint(Exhausted exhausted = Eof, const QString &name = "scripted")
        : m_exhausted(exhausted),
        m_name(name),
        m_closed(false),
        m_releases(0),
        m_failWrites(false)
    {
    }

    void addData(const QByteArray &data)
    {
        pushStep(Step{Step::Data, data});
    }

    void addTimeout()
    {
        pushStep(Step{Step::Timeout, QByteArray()});
    }

    void addError()
    {
        pushStep(Step{Step::Error, QByteArray()});
    }

    void setFailWrites(bool fail)
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_failWrites = fail;
    }

    qint64 read(char *data, qint64 maxSize) override
    {
        std::unique_lock<std::mutex> lk(m_mutex);
        if (m_exhausted == Block)
            m_changed.wait(lk, [this] { return m_closed || !m_steps.empty(); });

        if (m_closed) {
            lk.unlock();
            setError(ClosedError, "Endpoint closed");
            return -1;
        }

        if (m_steps.empty()) {
            lk.unlock();
            if (m_exhausted == Eof)
                return 0;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            setError(TimeoutError, "Read timed out");
            return -1;
        }

        Step step = m_steps.front();
        m_steps.pop_front();

        if (step.kind == Step::Timeout) {
            lk.unlock();
            setError(TimeoutError, "Read timed out");
            return -1;
        }
        if (step.kind == Step::Error) {
            lk.unlock();
            setError(ReadError, "Scripted read error");
            return -1;
        }

        qint64 n = qMin<qint64>(maxSize, step.data.size());
        memcpy(data, step.data.constData(), size_t(n));
        if (n < step.data.size())
            m_steps.push_front(Step{Step::Data, step.data.mid(int(n))});
        return n;
    }

    qint64 write(const QByteArray &data) override
    {
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            if (!m_closed && !m_failWrites) {
                m_writes.append(data);
                m_written.append(data);
                m_changed.notify_all();
                return data.size();
            }
        }
        setError(WriteError, "Scripted write error");
        return -1;
    }

    void close() override
    {
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            if (m_closed)
                return;
            m_closed = true;
            ++m_releases;
        }
        m_changed.notify_all();
    }

    bool isOpen() const override
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        return !m_closed;
    }

    QString description() const override
    {
        return m_name;
    }

    QByteArray written() const
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_written;
    }

    QList<QByteArray> writes() const
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_writes;
    }

    int releases() const
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_releases;
    }

    bool waitForWritten(int bytes, int timeoutMs)
    {
        std::unique_lock<std::mutex> lk(m_mutex);
        return m_changed.wait_for(lk, std::chrono::milliseconds(timeoutMs),
                                  [this, bytes] { return m_written.size() >= bytes; });
    }

private:
    struct Step
    {
        enum Kind {
            Data,
            Timeout,
            Error
        };

        Kind kind;
        QByteArray data;
    };

    void pushStep(const Step &step)
    {
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            m_steps.push_back(step);
        }
        m_changed.notify_all();
    }

    const Exhausted m_exhausted;
    const QString m_name;

    mutable std::mutex m_mutex;
    std::condition_variable m_changed;
    std::deque<Step> m_steps;
    QByteArray m_written;
    QList<QByteArray> m_writes;
    bool m_closed;
    int m_releases;
    bool m_failWrites;
};

#endif // SCRIPTEDENDPOINT_H
