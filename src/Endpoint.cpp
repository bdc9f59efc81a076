#include "Endpoint.h"

Endpoint::EndpointError Endpoint::error() const
{
    std::lock_guard<std::mutex> lk(m_errorMutex);
    return m_error;
}

QString Endpoint::errorString() const
{
    std::lock_guard<std::mutex> lk(m_errorMutex);
    return m_errorString;
}

void Endpoint::setError(EndpointError error, const QString &errorString)
{
    std::lock_guard<std::mutex> lk(m_errorMutex);
    m_error = error;
    m_errorString = errorString;
}
