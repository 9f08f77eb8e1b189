#include "FakeNetworkAccessManager.hpp"

#include <QTimer>
#include <algorithm>
#include <cstring>

namespace planner {
namespace testing {

FakeReply::FakeReply(QNetworkAccessManager::Operation operation,
                     const QNetworkRequest &request,
                     const CannedResponse &response,
                     QObject *parent)
    : QNetworkReply(parent)
    , m_body(response.body)
{
    setRequest(request);
    setUrl(request.url());
    setOperation(operation);
    open(QIODevice::ReadOnly | QIODevice::Unbuffered);

    if (response.transportError != QNetworkReply::NoError) {
        setError(response.transportError, QStringLiteral("canned transport failure"));
    } else {
        setAttribute(QNetworkRequest::HttpStatusCodeAttribute, response.status);
        if (response.status >= 400) {
            setError(QNetworkReply::ProtocolInvalidOperationError, QStringLiteral("canned HTTP error"));
        }
    }

    if (!response.hang) {
        QTimer::singleShot(0, this, &FakeReply::deliver);
    }
}

void FakeReply::abort()
{
    if (isFinished()) {
        return;
    }
    setError(QNetworkReply::OperationCanceledError, QStringLiteral("Operation canceled"));
    setFinished(true);
    emit finished();
}

qint64 FakeReply::bytesAvailable() const
{
    return m_body.size() - m_offset + QIODevice::bytesAvailable();
}

bool FakeReply::isSequential() const
{
    return true;
}

qint64 FakeReply::readData(char *data, qint64 maxSize)
{
    if (m_offset >= m_body.size()) {
        return -1;
    }
    const qint64 count = std::min(maxSize, static_cast<qint64>(m_body.size()) - m_offset);
    std::memcpy(data, m_body.constData() + m_offset, static_cast<std::size_t>(count));
    m_offset += count;
    return count;
}

void FakeReply::deliver()
{
    if (isFinished()) {
        return;
    }
    setFinished(true);
    emit readyRead();
    emit finished();
}

FakeNetworkAccessManager::FakeNetworkAccessManager(QObject *parent)
    : QNetworkAccessManager(parent)
{
}

void FakeNetworkAccessManager::setResponse(const QString &pathSuffix, CannedResponse response)
{
    const auto it = std::find_if(m_responses.begin(), m_responses.end(), [&pathSuffix](const auto &entry) {
        return entry.first == pathSuffix;
    });
    if (it != m_responses.end()) {
        it->second = std::move(response);
        return;
    }
    m_responses.emplace_back(pathSuffix, std::move(response));
}

const QList<QNetworkRequest> &FakeNetworkAccessManager::requests() const
{
    return m_requests;
}

QList<QNetworkRequest> FakeNetworkAccessManager::requestsTo(const QString &pathSuffix) const
{
    QList<QNetworkRequest> matching;
    for (const QNetworkRequest &request : m_requests) {
        if (request.url().path(QUrl::FullyEncoded).endsWith(pathSuffix)) {
            matching.append(request);
        }
    }
    return matching;
}

QNetworkReply *FakeNetworkAccessManager::createRequest(Operation operation,
                                                       const QNetworkRequest &request,
                                                       QIODevice *outgoingData)
{
    Q_UNUSED(outgoingData)
    m_requests.append(request);

    CannedResponse response;
    response.status = 404;
    const QString path = request.url().path(QUrl::FullyEncoded);
    for (const auto &entry : m_responses) {
        if (path.endsWith(entry.first)) {
            response = entry.second;
            break;
        }
    }
    return new FakeReply(operation, request, response, this);
}

} // namespace testing
} // namespace planner
