#include "planner/data/FilePersistentStore.hpp"

#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QUrl>

#include "planner/core/Logging.hpp"

namespace planner {
namespace data {

namespace {
const QString BlobSuffix = QStringLiteral(".blob");
} // namespace

FilePersistentStore::FilePersistentStore(QString directory)
    : m_directory(std::move(directory))
{
    QDir dir(m_directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        qCWarning(lcData) << "unable to create cache directory" << m_directory;
    }
}

std::optional<QByteArray> FilePersistentStore::read(const QString &key) const
{
    QFile file(filePathFor(key));
    if (!file.exists()) {
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcData) << "unable to open" << file.fileName() << file.errorString();
        return std::nullopt;
    }
    return file.readAll();
}

bool FilePersistentStore::write(const QString &key, const QByteArray &value)
{
    if (key.isEmpty() || m_directory.isEmpty()) {
        return false;
    }

    QDir dir(m_directory);
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }

    QSaveFile file(filePathFor(key));
    if (!file.open(QIODevice::WriteOnly)) {
        qCWarning(lcData) << "unable to open" << file.fileName() << "for writing:" << file.errorString();
        return false;
    }
    if (file.write(value) != value.size()) {
        qCWarning(lcData) << "short write to" << file.fileName() << file.errorString();
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        qCWarning(lcData) << "unable to commit" << file.fileName() << file.errorString();
        return false;
    }
    return true;
}

bool FilePersistentStore::remove(const QString &key)
{
    QFile file(filePathFor(key));
    if (!file.exists()) {
        return false;
    }
    return file.remove();
}

QStringList FilePersistentStore::keys() const
{
    QStringList result;
    const QDir dir(m_directory);
    const QStringList entries = dir.entryList({ QStringLiteral("*") + BlobSuffix }, QDir::Files);
    result.reserve(entries.size());
    for (const QString &entry : entries) {
        result << decodeKey(entry);
    }
    return result;
}

const QString &FilePersistentStore::directory() const
{
    return m_directory;
}

QString FilePersistentStore::filePathFor(const QString &key) const
{
    return QDir(m_directory).filePath(encodeKey(key) + BlobSuffix);
}

QString FilePersistentStore::encodeKey(const QString &key)
{
    return QString::fromLatin1(QUrl::toPercentEncoding(key));
}

QString FilePersistentStore::decodeKey(const QString &fileName)
{
    const QString encoded = fileName.left(fileName.size() - BlobSuffix.size());
    return QUrl::fromPercentEncoding(encoded.toLatin1());
}

} // namespace data
} // namespace planner
