#pragma once

#include <QString>

#include "planner/data/PersistentStore.hpp"

namespace planner {
namespace data {

// One file per key inside a directory; writes go through QSaveFile.
class FilePersistentStore : public PersistentStore
{
public:
    explicit FilePersistentStore(QString directory);
    ~FilePersistentStore() override = default;

    std::optional<QByteArray> read(const QString &key) const override;
    bool write(const QString &key, const QByteArray &value) override;
    bool remove(const QString &key) override;
    QStringList keys() const override;

    const QString &directory() const;

private:
    QString filePathFor(const QString &key) const;

    static QString encodeKey(const QString &key);
    static QString decodeKey(const QString &fileName);

    QString m_directory;
};

} // namespace data
} // namespace planner
