#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <optional>

namespace planner {
namespace data {

class PersistentStore
{
public:
    virtual ~PersistentStore() = default;

    virtual std::optional<QByteArray> read(const QString &key) const = 0;
    virtual bool write(const QString &key, const QByteArray &value) = 0;
    virtual bool remove(const QString &key) = 0;
    virtual QStringList keys() const = 0;
};

} // namespace data
} // namespace planner
