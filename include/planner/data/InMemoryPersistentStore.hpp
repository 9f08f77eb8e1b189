#pragma once

#include <QHash>

#include "planner/data/PersistentStore.hpp"

namespace planner {
namespace data {

class InMemoryPersistentStore : public PersistentStore
{
public:
    InMemoryPersistentStore();
    ~InMemoryPersistentStore() override;

    std::optional<QByteArray> read(const QString &key) const override;
    bool write(const QString &key, const QByteArray &value) override;
    bool remove(const QString &key) override;
    QStringList keys() const override;

    int writeCount() const;

private:
    QHash<QString, QByteArray> m_values;
    int m_writeCount = 0;
};

} // namespace data
} // namespace planner
