#include "planner/data/InMemoryPersistentStore.hpp"

namespace planner {
namespace data {

InMemoryPersistentStore::InMemoryPersistentStore() = default;
InMemoryPersistentStore::~InMemoryPersistentStore() = default;

std::optional<QByteArray> InMemoryPersistentStore::read(const QString &key) const
{
    if (m_values.contains(key)) {
        return m_values.value(key);
    }
    return std::nullopt;
}

bool InMemoryPersistentStore::write(const QString &key, const QByteArray &value)
{
    if (key.isEmpty()) {
        return false;
    }
    m_values.insert(key, value);
    ++m_writeCount;
    return true;
}

bool InMemoryPersistentStore::remove(const QString &key)
{
    return m_values.remove(key) > 0;
}

QStringList InMemoryPersistentStore::keys() const
{
    return m_values.keys();
}

int InMemoryPersistentStore::writeCount() const
{
    return m_writeCount;
}

} // namespace data
} // namespace planner
