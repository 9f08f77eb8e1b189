#include "planner/net/AccessTokenProvider.hpp"

#include <QtGlobal>

namespace planner {
namespace net {

EnvironmentTokenProvider::EnvironmentTokenProvider()
    : m_personalToken(qEnvironmentVariable(variableName(data::AccountKind::Personal).constData()).trimmed())
    , m_professionalToken(qEnvironmentVariable(variableName(data::AccountKind::Professional).constData()).trimmed())
{
}

bool EnvironmentTokenProvider::isLinked(data::AccountKind account) const
{
    return accessToken(account).has_value();
}

std::optional<QString> EnvironmentTokenProvider::accessToken(data::AccountKind account) const
{
    const QString &token = account == data::AccountKind::Personal ? m_personalToken : m_professionalToken;
    if (token.isEmpty()) {
        return std::nullopt;
    }
    return token;
}

QByteArray EnvironmentTokenProvider::variableName(data::AccountKind account)
{
    return account == data::AccountKind::Personal ? QByteArrayLiteral("PLANNER_PERSONAL_TOKEN")
                                                  : QByteArrayLiteral("PLANNER_PROFESSIONAL_TOKEN");
}

} // namespace net
} // namespace planner
