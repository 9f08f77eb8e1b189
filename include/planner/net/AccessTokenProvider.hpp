#pragma once

#include <QByteArray>
#include <QString>
#include <optional>

#include "planner/data/CalendarEvent.hpp"

namespace planner {
namespace net {

// Account linking and token refresh live outside the engine.
class AccessTokenProvider
{
public:
    virtual ~AccessTokenProvider() = default;

    virtual bool isLinked(data::AccountKind account) const = 0;
    virtual std::optional<QString> accessToken(data::AccountKind account) const = 0;
};

// Reads PLANNER_PERSONAL_TOKEN / PLANNER_PROFESSIONAL_TOKEN.
class EnvironmentTokenProvider : public AccessTokenProvider
{
public:
    EnvironmentTokenProvider();

    bool isLinked(data::AccountKind account) const override;
    std::optional<QString> accessToken(data::AccountKind account) const override;

    static QByteArray variableName(data::AccountKind account);

private:
    QString m_personalToken;
    QString m_professionalToken;
};

} // namespace net
} // namespace planner
