#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDate>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <QTimer>
#include <memory>

#include "version.h"

#include "planner/core/AppContext.hpp"
#include "planner/core/CalendarOrchestrator.hpp"
#include "planner/core/Clock.hpp"
#include "planner/layout/TimelineLayout.hpp"
#include "planner/net/AccessTokenProvider.hpp"

namespace {

constexpr double DefaultColumnWidth = 200.0;

QString accountLabel(const planner::data::CalendarEvent &event)
{
    return planner::data::accountKindName(event.account);
}

void printDay(QTextStream &out, const QDate &day, const planner::layout::DayLayout &layout)
{
    out << day.toString(Qt::ISODate) << ": " << layout.allDayRows.size() << " all-day, "
        << layout.timed.size() << " timed" << Qt::endl;

    if (!layout.allDayRows.empty()) {
        out << "  all-day block " << layout.allDayBlockHeight << " px" << Qt::endl;
        for (const auto &row : layout.allDayRows) {
            out << "  [all day] y=" << row.verticalOffset << " h=" << row.height << "  "
                << row.event->title << " (" << accountLabel(*row.event) << ")" << Qt::endl;
        }
    }

    for (const auto &entry : layout.timed) {
        const auto &event = *entry.event;
        out << "  " << event.startTime().toLocalTime().toString(QStringLiteral("HH:mm")) << "-"
            << event.endTime().toLocalTime().toString(QStringLiteral("HH:mm"))
            << "  y=" << entry.verticalOffset << " h=" << entry.height
            << " x=" << entry.horizontalOffset << " w=" << entry.columnWidth
            << " col " << entry.column + 1 << "/" << entry.columnCount
            << "  " << event.title << " (" << accountLabel(event) << ")" << Qt::endl;
    }

    if (layout.currentTimeOffset) {
        out << "  now at y=" << *layout.currentTimeOffset << Qt::endl;
    }
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Planner"));
    QCoreApplication::setApplicationName(QStringLiteral("planner-cli"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kPlannerVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate("main", "Loads one day of calendar events and prints its timeline layout."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption dateOption(QStringLiteral("date"),
                                        QCoreApplication::translate("main", "Day to load (yyyy-MM-dd), today by default."),
                                        QStringLiteral("date"));
    const QCommandLineOption widthOption(QStringLiteral("width"),
                                         QCoreApplication::translate("main", "Width of the day column in pixels."),
                                         QStringLiteral("px"),
                                         QString::number(DefaultColumnWidth));
    const QCommandLineOption refreshOption(QStringLiteral("refresh"),
                                           QCoreApplication::translate("main", "Bypass the cache and fetch again."));
    parser.addOption(dateOption);
    parser.addOption(widthOption);
    parser.addOption(refreshOption);
    parser.process(app);

    QTextStream err(stderr);
    QDate day = QDate::currentDate();
    if (parser.isSet(dateOption)) {
        day = QDate::fromString(parser.value(dateOption), Qt::ISODate);
        if (!day.isValid()) {
            err << "invalid --date " << parser.value(dateOption) << Qt::endl;
            return 2;
        }
    }
    bool widthOk = false;
    const double width = parser.value(widthOption).toDouble(&widthOk);
    if (!widthOk || width <= 0) {
        err << "invalid --width " << parser.value(widthOption) << Qt::endl;
        return 2;
    }

    QSettings settings;
    planner::core::AppContext context(planner::core::PlannerSettings::fromSettings(settings),
                                      std::make_unique<planner::net::EnvironmentTokenProvider>());

    const auto &tokens = context.tokenProvider();
    if (!tokens.isLinked(planner::data::AccountKind::Personal)
        && !tokens.isLinked(planner::data::AccountKind::Professional)) {
        err << "no account linked, set " << planner::net::EnvironmentTokenProvider::variableName(planner::data::AccountKind::Personal)
            << " or " << planner::net::EnvironmentTokenProvider::variableName(planner::data::AccountKind::Professional)
            << Qt::endl;
        return 1;
    }

    auto &orchestrator = context.orchestrator();
    const auto config = context.settings().timelineConfig(width);
    QObject::connect(&orchestrator, &planner::core::CalendarOrchestrator::loadFinished, &app, [&]() {
        if (!orchestrator.errorMessage().isEmpty()) {
            err << orchestrator.errorMessage() << Qt::endl;
            QCoreApplication::exit(1);
            return;
        }
        const auto events = orchestrator.eventsOn(day);
        QTextStream out(stdout);
        printDay(out, day, planner::layout::layoutDay(day, events, config, context.clock().now()));
        QCoreApplication::exit(0);
    });

    const bool refresh = parser.isSet(refreshOption);
    QTimer::singleShot(0, &orchestrator, [&orchestrator, day, refresh]() {
        if (refresh) {
            orchestrator.refresh(day, planner::core::ViewInterval::Day);
        } else {
            orchestrator.loadDay(day);
        }
    });

    return app.exec();
}
