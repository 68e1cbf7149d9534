#include "core/Logging.hpp"
#include <QLoggingCategory>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <cstring>
#include <iostream>

namespace rsb {

namespace {

void forwardToBoost(QtMsgType type, const QMessageLogContext& context, const QString& message)
{
    std::string line;
    if (context.category && std::strcmp(context.category, "default") != 0) {
        line += context.category;
        line += ": ";
    }
    line += message.toStdString();

    switch (type) {
    case QtDebugMsg:
        BOOST_LOG_TRIVIAL(debug) << line;
        break;
    case QtInfoMsg:
        BOOST_LOG_TRIVIAL(info) << line;
        break;
    case QtWarningMsg:
        BOOST_LOG_TRIVIAL(warning) << line;
        break;
    case QtCriticalMsg:
        BOOST_LOG_TRIVIAL(error) << line;
        break;
    case QtFatalMsg:
        BOOST_LOG_TRIVIAL(fatal) << line;
        break;
    }
}

boost::log::trivial::severity_level toSeverity(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:   return boost::log::trivial::debug;
    case LogLevel::Warning: return boost::log::trivial::warning;
    case LogLevel::Info:
    default:                return boost::log::trivial::info;
    }
}

} // namespace

bool parseLogLevel(const QString& text, LogLevel* level)
{
    const QString t = text.trimmed().toLower();
    if (t == QLatin1String("debug"))
        *level = LogLevel::Debug;
    else if (t == QLatin1String("info"))
        *level = LogLevel::Info;
    else if (t == QLatin1String("warning") || t == QLatin1String("warn"))
        *level = LogLevel::Warning;
    else
        return false;
    return true;
}

void initLogging(LogLevel level)
{
    namespace logging = boost::log;
    namespace keywords = boost::log::keywords;
    namespace expr = boost::log::expressions;

    static bool sinkAdded = false;
    if (!sinkAdded) {
        logging::add_common_attributes();
        logging::add_console_log(
            std::clog,
            keywords::format = (
                expr::stream
                    << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                    << "] [" << logging::trivial::severity << "] "
                    << expr::smessage),
            keywords::auto_flush = true);
        sinkAdded = true;
    }

    logging::core::get()->set_filter(logging::trivial::severity >= toSeverity(level));

    if (level == LogLevel::Debug)
        QLoggingCategory::setFilterRules(QStringLiteral("rsb.*.debug=true"));
    else
        QLoggingCategory::setFilterRules(QStringLiteral("rsb.*.debug=false"));

    qInstallMessageHandler(forwardToBoost);
}

} // namespace rsb
