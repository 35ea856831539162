#include <libstealthpool/basics/Log.h>

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace stealthpool {

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;

BOOST_LOG_ATTRIBUTE_KEYWORD(severity_kw, "Severity", Severity)
BOOST_LOG_ATTRIBUTE_KEYWORD(channel_kw, "Channel", std::string)

namespace {

std::atomic<int> threshold{static_cast<int>(Severity::info)};
std::mutex setupMutex;

using ConsoleSink = sinks::synchronous_sink<sinks::text_ostream_backend>;
boost::shared_ptr<ConsoleSink> consoleSink;
boost::shared_ptr<logging::sinks::sink> fileSink;

auto
recordFormat()
{
    return expr::stream
        << expr::format_date_time<boost::posix_time::ptime>(
               "TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " " << channel_kw << ":" << severity_kw << " " << expr::smessage;
}

}  // namespace

std::ostream&
operator<<(std::ostream& os, Severity s)
{
    switch (s)
    {
        case Severity::trace:
            return os << "TRC";
        case Severity::debug:
            return os << "DBG";
        case Severity::info:
            return os << "NFO";
        case Severity::warning:
            return os << "WRN";
        case Severity::error:
            return os << "ERR";
        case Severity::fatal:
            return os << "FTL";
    }
    return os << "???";
}

Severity
severityFromString(std::string const& s)
{
    if (s == "trace")
        return Severity::trace;
    if (s == "debug")
        return Severity::debug;
    if (s == "info")
        return Severity::info;
    if (s == "warning" || s == "warn")
        return Severity::warning;
    if (s == "error")
        return Severity::error;
    if (s == "fatal")
        return Severity::fatal;
    throw std::invalid_argument("unknown log severity '" + s + "'");
}

Journal::Journal(std::string const& channel)
    : logger_(std::make_shared<LoggerT>(logging::keywords::channel = channel))
{
}

bool
Journal::Stream::active() const
{
    return logger_ != nullptr &&
        static_cast<int>(level_) >= threshold.load(std::memory_order_relaxed);
}

Journal::ScopedStream::~ScopedStream()
{
    if (!logger_)
        return;
    try
    {
        BOOST_LOG_SEV(*logger_, level_) << ss_.str();
    }
    catch (std::exception const& e)
    {
        // Runs in a destructor; report and carry on.
        std::cerr << "log write failed: " << e.what() << std::endl;
    }
}

Severity
logThreshold()
{
    return static_cast<Severity>(threshold.load());
}

void
initLogging(LogConfig const& config)
{
    std::lock_guard<std::mutex> lock(setupMutex);

    threshold.store(static_cast<int>(config.severity));

    auto core = logging::core::get();
    logging::add_common_attributes();

    if (consoleSink)
    {
        core->remove_sink(consoleSink);
        consoleSink.reset();
    }
    if (fileSink)
    {
        core->remove_sink(fileSink);
        fileSink.reset();
    }

    if (config.console)
    {
        consoleSink = boost::make_shared<ConsoleSink>();
        consoleSink->locked_backend()->add_stream(
            boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
        consoleSink->set_formatter(recordFormat());
        core->add_sink(consoleSink);
    }

    if (!config.file.empty())
    {
        auto sink = logging::add_file_log(
            logging::keywords::file_name = config.file,
            logging::keywords::open_mode = std::ios_base::app,
            logging::keywords::auto_flush = true);
        sink->set_formatter(recordFormat());
        fileSink = sink;
    }
}

}  // namespace stealthpool
