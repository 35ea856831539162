#ifndef STEALTHPOOL_BASICS_LOG_H_INCLUDED
#define STEALTHPOOL_BASICS_LOG_H_INCLUDED

#include <boost/log/sources/severity_channel_logger.hpp>

#include <memory>
#include <ostream>
#include <sstream>
#include <string>

namespace stealthpool {

enum class Severity { trace, debug, info, warning, error, fatal };

std::ostream&
operator<<(std::ostream& os, Severity s);

/** Parse "trace", "debug", ... Throws std::invalid_argument. */
Severity
severityFromString(std::string const& s);

using LoggerT =
    boost::log::sources::severity_channel_logger_mt<Severity, std::string>;

/** A channel of log output with severity streams.

    Messages are handed to Boost.Log, so sinks and filtering are configured
    once through initLogging(). Use through JLOG so that formatting is
    skipped when the stream is below the threshold:

        JLOG(j.debug()) << "inserted leaf " << index;
*/
class Journal
{
public:
    class ScopedStream;

    class Stream
    {
    public:
        Stream(LoggerT* logger, Severity level) : logger_(logger), level_(level)
        {
        }

        bool
        active() const;

        template <class T>
        ScopedStream
        operator<<(T const& t) const;

    private:
        friend class ScopedStream;
        LoggerT* logger_;
        Severity level_;
    };

    class ScopedStream
    {
    public:
        template <class T>
        ScopedStream(Stream const& stream, T const& t)
            : logger_(stream.logger_), level_(stream.level_)
        {
            ss_ << t;
        }

        ScopedStream(ScopedStream const&) = delete;
        ScopedStream&
        operator=(ScopedStream const&) = delete;

        ~ScopedStream();

        template <class T>
        ScopedStream&
        operator<<(T const& t)
        {
            ss_ << t;
            return *this;
        }

    private:
        LoggerT* logger_;
        Severity level_;
        std::ostringstream ss_;
    };

    explicit Journal(std::string const& channel);

    Stream
    trace() const
    {
        return {logger_.get(), Severity::trace};
    }
    Stream
    debug() const
    {
        return {logger_.get(), Severity::debug};
    }
    Stream
    info() const
    {
        return {logger_.get(), Severity::info};
    }
    Stream
    warn() const
    {
        return {logger_.get(), Severity::warning};
    }
    Stream
    error() const
    {
        return {logger_.get(), Severity::error};
    }
    Stream
    fatal() const
    {
        return {logger_.get(), Severity::fatal};
    }

private:
    std::shared_ptr<LoggerT> logger_;
};

struct LogConfig
{
    Severity severity = Severity::info;
    std::string file;
    bool console = true;
};

/** Install the console and file sinks. Safe to call more than once. */
void
initLogging(LogConfig const& config);

/** Current threshold below which streams are inactive. */
Severity
logThreshold();

template <class T>
Journal::ScopedStream
Journal::Stream::operator<<(T const& t) const
{
    return ScopedStream(*this, t);
}

}  // namespace stealthpool

#ifndef JLOG
#define JLOG(x) \
    if (!(x).active()) \
    { \
    } \
    else \
        x
#endif

#endif
