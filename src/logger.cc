/**
 * @file logger.cc
 * @brief Implementation of the device-tagged logging functions.
 *
 * All logging functions are routed to a single process-wide Logger object,
 * which writes one line per message to a file descriptor (stdout unless
 * redirected with set_logging_descriptor). Each line carries a level header
 * and the device name:
 *
 * ```
 * [WARNING][PrinterLink] Chunk payload negotiation unavailable...
 * ```
 *
 * Headers are only colored when the descriptor is a terminal, so that log
 * files stay plain text. The Logger is guarded by a mutex as the print
 * service worker and the link watch threads all log concurrently.
 */
#include "logger.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include <mutex>
#include <stdexcept>
#include <regex>

#include <unistd.h>

namespace {

class Logger
{
public:
  Logger() :
    _fd   ( STDOUT_FILENO ),
    _level( LogLevel::INFO )
  {}

  void PrintMessage( const LogLevel     level,
                     const std::string& device,
                     const std::string& msg );

  void SetDescriptor( const int fd )
  {
    std::lock_guard<std::mutex> lock( _mutex );
    _fd = fd;
  }

  void SetLevel( const LogLevel level )
  {
    std::lock_guard<std::mutex> lock( _mutex );
    _level = level;
  }

  LogLevel Level()
  {
    std::lock_guard<std::mutex> lock( _mutex );
    return _level;
  }

private:
  std::mutex _mutex;
  int        _fd;
  LogLevel   _level;

  std::string header( const LogLevel ) const;
};

Logger GlobalLogger;


std::string
color( const std::string& str, const unsigned colorcode )
{
  static const std::regex color_regex( "\033\\[[\\d;]+m" );
  const std::string       ans = std::regex_replace( str, color_regex, "" );
  return ( boost::format( "\033[1;%dm%s\033[0m" ) % colorcode % ans ).str();
}


std::string
Logger::header( const LogLevel level ) const
{
  const bool tty = isatty( _fd );
  switch( level ){
  case LogLevel::DEBUG:
    return tty ? CYAN( "[DEBUG]" ) : "[DEBUG]";
  case LogLevel::INFO:
    return tty ? GREEN( "[INFO]" ) : "[INFO]";
  case LogLevel::WARNING:
    return tty ? YELLOW( "[WARNING]" ) : "[WARNING]";
  default:
    return tty ? RED( "[ERROR]" ) : "[ERROR]";
  }
}


void
Logger::PrintMessage( const LogLevel     level,
                      const std::string& device,
                      const std::string& msg )
{
  std::lock_guard<std::mutex> lock( _mutex );
  if( static_cast<int>( level ) < static_cast<int>( _level ) ){
    return;
  }

  const std::string line = ( boost::format( "%s[%s] %s\n" )
                             % header( level ) % device % msg ).str();

  // Partial writes are retried, errors are dropped as there is nowhere left
  // to report them.
  const char* ptr    = line.c_str();
  size_t      remain = line.length();
  while( remain > 0 ){
    const ssize_t n = write( _fd, ptr, remain );
    if( n <= 0 ){ break; }
    ptr    += n;
    remain -= n;
  }
}

}


std::string
GREEN( const std::string& str )
{ return color( str, 32 ); }

std::string
YELLOW( const std::string& str )
{ return color( str, 33 ); }

std::string
RED( const std::string& str )
{ return color( str, 31 ); }

std::string
CYAN( const std::string& str )
{ return color( str, 36 ); }


void
printdebug( const std::string& dev, const std::string& msg )
{
  GlobalLogger.PrintMessage( LogLevel::DEBUG, dev, msg );
}


void
printinfo( const std::string& dev, const std::string& msg )
{
  GlobalLogger.PrintMessage( LogLevel::INFO, dev, msg );
}


/**
 * @brief Printing a message with the standard info header. This is kept as a
 * parallel to printinfo for call sites reporting user-facing progress.
 */
void
printmsg( const std::string& dev, const std::string& msg )
{
  GlobalLogger.PrintMessage( LogLevel::INFO, dev, msg );
}


void
printwarn( const std::string& dev, const std::string& msg )
{
  GlobalLogger.PrintMessage( LogLevel::WARNING, dev, msg );
}


void
printerr( const std::string& dev, const std::string& msg )
{
  GlobalLogger.PrintMessage( LogLevel::ERROR, dev, msg );
}


void
set_logging_descriptor( const int fd )
{
  GlobalLogger.SetDescriptor( fd );
}


void
set_log_level( const LogLevel level )
{
  GlobalLogger.SetLevel( level );
}


LogLevel
get_log_level()
{
  return GlobalLogger.Level();
}


/**
 * @brief Converting a level name (as found in configuration files) to the
 * logging level. Unknown names are rejected.
 */
LogLevel
parse_log_level( const std::string& name )
{
  const std::string lower = boost::algorithm::to_lower_copy( name );
  if( lower == "debug" ){
    return LogLevel::DEBUG;
  } else if( lower == "info" ){
    return LogLevel::INFO;
  } else if( lower == "warning" || lower == "warn" ){
    return LogLevel::WARNING;
  } else if( lower == "error" ){
    return LogLevel::ERROR;
  }
  throw std::invalid_argument(
    ( boost::format( "Unknown logging level [%s]" ) % name ).str() );
}
