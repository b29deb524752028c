#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>

/**
 * @defgroup Logging Logging
 * @brief Device-tagged logging facilities shared by all modules.
 *
 * Every message is tagged with the name of the device (or module) issuing it,
 * so that a single log stream can be filtered by component.
 * @{
 */
enum class LogLevel : int
{
  DEBUG   = 10,
  INFO    = 20,
  WARNING = 30,
  ERROR   = 40
};

extern void printdebug( const std::string& device,
                        const std::string& x );
extern void printinfo( const std::string& device,
                       const std::string& x );
extern void printmsg( const std::string& device,
                      const std::string& x );
extern void printwarn( const std::string& device,
                       const std::string& x );
extern void printerr( const std::string& device,
                      const std::string& x );

// Output control
extern void     set_logging_descriptor( const int fd );
extern void     set_log_level( const LogLevel level );
extern LogLevel get_log_level();
extern LogLevel parse_log_level( const std::string& name );

// Color coding
extern std::string GREEN( const std::string& str );
extern std::string YELLOW( const std::string& str );
extern std::string RED( const std::string& str );
extern std::string CYAN( const std::string& str );
/** @} */
#endif
