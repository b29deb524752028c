#include "logger.hpp"
#include "tempdir.hpp"

#include <gtest/gtest.h>

#include <fcntl.h>
#include <unistd.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

/**
 * @brief Redirecting the log to a file for the duration of a test.
 */
class LoggerTest : public ::testing::Test
{
protected:
  LoggerTest() :
    path ( dir.File( "log.txt" ) ),
    fd   ( open( path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644 ) ),
    level( get_log_level() )
  {
    set_logging_descriptor( fd );
  }

  ~LoggerTest()
  {
    set_logging_descriptor( STDOUT_FILENO );
    set_log_level( level );
    close( fd );
  }

  std::string
  Content() const
  {
    std::ifstream     in( path );
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  TempDir           dir;
  const std::string path;
  const int         fd;
  const LogLevel    level;
};


TEST_F( LoggerTest, PlainHeadersInFiles )
{
  set_log_level( LogLevel::INFO );
  printmsg( "PrinterLink", "Connected" );
  printwarn( "JobStore", "Disk almost full" );
  printerr( "PrintService", "Job failed" );

  EXPECT_EQ( Content(),
             "[INFO][PrinterLink] Connected\n"
             "[WARNING][JobStore] Disk almost full\n"
             "[ERROR][PrintService] Job failed\n" );
}


TEST_F( LoggerTest, LevelFiltering )
{
  set_log_level( LogLevel::WARNING );
  printdebug( "Quantizer", "hidden" );
  printinfo( "Quantizer", "hidden" );
  printwarn( "Quantizer", "shown" );
  EXPECT_EQ( Content(), "[WARNING][Quantizer] shown\n" );

  set_log_level( LogLevel::DEBUG );
  printdebug( "Quantizer", "details" );
  EXPECT_EQ( Content(), "[WARNING][Quantizer] shown\n[DEBUG][Quantizer] details\n" );
}


TEST( LogLevelNames, Parsing )
{
  EXPECT_EQ( parse_log_level( "DEBUG" ), LogLevel::DEBUG );
  EXPECT_EQ( parse_log_level( "warn" ), LogLevel::WARNING );
  EXPECT_EQ( parse_log_level( "error" ), LogLevel::ERROR );
  EXPECT_THROW( parse_log_level( "verbose" ), std::invalid_argument );
}


TEST( LogColors, StripsNestedColors )
{
  EXPECT_EQ( GREEN( "ok" ), "\033[1;32mok\033[0m" );
  EXPECT_EQ( RED( GREEN( "ok" ) ), "\033[1;31mok\033[0m" );
}
