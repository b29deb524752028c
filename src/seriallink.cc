/**
 * @file seriallink.cc
 * @brief Serial character device backend of the printer link.
 *
 * @class SerialLink
 * @brief Handling the transmission of command chunks over a termios device.
 *
 * @details Most Bluetooth thermal printers expose the Serial Port Profile, and
 * on Linux a paired printer is bound to an RFCOMM character device with
 * `rfcomm bind`. USB printers show up as a USB serial adapter. Either way the
 * printer is a plain termios device, which is presented to the PrinterLink as
 * a single SPP service with a single writable characteristic.
 *
 * The device is opened in non-blocking mode with an exclusive lock, so that
 * two processes can never interleave command streams. Writes use poll() to
 * wait for the device to accept data, so every write is bounded by the given
 * timeout. A watch thread monitors the device while it is open: a hang-up
 * (the RFCOMM connection dropping, or the USB adapter being unplugged) is
 * reported through the link loss handler. Status bytes sent back by the
 * printer are read and discarded by the same thread.
 *
 * The termios settings follow the [serial port programming guide][s-port]:
 * raw mode, 8 data bits, no parity, 1 stop bit and no flow control.
 *
 * [s-port]: https://www.xanthium.in/Serial-Port-Programming-on-Linux
 */
#include "seriallink.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include <algorithm>
#include <chrono>

// Stuff required for tty input and output
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <sys/file.h>
#include <termios.h>
#include <unistd.h>

const std::string SerialLink::spp_service_uuid =
  "00001101-0000-1000-8000-00805f9b34fb";

static speed_t
baud_constant( const unsigned baud )
{
  switch( baud ){
  case 9600:   return B9600;
  case 19200:  return B19200;
  case 38400:  return B38400;
  case 57600:  return B57600;
  case 115200: return B115200;
  case 230400: return B230400;
  default:
    throw connection_error( ( boost::format( "Unsupported baud rate [%u]" )
                              % baud ).str() );
  }
}


SerialLink::SerialLink( const unsigned b, const unsigned payload ) :
  dev_path   ( "" ),
  serial_IO  ( -1 ),
  baud       ( b ),
  max_payload( payload ),
  run_loop   ( false )
{}


SerialLink::~SerialLink()
{
  Close();
}


std::string
SerialLink::DeviceName() const
{
  return "SerialLink@"+dev_path;
}


bool
SerialLink::IsEnabled() const
{
  return true;
}


/**
 * @brief Opening and configuring the character device.
 *
 * Opening an RFCOMM device in non-blocking mode returns immediately while the
 * radio connection is still being established, so the device is only
 * considered open once it reports being writable within the timeout.
 */
void
SerialLink::Open( const std::string& dev, const unsigned timeout_ms )
{
  Close();

  struct termios tty;
  const speed_t  speed = baud_constant( baud );

  dev_path  = dev;
  serial_IO = open( dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK );

  if( serial_IO < 0 ){
    const std::string err = strerror( errno );
    throw connection_error( ( boost::format( "Failed to open printer IO [%s]: %s" )
                              % dev % err ).str() );
  }

  auto fail = [this]( const std::string& msg ){
                close( serial_IO );
                serial_IO = -1;
                return connection_error( msg );
              };

  if( flock( serial_IO, LOCK_EX | LOCK_NB ) ){
    throw fail( ( boost::format( "Failed to lock path [%s]" ) % dev ).str() );
  }

  if( tcgetattr( serial_IO, &tty ) < 0 ){
    throw fail( ( boost::format( "Error getting termios settings: %s" )
                  % strerror( errno ) ).str() );
  }

  cfsetospeed( &tty, speed );
  cfsetispeed( &tty, speed );

  tty.c_cflag |= ( CLOCAL | CREAD );// ignore modem controls
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8;// 8-bit characters
  tty.c_cflag &= ~PARENB;// no parity bit
  tty.c_cflag &= ~CSTOPB;// only need 1 stop bit
  tty.c_cflag &= ~CRTSCTS;// no hardware flowcontrol

  // setup for non-canonical mode
  tty.c_iflag &=
    ~( IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON );
  tty.c_lflag &= ~( ECHO | ECHONL | ICANON | ISIG | IEXTEN );
  tty.c_oflag &= ~OPOST;

  tty.c_cc[VMIN]  = 0;
  tty.c_cc[VTIME] = 0;

  if( tcsetattr( serial_IO, TCSANOW, &tty ) != 0 ){
    throw fail( ( boost::format( "Error setting termios: %s" )
                  % strerror( errno ) ).str() );
  }

  struct pollfd pfd = { serial_IO, POLLOUT, 0 };
  const int     ret = poll( &pfd, 1, timeout_ms );
  if( ret == 0 ){
    throw fail( ( boost::format( "Timeout after %ums waiting for [%s]" )
                  % timeout_ms % dev ).str() );
  } else if( ret < 0 || ( pfd.revents & ( POLLERR | POLLHUP | POLLNVAL ) ) ){
    throw fail( ( boost::format( "Device [%s] is not reachable" ) % dev ).str() );
  }

  tcflush( serial_IO, TCIOFLUSH );
  StartLoopThread();
  printmsg( DeviceName(), ( boost::format( "Opened at %u baud" ) % baud ).str() );
}


void
SerialLink::Close()
{
  EndLoopThread();
  if( serial_IO >= 0 ){
    flock( serial_IO, LOCK_UN );
    close( serial_IO );
    serial_IO = -1;
    printdebug( DeviceName(), "Closed" );
  }
}


std::vector<ServiceInfo>
SerialLink::Services() const
{
  ServiceInfo spp;
  spp.uuid = spp_service_uuid;
  spp.characteristics.push_back( CharacteristicInfo( spp_service_uuid, true ) );
  return { spp };
}


/**
 * @brief A serial line has no transmission unit, the configured payload plays
 * the role of the negotiated value.
 */
unsigned
SerialLink::NegotiateMtu( const unsigned requested )
{
  return std::min( requested, max_payload+PrinterLink::header_overhead );
}


void
SerialLink::Write( const std::string&,
                   const std::string&,
                   const uint8_t*    data,
                   const std::size_t len,
                   const unsigned    timeout_ms )
{
  using namespace std::chrono;

  if( serial_IO < 0 ){
    throw transport_error( "Serial device is not open" );
  }

  const steady_clock::time_point deadline = steady_clock::now()
                                            +milliseconds( timeout_ms );
  std::size_t sent = 0;

  while( sent < len ){
    const long remain = duration_cast<milliseconds>(
      deadline-steady_clock::now() ).count();
    if( remain <= 0 ){
      throw transport_error( ( boost::format(
        "Timeout after %ums with %u of %u bytes written" )
                               % timeout_ms % sent % len ).str() );
    }

    struct pollfd pfd = { serial_IO, POLLOUT, 0 };
    const int     ret = poll( &pfd, 1, int( remain ) );
    if( ret < 0 ){
      if( errno == EINTR ){ continue; }
      throw transport_error( ( boost::format( "Poll failed: %s" )
                               % strerror( errno ) ).str() );
    } else if( ret == 0 ){
      continue;
    }
    if( pfd.revents & ( POLLERR | POLLHUP | POLLNVAL ) ){
      ReportLinkLoss();
      throw transport_error( "Device hung up while writing" );
    }

    const ssize_t n = write( serial_IO, data+sent, len-sent );
    if( n < 0 ){
      if( errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR ){
        continue;
      }
      const int err = errno;
      if( err == EIO || err == ENXIO || err == ENODEV ){
        ReportLinkLoss();
      }
      throw transport_error( ( boost::format( "Write failed: %s" )
                               % strerror( err ) ).str() );
    }
    sent += n;
  }
}


void
SerialLink::SetLinkLossHandler( std::function<void()> handler )
{
  std::lock_guard<std::mutex> lock( handler_mutex );
  loss_handler = handler;
}


void
SerialLink::ReportLinkLoss()
{
  std::function<void()> handler;
  {
    std::lock_guard<std::mutex> lock( handler_mutex );
    handler = loss_handler;
  }
  printwarn( DeviceName(), "Device hung up" );
  if( handler ){ handler(); }
}


/**
 * @brief Listing serial devices that could be printers: bound RFCOMM channels
 * and USB serial adapters.
 */
void
SerialLink::Scan( const unsigned                          timeout_ms,
                  std::function<void( const ScanResult& )> found,
                  const std::atomic<bool>&                 stop )
{
  namespace fs = boost::filesystem;
  const fs::path devdir( "/dev" );

  try {
    for( fs::directory_iterator it( devdir ), end; it != end && !stop; ++it ){
      const std::string name = it->path().filename().string();
      if( !boost::algorithm::starts_with( name, "rfcomm" ) &&
          !boost::algorithm::starts_with( name, "ttyUSB" ) &&
          !boost::algorithm::starts_with( name, "ttyACM" ) ){
        continue;
      }
      ScanResult r;
      r.address = it->path().string();
      r.name    = name;
      r.service_uuids.push_back( spp_service_uuid );
      found( r );
    }
  } catch( fs::filesystem_error& e ){
    throw connection_error( ( boost::format( "Failed to list serial devices: %s" )
                              % e.what() ).str() );
  }
  printdebug( "SerialLink", ( boost::format( "Scan finished within %ums" )
                              % timeout_ms ).str() );
}


/********************************************************************************
 *
 * THREAD MANAGEMENT FUNCTIONS
 *
 *******************************************************************************/

/**
 * @brief Watching the device for hang-ups while it is open.
 *
 * Each iteration waits up to 50 milliseconds for the device to report either
 * incoming data, which is drained, or an error condition, which ends the loop
 * and is reported as a link loss.
 */
void
SerialLink::RunMainLoop( std::atomic<bool>& run_loop )
{
  uint8_t buffer[256];
  while( run_loop == true ){
    struct pollfd pfd = { serial_IO, POLLIN, 0 };
    const int     ret = poll( &pfd, 1, 50 );
    if( ret <= 0 ){ continue; }

    if( pfd.revents & ( POLLERR | POLLHUP | POLLNVAL ) ){
      run_loop = false;
      ReportLinkLoss();
      return;
    }
    if( pfd.revents & POLLIN ){
      const ssize_t n = read( serial_IO, buffer, sizeof( buffer ) );
      if( n > 0 ){
        printdebug( DeviceName(), ( boost::format( "Discarding %d status bytes" )
                                    % n ).str() );
      }
    }
  }
}


void
SerialLink::StartLoopThread()
{
  run_loop    = true;
  loop_thread = std::thread( [this]{
    this->RunMainLoop( std::ref( run_loop ) );
  } );
}


void
SerialLink::EndLoopThread()
{
  run_loop = false;
  if( loop_thread.joinable() ){
    loop_thread.join();
  }
}
