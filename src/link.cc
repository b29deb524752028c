/**
 * @file link.cc
 * @brief Chunked transport of printer command streams.
 *
 * @class PrinterLink
 * @brief Owner of the connection to the printer.
 *
 * @details Thermal printers with a wireless interface accept data as a
 * sequence of small writes to a single characteristic, where the largest
 * write is limited by the negotiated maximum transmission unit (MTU) minus the
 * 3 byte ATT header. The PrinterLink wraps a LinkDevice and handles:
 *
 * - Selection of the printer interface on connection. Services are tried in
 *   the order: the well known printer service `000018f0-...`, the vendor
 *   serial service `49535343-...`, and finally any service exposing a
 *   writable characteristic. If nothing is writable, the connection fails.
 * - Negotiation of the chunk size. The granted MTU is authoritative. If the
 *   device cannot negotiate, the minimum MTU of 23 bytes (20 byte payload) is
 *   assumed.
 * - Splitting of a command buffer into strictly ordered chunks, with a pacing
 *   delay between consecutive chunks (never after the last one). A failing
 *   chunk fails the whole write and closes the connection.
 * - Tracking of link loss reported asynchronously by the device.
 *
 * The state machine is Disconnected -> Connecting -> Connected, and back to
 * Disconnected on Disconnect() or link loss. Connecting while connected first
 * tears down the existing connection. There is at most one live endpoint per
 * PrinterLink. Writes are serialized, but callers are expected to only have a
 * single writer.
 */
#include "link.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

#include <algorithm>
#include <chrono>

static const std::string devname = "PrinterLink";

const std::string PrinterLink::printer_service_uuid =
  "000018f0-0000-1000-8000-00805f9b34fb";
const std::string PrinterLink::vendor_service_uuid =
  "49535343-fe7d-4ae5-8fa9-9fafd205e455";

constexpr unsigned PrinterLink::header_overhead;
constexpr unsigned PrinterLink::min_mtu;
constexpr unsigned PrinterLink::max_mtu;

std::string
link_state_name( const LinkState s )
{
  switch( s ){
  case LinkState::CONNECTING: return "connecting";
  case LinkState::CONNECTED:  return "connected";
  default:                    return "disconnected";
  }
}


PrinterLink::PrinterLink( LinkDevice& dev ) :
  device            ( dev ),
  state             ( LinkState::DISCONNECTED ),
  link_lost         ( false ),
  connect_timeout_ms( 10000 ),
  write_timeout_ms  ( 5000 ),
  chunk_delay_ms    ( 1 ),
  requested_payload ( max_mtu-header_overhead ),
  scan_stop         ( false ),
  scan_running      ( false )
{
  device.SetLinkLossHandler( [this](){
    OnLinkLoss();
  } );
}


PrinterLink::~PrinterLink()
{
  StopScan();
  Disconnect();
  device.SetLinkLossHandler( nullptr );
}


/**
 * @brief Largest chunk payload for a granted MTU. MTU values below the
 * protocol minimum (including 0 for "not negotiated") fall back to the minimum.
 */
unsigned
PrinterLink::PayloadForMtu( const unsigned mtu )
{
  const unsigned m = std::max( mtu, min_mtu );
  return m-header_overhead;
}


static bool
find_writable( const ServiceInfo& service, std::string& characteristic )
{
  for( const auto& c : service.characteristics ){
    if( c.writable ){
      characteristic = c.uuid;
      return true;
    }
  }
  return false;
}


static bool
uuid_matches( const std::string& uuid, const std::string& target )
{
  return boost::algorithm::iequals( uuid, target );
}


static bool
uuid_has_prefix( const std::string& uuid, const std::string& prefix )
{
  return boost::algorithm::istarts_with( uuid, prefix );
}


/**
 * @brief Choosing the service and characteristic used for printing.
 *
 * A preferred service/characteristic pair (typically the one saved with the
 * printer) is used when the device exposes it as writable. Otherwise the
 * standard discovery priority applies.
 */
void
PrinterLink::SelectInterface( const std::vector<ServiceInfo>& services,
                              const std::string&              preferred_service,
                              const std::string&              preferred_char,
                              std::string&                    service,
                              std::string&                    characteristic )
{
  if( !preferred_service.empty() && !preferred_char.empty() ){
    for( const auto& s : services ){
      if( !uuid_matches( s.uuid, preferred_service ) ){ continue; }
      for( const auto& c : s.characteristics ){
        if( c.writable && uuid_matches( c.uuid, preferred_char ) ){
          service        = s.uuid;
          characteristic = c.uuid;
          return;
        }
      }
    }
  }

  for( const std::string& prefix : { std::string( "000018f0" ),
                                     std::string( "49535343" ) } ){
    for( const auto& s : services ){
      if( uuid_has_prefix( s.uuid, prefix ) && find_writable( s, characteristic ) ){
        service = s.uuid;
        return;
      }
    }
  }

  for( const auto& s : services ){
    if( find_writable( s, characteristic ) ){
      service = s.uuid;
      return;
    }
  }

  throw connection_error( "No usable printer interface" );
}


void
PrinterLink::Connect( const std::string& address,
                      const unsigned     paper_width,
                      const std::string& service_uuid,
                      const std::string& characteristic_uuid )
{
  // A lost link is already marked disconnected but still holds its endpoint.
  const std::string previous = Endpoint().address;
  if( state != LinkState::DISCONNECTED || !previous.empty() ){
    printmsg( devname, ( boost::format(
      "Closing connection to [%s] before connecting to [%s]" )
                         % previous % address ).str() );
    Disconnect();
  }

  std::lock_guard<std::mutex> lock( connect_mutex );

  if( !device.IsEnabled() ){
    throw connection_error( "Link is disabled" );
  }

  printmsg( devname, ( boost::format( "Connecting to [%s]..." ) % address ).str() );
  state     = LinkState::CONNECTING;
  link_lost = false;

  PrinterEndpoint ep;
  ep.address     = address;
  ep.paper_width = paper_width;

  try {
    device.Open( address, connect_timeout_ms );
    SelectInterface( device.Services(), service_uuid, characteristic_uuid,
                     ep.service_uuid, ep.characteristic_uuid );
    const unsigned granted = device.NegotiateMtu( requested_payload+header_overhead );
    ep.mtu         = std::max( granted, min_mtu );
    ep.max_payload = PayloadForMtu( granted );
    if( granted == 0 ){
      printwarn( devname, ( boost::format(
        "MTU negotiation unavailable, assuming %u byte payload" )
                            % ep.max_payload ).str() );
    }
  } catch( connection_error& e ){
    close_unlocked();
    printerr( devname, e.what() );
    throw;
  } catch( std::runtime_error& e ){
    close_unlocked();
    printerr( devname, e.what() );
    throw connection_error( ( boost::format( "Failed to connect to [%s]: %s" )
                              % address % e.what() ).str() );
  }

  if( link_lost ){
    close_unlocked();
    throw connection_error( ( boost::format(
      "Link to [%s] dropped while connecting" ) % address ).str() );
  }

  endpoint = ep;
  state    = LinkState::CONNECTED;
  printmsg( devname, GREEN( ( boost::format(
    "Connected to [%s] via %s/%s, MTU %u (%u byte chunks)" )
                              % address % ep.service_uuid % ep.characteristic_uuid
                              % ep.mtu % ep.max_payload ).str() ) );
}


void
PrinterLink::Disconnect()
{
  std::lock_guard<std::mutex> lock( connect_mutex );
  if( state == LinkState::DISCONNECTED && endpoint.address.empty() ){
    return;
  }
  close_unlocked();
  printmsg( devname, "Disconnected" );
}


void
PrinterLink::close_unlocked()
{
  device.Close();
  endpoint = PrinterEndpoint();
  state    = LinkState::DISCONNECTED;
}


PrinterEndpoint
PrinterLink::Endpoint() const
{
  std::lock_guard<std::mutex> lock( connect_mutex );
  return endpoint;
}


/**
 * @brief Sending a command buffer in chunks of at most the negotiated payload.
 *
 * The optional cancel flag is checked before every chunk. Raising it stops the
 * transfer with a job_canceled exception, bytes already sent are not
 * reclaimed. A failing chunk, or a link loss while writing, disconnects the
 * transport and fails the whole write.
 */
void
PrinterLink::Write( const CommandBuffer& data, const std::atomic<bool>* cancel )
{
  std::lock_guard<std::mutex> lock( write_mutex );

  if( state != LinkState::CONNECTED ){
    if( link_lost ){
      throw link_lost_error( "Link to the printer was lost" );
    }
    throw transport_error( "Printer is not connected" );
  }

  const PrinterEndpoint ep    = Endpoint();
  const std::size_t     chunk = ep.max_payload;
  const std::size_t     total = ( data.size()+chunk-1 ) / chunk;

  printdebug( devname, ( boost::format( "Sending %u bytes in %u chunks of %u bytes" )
                         % data.size() % total % chunk ).str() );

  for( std::size_t offset = 0, index = 0; offset < data.size(); offset += chunk, ++index ){
    if( cancel != nullptr && *cancel ){
      throw job_canceled( ( boost::format( "Write canceled after %u of %u chunks" )
                            % index % total ).str() );
    }
    if( link_lost || state != LinkState::CONNECTED ){
      Disconnect();
      throw link_lost_error( ( boost::format(
        "Link lost after %u of %u chunks" ) % index % total ).str() );
    }

    const std::size_t len = std::min( chunk, data.size()-offset );
    try {
      device.Write( ep.service_uuid, ep.characteristic_uuid,
                    data.data()+offset, len, write_timeout_ms );
    } catch( std::runtime_error& e ){
      const bool lost = link_lost;
      Disconnect();
      if( lost ){
        throw link_lost_error( ( boost::format(
          "Link lost while writing chunk %u of %u: %s" )
                                 % ( index+1 ) % total % e.what() ).str() );
      }
      throw transport_error( ( boost::format( "Failed to write chunk %u of %u: %s" )
                               % ( index+1 ) % total % e.what() ).str() );
    }

    if( offset+chunk < data.size() && chunk_delay_ms > 0 ){
      std::this_thread::sleep_for( std::chrono::milliseconds( chunk_delay_ms ) );
    }
  }
}


void
PrinterLink::OnLinkLoss()
{
  if( state == LinkState::DISCONNECTED ){ return; }
  link_lost = true;
  state     = LinkState::DISCONNECTED;
  printwarn( devname, RED( "Link to the printer was lost" ) );

  std::function<void()> listener;
  {
    std::lock_guard<std::mutex> lock( listener_mutex );
    listener = loss_listener;
  }
  if( listener ){ listener(); }
}


void
PrinterLink::SetLinkLossListener( std::function<void()> listener )
{
  std::lock_guard<std::mutex> lock( listener_mutex );
  loss_listener = listener;
}


void
PrinterLink::SetTimeouts( const unsigned connect_ms, const unsigned write_ms )
{
  connect_timeout_ms = connect_ms;
  write_timeout_ms   = write_ms;
}


void
PrinterLink::SetChunkDelay( const unsigned ms )
{
  chunk_delay_ms = ms;
}


/**
 * @brief Payload size asked for when negotiating the MTU on the next
 * connection. The value actually granted by the device takes precedence.
 */
void
PrinterLink::SetRequestedPayload( const unsigned payload )
{
  requested_payload = std::max( std::min( payload, max_mtu-header_overhead ),
                                min_mtu-header_overhead );
}


/********************************************************************************
 *
 * DISCOVERY OF PRINTERS
 *
 *******************************************************************************/

/**
 * @brief Heuristic for endpoints that are likely printers: either the
 * advertised name contains a common printer model pattern, or one of the
 * known printer services is advertised.
 */
bool
PrinterLink::IsProbablyPrinter( const ScanResult& r )
{
  static const std::vector<std::string> patterns = {
    "printer", "print", "pos", "esc", "thermal", "receipt", "epson", "star",
    "bixolon", "citizen", "zebra", "tsc", "xprinter", "goojprt", "netum",
    "pt-", "mpt-", "rpt", "zj-", "mtp-", "mph-", "hm-", "bt-", "spp", "serial"
  };

  const std::string name = boost::algorithm::to_lower_copy( r.name );
  for( const auto& p : patterns ){
    if( boost::algorithm::contains( name, p ) ){
      return true;
    }
  }

  for( const auto& uuid : r.service_uuids ){
    const std::string u = boost::algorithm::to_lower_copy( uuid );
    if( boost::algorithm::contains( u, "18f0" ) ||
        boost::algorithm::contains( u, "49535343" ) ||
        u == "00001101-0000-1000-8000-00805f9b34fb" ){
      return true;
    }
  }
  return false;
}


/**
 * @brief Scanning in a background thread, reporting likely printers as they
 * are found. The done callback receives an empty string on normal completion
 * and the error message if the scan failed.
 */
void
PrinterLink::Scan( const unsigned   seconds,
                   ScanCallback     found,
                   ScanDoneCallback done )
{
  StopScan();
  scan_stop    = false;
  scan_running = true;

  scan_thread = std::thread( [this, seconds, found, done](){
    std::string error = "";
    try {
      device.Scan( seconds * 1000, [&found]( const ScanResult& r ){
        if( IsProbablyPrinter( r ) ){ found( r ); }
      }, scan_stop );
    } catch( std::runtime_error& e ){
      error = e.what();
      printerr( devname, ( boost::format( "Scan failed: %s" ) % error ).str() );
    }
    scan_running = false;
    if( done ){ done( error ); }
  } );
}


void
PrinterLink::StopScan()
{
  scan_stop = true;
  if( scan_thread.joinable() ){
    scan_thread.join();
  }
}


std::vector<ScanResult>
PrinterLink::ScanFor( const unsigned seconds )
{
  std::vector<ScanResult> ans;
  std::atomic<bool>       stop( false );
  device.Scan( seconds * 1000, [&ans]( const ScanResult& r ){
    if( IsProbablyPrinter( r ) ){ ans.push_back( r ); }
  }, stop );
  return ans;
}
