/**
 * @file discovery.cc
 * @brief Printer discovery for the host print subsystem.
 *
 * @class DiscoverySession
 * @brief Advertising the virtual thermal printer.
 *
 * @details Whatever the number of saved printers, the host always sees exactly
 * one printer: a virtual "Raw Thermal" printer that is always idle. Jobs sent
 * to it are routed by the print service to whichever physical printer is
 * currently selected, or held as pending jobs if none is. The advertised
 * capabilities are the two thermal roll widths (the configured default width
 * marked as default), the ISO A4 and US Letter sizes that are scaled down to
 * the roll width, a single 203 dpi resolution, and monochrome output only.
 *
 * Media sizes are given in mils (1/1000 inch). The height of the roll sizes
 * is an arbitrary large value as roll paper has no fixed length.
 */
#include "discovery.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <boost/format.hpp>

static const std::string devname = "Discovery";

const std::string DiscoverySession::virtual_printer_id   = "raw_thermal_virtual";
const std::string DiscoverySession::virtual_printer_name = "Raw Thermal";

DiscoverySession::DiscoverySession( const PrinterConfig& c, DiscoveryListener& l ) :
  config     ( c ),
  listener   ( l ),
  discovering( false ),
  destroyed  ( false )
{}


DiscoverySession::~DiscoverySession()
{
  if( !Destroyed() ){
    Destroy();
  }
}


PrinterCapabilities
DiscoverySession::BuildCapabilities( const unsigned paper_width )
{
  static const unsigned roll_height_mils = 100000;

  PrinterCapabilities caps;
  caps.media = {
    { "THERMAL_58MM", "58mm Thermal Roll", 2283, roll_height_mils, paper_width == 58 },
    { "THERMAL_80MM", "80mm Thermal Roll", 3150, roll_height_mils, paper_width == 80 },
    { "ISO_A4",       "ISO A4",            8268, 11693,            false             },
    { "NA_LETTER",    "Letter",            8500, 11000,            false             }
  };
  caps.resolution    = { "203dpi", "203 DPI", 203, 203 };
  caps.color_modes   = { ColorMode::MONOCHROME };
  caps.default_color = ColorMode::MONOCHROME;
  return caps;
}


PrinterInfo
DiscoverySession::VirtualPrinter() const
{
  PrinterInfo info;
  info.id           = virtual_printer_id;
  info.name         = virtual_printer_name;
  info.description  = "Thermal printer via Bluetooth";
  info.status       = PrinterStatus::IDLE;
  info.capabilities = BuildCapabilities( config.Settings().paper_width );
  return info;
}


void
DiscoverySession::CheckAlive() const
{
  if( destroyed ){
    throw input_error( "Discovery session was destroyed" );
  }
}


void
DiscoverySession::ReportPrinters()
{
  printdebug( devname, "Reporting virtual printer: "+virtual_printer_name );
  listener.OnPrintersAdded( { VirtualPrinter() } );
}


void
DiscoverySession::StartDiscovery( const std::vector<std::string>& priority )
{
  {
    std::lock_guard<std::mutex> lock( session_mutex );
    CheckAlive();
    discovering = true;
  }
  printmsg( devname, ( boost::format( "Starting printer discovery (%u priority printers)" )
                       % priority.size() ).str() );
  ReportPrinters();
}


void
DiscoverySession::StopDiscovery()
{
  std::lock_guard<std::mutex> lock( session_mutex );
  CheckAlive();
  discovering = false;
  printmsg( devname, "Stopping printer discovery" );
}


/**
 * @brief Only the virtual printer is ever valid. Returns the subset of the
 * given ids that are valid.
 */
std::vector<std::string>
DiscoverySession::ValidatePrinters( const std::vector<std::string>& ids )
{
  {
    std::lock_guard<std::mutex> lock( session_mutex );
    CheckAlive();
  }
  std::vector<std::string> ans;
  for( const auto& id : ids ){
    if( id == virtual_printer_id ){
      ans.push_back( id );
    } else {
      printwarn( devname, ( boost::format( "Unknown printer [%s]" ) % id ).str() );
    }
  }
  printdebug( devname, ( boost::format( "Validated %u of %u printers" )
                         % ans.size() % ids.size() ).str() );
  return ans;
}


void
DiscoverySession::StartTracking( const std::string& id )
{
  {
    std::lock_guard<std::mutex> lock( session_mutex );
    CheckAlive();
    tracked.insert( id );
  }
  printdebug( devname, "Start tracking printer: "+id );
  ReportPrinters();
}


void
DiscoverySession::StopTracking( const std::string& id )
{
  std::lock_guard<std::mutex> lock( session_mutex );
  CheckAlive();
  tracked.erase( id );
  printdebug( devname, "Stop tracking printer: "+id );
}


void
DiscoverySession::Destroy()
{
  std::lock_guard<std::mutex> lock( session_mutex );
  discovering = false;
  destroyed   = true;
  tracked.clear();
  printdebug( devname, "Discovery session destroyed" );
}


bool
DiscoverySession::Discovering() const
{
  std::lock_guard<std::mutex> lock( session_mutex );
  return discovering;
}


bool
DiscoverySession::Destroyed() const
{
  std::lock_guard<std::mutex> lock( session_mutex );
  return destroyed;
}


std::set<std::string>
DiscoverySession::Tracked() const
{
  std::lock_guard<std::mutex> lock( session_mutex );
  return tracked;
}
