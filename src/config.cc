/**
 * @file config.cc
 * @brief Persistent configuration of the printing pipeline.
 *
 * @class PrinterConfig
 * @brief Saved printers, the selected printer and application settings.
 *
 * @details The configuration is stored as a single JSON file:
 *
 * ```json
 * {
 *   "printers": [
 *     { "id": "pt210", "name": "PT-210", "type": "serial",
 *       "address": "/dev/rfcomm0", "paper_width": 58,
 *       "service_uuid": "", "characteristic_uuid": "" }
 *   ],
 *   "current_printer": "pt210",
 *   "settings": { "paper_width": 58, "auto_cut": true, "feed_lines": 3,
 *                 "density": "normal", "encoding": "UTF-8" },
 *   "link": { "baud": 9600, "connect_timeout_ms": 10000,
 *             "write_timeout_ms": 5000, "chunk_delay_ms": 1,
 *             "page_delay_ms": 500, "max_payload": 512 },
 *   "spool_dir": "/var/spool/rawthermal",
 *   "log": { "level": "info", "file": "" }
 * }
 * ```
 *
 * Missing entries take their default values. Entries that cannot be
 * interpreted are reported with a warning and also take their default value,
 * so that a single bad entry never prevents printing. All accessors are
 * protected by a mutex as the configuration is shared between the user facing
 * commands and the print worker thread, which only ever reads a snapshot
 * taken at the start of a job. Every modification is written back to the file
 * if the configuration was loaded from one.
 */
#include "config.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <cstdlib>

namespace pt = boost::property_tree;
namespace fs = boost::filesystem;

static const std::string devname = "PrinterConfig";

/**
 * @brief Per-user state directory for pending jobs when no configuration file
 * is given: $XDG_STATE_HOME/rawthermal/spool, falling back to
 * ~/.local/state/rawthermal/spool.
 */
static std::string
default_spool_dir()
{
  const char* state = std::getenv( "XDG_STATE_HOME" );
  if( state != nullptr && state[0] != '\0' ){
    return ( fs::path( state ) / "rawthermal" / "spool" ).string();
  }
  const char* home = std::getenv( "HOME" );
  if( home != nullptr && home[0] != '\0' ){
    return ( fs::path( home ) / ".local" / "state" / "rawthermal" / "spool" ).string();
  }
  return ( fs::current_path() / ".rawthermal" / "spool" ).string();
}

/**
 * @brief Reading a single value, warning when the entry exists but cannot be
 * converted to the requested type.
 */
template<typename T>
static T
read_value( const pt::ptree& tree, const std::string& key, const T& def )
{
  if( !tree.get_optional<std::string>( key ) ){
    return def;
  }
  const boost::optional<T> val = tree.get_optional<T>( key );
  if( !val ){
    printwarn( devname, ( boost::format(
      "Cannot interpret entry [%s]=[%s], using default" )
                          % key % tree.get<std::string>( key ) ).str() );
    return def;
  }
  return *val;
}


static unsigned
read_paper_width( const pt::ptree& tree, const std::string& key,
                  const unsigned def )
{
  const unsigned w = read_value<unsigned>( tree, key, def );
  if( w != 58 && w != 80 ){
    printwarn( devname, ( boost::format(
      "Unsupported paper width [%u] mm, using %u mm" ) % w % def ).str() );
    return def;
  }
  return w;
}


Density
parse_density( const std::string& name )
{
  const std::string n = boost::algorithm::to_lower_copy( name );
  if( n == "light" ){ return Density::LIGHT; }
  if( n == "normal" ){ return Density::NORMAL; }
  if( n == "dark" ){ return Density::DARK; }
  throw input_error( ( boost::format( "Unknown print density [%s]" ) % name ).str() );
}


std::string
density_name( const Density d )
{
  switch( d ){
  case Density::LIGHT: return "light";
  case Density::DARK:  return "dark";
  default:             return "normal";
  }
}


unsigned
paper_dots( const unsigned paper_width_mm )
{
  return paper_width_mm == 80 ? 576 : 384;
}


unsigned
line_columns( const unsigned paper_width_mm )
{
  return paper_width_mm == 80 ? 48 : 32;
}


/**
 * @brief Paper width of the job: the selected printer's own width if a printer
 * is selected, the application default otherwise.
 */
unsigned
ConfigSnapshot::PaperWidth() const
{
  return has_printer ? printer.paper_width : settings.paper_width;
}


unsigned
ConfigSnapshot::PaperDots() const
{
  return paper_dots( PaperWidth() );
}


unsigned
ConfigSnapshot::LineWidth() const
{
  return line_columns( PaperWidth() );
}


/**
 * @brief Level for the GS | density command, on the 0-7 scale.
 */
int
ConfigSnapshot::DensityLevel() const
{
  switch( settings.density ){
  case Density::LIGHT: return 2;
  case Density::DARK:  return 6;
  default:             return 4;
  }
}


PrinterConfig::PrinterConfig()
{
  InitVarDefault();
}


PrinterConfig::PrinterConfig( const std::string& filename )
{
  InitVarDefault();
  Load( filename );
}


void
PrinterConfig::InitVarDefault()
{
  printers.clear();
  current_id = "";
  settings   = PrintSettings();
  link       = LinkSettings();
  log        = LogSettings();
  spool_dir  = default_spool_dir();
}


/**
 * @brief Loading the configuration file. A file that does not exist yet is not
 * an error: the defaults are used and the file is created on the first
 * modification.
 */
void
PrinterConfig::Load( const std::string& filename )
{
  std::lock_guard<std::mutex> lock( config_mutex );
  InitVarDefault();
  path = filename;

  const fs::path parent = fs::absolute( fs::path( filename ) ).parent_path();
  spool_dir = ( parent / "spool" ).string();

  if( !fs::exists( filename ) ){
    printmsg( devname, ( boost::format(
      "Configuration file [%s] does not exist, using defaults" )
                         % filename ).str() );
    return;
  }

  pt::ptree tree;
  try {
    pt::read_json( filename, tree );
  } catch( pt::json_parser_error& e ){
    throw persistence_error( ( boost::format(
      "Failed to parse configuration file [%s]: %s" )
                               % filename % e.what() ).str() );
  }

  if( tree.get_child_optional( "printers" ) ){
    for( const auto& it : tree.get_child( "printers" ) ){
      const pt::ptree& entry = it.second;
      SavedPrinter     p;
      p.id                  = read_value<std::string>( entry, "id", "" );
      p.name                = read_value<std::string>( entry, "name", p.id );
      p.type                = read_value<std::string>( entry, "type", p.type );
      p.address             = read_value<std::string>( entry, "address", "" );
      p.paper_width         = read_paper_width( entry, "paper_width", 58 );
      p.service_uuid        = read_value<std::string>( entry, "service_uuid", "" );
      p.characteristic_uuid = read_value<std::string>( entry,
                                                       "characteristic_uuid",
                                                       "" );
      if( p.id.empty() ){
        printwarn( devname, "Skipping saved printer without an id" );
        continue;
      }
      if( has_printer_unlocked( p.id ) ){
        printwarn( devname, ( boost::format(
          "Printer [%s] redefined! Using the latter entry" ) % p.id ).str() );
        for( auto& old : printers ){
          if( old.id == p.id ){ old = p; }
        }
        continue;
      }
      printers.push_back( p );
    }
  }

  current_id = read_value<std::string>( tree, "current_printer", "" );
  if( !current_id.empty() && !has_printer_unlocked( current_id ) ){
    printwarn( devname, ( boost::format(
      "Current printer [%s] is not a saved printer, clearing selection" )
                          % current_id ).str() );
    current_id = "";
  }

  settings.paper_width = read_paper_width( tree, "settings.paper_width",
                                           settings.paper_width );
  settings.auto_cut   = read_value<bool>( tree, "settings.auto_cut",
                                          settings.auto_cut );
  settings.feed_lines = read_value<unsigned>( tree, "settings.feed_lines",
                                              settings.feed_lines );

  const std::string density = read_value<std::string>( tree, "settings.density",
                                                       "normal" );
  const std::string encoding = read_value<std::string>( tree, "settings.encoding",
                                                        "UTF-8" );
  try {
    settings.density = parse_density( density );
  } catch( input_error& e ){
    printwarn( devname, std::string( e.what() )+", using normal" );
  }
  try {
    settings.encoding = parse_encoding( encoding );
  } catch( input_error& e ){
    printwarn( devname, std::string( e.what() )+", using UTF-8" );
  }

  link.baud = read_value<unsigned>( tree, "link.baud", link.baud );
  link.connect_timeout_ms = read_value<unsigned>( tree, "link.connect_timeout_ms",
                                                  link.connect_timeout_ms );
  link.write_timeout_ms = read_value<unsigned>( tree, "link.write_timeout_ms",
                                                link.write_timeout_ms );
  link.chunk_delay_ms = read_value<unsigned>( tree, "link.chunk_delay_ms",
                                              link.chunk_delay_ms );
  link.page_delay_ms = read_value<unsigned>( tree, "link.page_delay_ms",
                                             link.page_delay_ms );
  link.max_payload = read_value<unsigned>( tree, "link.max_payload",
                                           link.max_payload );

  spool_dir = read_value<std::string>( tree, "spool_dir", spool_dir );

  log.level = read_value<std::string>( tree, "log.level", log.level );
  log.file  = read_value<std::string>( tree, "log.file", log.file );

  printdebug( devname, ( boost::format(
    "Loaded [%s]: %u saved printers, current [%s]" )
                         % filename % printers.size() % current_id ).str() );
}


void
PrinterConfig::Save() const
{
  std::lock_guard<std::mutex> lock( config_mutex );
  save_unlocked();
}


/**
 * @brief Writing the file through a temporary file that is renamed over the
 * target, so a crash never leaves a truncated configuration behind.
 */
void
PrinterConfig::save_unlocked() const
{
  if( path.empty() ){ return; }

  pt::ptree tree;
  pt::ptree printer_list;

  for( const auto& p : printers ){
    pt::ptree entry;
    entry.put( "id",                  p.id );
    entry.put( "name",                p.name );
    entry.put( "type",                p.type );
    entry.put( "address",             p.address );
    entry.put( "paper_width",         p.paper_width );
    entry.put( "service_uuid",        p.service_uuid );
    entry.put( "characteristic_uuid", p.characteristic_uuid );
    printer_list.push_back( std::make_pair( "", entry ) );
  }

  tree.add_child( "printers", printer_list );
  tree.put( "current_printer",         current_id );
  tree.put( "settings.paper_width",    settings.paper_width );
  tree.put( "settings.auto_cut",       settings.auto_cut );
  tree.put( "settings.feed_lines",     settings.feed_lines );
  tree.put( "settings.density",        density_name( settings.density ) );
  tree.put( "settings.encoding",       encoding_name( settings.encoding ) );
  tree.put( "link.baud",               link.baud );
  tree.put( "link.connect_timeout_ms", link.connect_timeout_ms );
  tree.put( "link.write_timeout_ms",   link.write_timeout_ms );
  tree.put( "link.chunk_delay_ms",     link.chunk_delay_ms );
  tree.put( "link.page_delay_ms",      link.page_delay_ms );
  tree.put( "link.max_payload",        link.max_payload );
  tree.put( "spool_dir",               spool_dir );
  tree.put( "log.level",               log.level );
  tree.put( "log.file",                log.file );

  const std::string tmp = path+".tmp";
  try {
    const fs::path parent = fs::absolute( fs::path( path ) ).parent_path();
    fs::create_directories( parent );
    pt::write_json( tmp, tree );
    fs::rename( tmp, path );
  } catch( pt::json_parser_error& e ){
    throw persistence_error( ( boost::format(
      "Failed to write configuration file [%s]: %s" ) % path % e.what() ).str() );
  } catch( fs::filesystem_error& e ){
    throw persistence_error( ( boost::format(
      "Failed to write configuration file [%s]: %s" ) % path % e.what() ).str() );
  }
}


ConfigSnapshot
PrinterConfig::Snapshot() const
{
  std::lock_guard<std::mutex> lock( config_mutex );
  ConfigSnapshot              ans;
  ans.settings  = settings;
  ans.link      = link;
  ans.spool_dir = spool_dir;
  for( const auto& p : printers ){
    if( p.id == current_id ){
      ans.has_printer = true;
      ans.printer     = p;
    }
  }
  return ans;
}


std::vector<SavedPrinter>
PrinterConfig::Printers() const
{
  std::lock_guard<std::mutex> lock( config_mutex );
  return printers;
}


/**
 * @brief Adding a printer, or replacing the saved printer with the same id.
 */
void
PrinterConfig::SavePrinter( const SavedPrinter& p )
{
  if( p.id.empty() ){
    throw input_error( "Saved printer requires a non-empty id" );
  }
  if( p.paper_width != 58 && p.paper_width != 80 ){
    throw input_error( ( boost::format(
      "Unsupported paper width [%u] mm for printer [%s]" )
                         % p.paper_width % p.id ).str() );
  }

  std::lock_guard<std::mutex> lock( config_mutex );
  bool                        found = false;
  for( auto& old : printers ){
    if( old.id == p.id ){
      old   = p;
      found = true;
    }
  }
  if( !found ){
    printers.push_back( p );
  }
  save_unlocked();
  printmsg( devname, ( boost::format( "Saved printer [%s] at [%s]" )
                       % p.id % p.address ).str() );
}


void
PrinterConfig::RemovePrinter( const std::string& id )
{
  std::lock_guard<std::mutex> lock( config_mutex );
  for( auto it = printers.begin(); it != printers.end(); ++it ){
    if( it->id == id ){
      printers.erase( it );
      if( current_id == id ){ current_id = ""; }
      save_unlocked();
      return;
    }
  }
  throw input_error( ( boost::format( "No saved printer [%s]" ) % id ).str() );
}


bool
PrinterConfig::HasPrinter( const std::string& id ) const
{
  std::lock_guard<std::mutex> lock( config_mutex );
  return has_printer_unlocked( id );
}


bool
PrinterConfig::has_printer_unlocked( const std::string& id ) const
{
  for( const auto& p : printers ){
    if( p.id == id ){ return true; }
  }
  return false;
}


void
PrinterConfig::SetCurrentPrinter( const std::string& id )
{
  std::lock_guard<std::mutex> lock( config_mutex );
  if( !has_printer_unlocked( id ) ){
    throw input_error( ( boost::format( "No saved printer [%s]" ) % id ).str() );
  }
  current_id = id;
  save_unlocked();
}


void
PrinterConfig::ClearCurrentPrinter()
{
  std::lock_guard<std::mutex> lock( config_mutex );
  current_id = "";
  save_unlocked();
}


std::string
PrinterConfig::CurrentPrinterId() const
{
  std::lock_guard<std::mutex> lock( config_mutex );
  return current_id;
}


bool
PrinterConfig::HasCurrentPrinter() const
{
  std::lock_guard<std::mutex> lock( config_mutex );
  return !current_id.empty();
}


SavedPrinter
PrinterConfig::CurrentPrinter() const
{
  std::lock_guard<std::mutex> lock( config_mutex );
  for( const auto& p : printers ){
    if( p.id == current_id ){ return p; }
  }
  throw input_error( "No printer is selected" );
}


PrintSettings
PrinterConfig::Settings() const
{
  std::lock_guard<std::mutex> lock( config_mutex );
  return settings;
}


void
PrinterConfig::SetSettings( const PrintSettings& s )
{
  if( s.paper_width != 58 && s.paper_width != 80 ){
    throw input_error( ( boost::format( "Unsupported paper width [%u] mm" )
                         % s.paper_width ).str() );
  }
  std::lock_guard<std::mutex> lock( config_mutex );
  settings = s;
  save_unlocked();
}


LinkSettings
PrinterConfig::Link() const
{
  std::lock_guard<std::mutex> lock( config_mutex );
  return link;
}


void
PrinterConfig::SetLink( const LinkSettings& l )
{
  std::lock_guard<std::mutex> lock( config_mutex );
  link = l;
  save_unlocked();
}


LogSettings
PrinterConfig::Log() const
{
  std::lock_guard<std::mutex> lock( config_mutex );
  return log;
}


std::string
PrinterConfig::SpoolDir() const
{
  std::lock_guard<std::mutex> lock( config_mutex );
  return spool_dir;
}


void
PrinterConfig::SetSpoolDir( const std::string& dir )
{
  std::lock_guard<std::mutex> lock( config_mutex );
  spool_dir = dir;
  save_unlocked();
}
