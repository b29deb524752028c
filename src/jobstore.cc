/**
 * @file jobstore.cc
 * @brief Durable storage of jobs waiting for a printer.
 *
 * @class JobStore
 * @brief Pending job records and their content copies in the spool directory.
 *
 * @details When a job arrives while no printer is selected, its content is
 * copied into the spool directory and a record is added to the index file
 * `pending_jobs.json` in the same directory:
 *
 * ```json
 * { "jobs": [
 *     { "id": "job-3", "kind": "document", "title": "invoice.png",
 *       "content": "/var/spool/rawthermal/pending_job-3.png",
 *       "created_ms": 1718000000000, "sequence": 3 }
 * ] }
 * ```
 *
 * The index is rewritten through a temporary file on every change and is read
 * back when the store is constructed, so pending jobs survive restarts.
 * Records are listed in creation order. A record and its content copy are
 * only removed explicitly, once the job was delivered or discarded.
 */
#include "jobstore.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/property_tree/json_parser.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iterator>

namespace pt = boost::property_tree;
namespace fs = boost::filesystem;

static const std::string devname = "JobStore";

std::string
pending_kind_name( const PendingKind k )
{
  switch( k ){
  case PendingKind::RAW:  return "raw";
  case PendingKind::TEXT: return "text";
  default:                return "document";
  }
}


PendingKind
parse_pending_kind( const std::string& name )
{
  if( name == "document" ){ return PendingKind::DOCUMENT; }
  if( name == "raw" ){ return PendingKind::RAW; }
  if( name == "text" ){ return PendingKind::TEXT; }
  throw persistence_error( ( boost::format( "Unknown pending job kind [%s]" )
                             % name ).str() );
}


static uint64_t
now_ms()
{
  using namespace std::chrono;
  return duration_cast<milliseconds>( system_clock::now().time_since_epoch() ).count();
}


static void
check_id( const std::string& id )
{
  if( id.empty() ){
    throw input_error( "Pending job requires a non-empty id" );
  }
  for( const char c : id ){
    if( !std::isalnum( static_cast<unsigned char>( c ) ) && c != '-' && c != '_' ){
      throw input_error( ( boost::format( "Invalid character in job id [%s]" )
                           % id ).str() );
    }
  }
}


static std::string
content_extension( const PendingKind kind, const std::string& source )
{
  switch( kind ){
  case PendingKind::RAW:  return ".bin";
  case PendingKind::TEXT: return ".txt";
  default:
    return fs::path( source ).extension().string();
  }
}


JobStore::JobStore( const std::string& dir ) :
  spool_dir    ( dir ),
  next_sequence( 1 )
{
  try {
    fs::create_directories( spool_dir );
  } catch( fs::filesystem_error& e ){
    throw persistence_error( ( boost::format(
      "Cannot create spool directory [%s]: %s" ) % spool_dir % e.what() ).str() );
  }
  Load();
}


std::string
JobStore::IndexPath() const
{
  return ( fs::path( spool_dir ) / "pending_jobs.json" ).string();
}


void
JobStore::Load()
{
  std::lock_guard<std::mutex> lock( store_mutex );
  jobs.clear();

  const std::string index = IndexPath();
  if( !fs::exists( index ) ){ return; }

  pt::ptree tree;
  try {
    pt::read_json( index, tree );
    if( tree.get_child_optional( "jobs" ) ){
      for( const auto& it : tree.get_child( "jobs" ) ){
        const pt::ptree& entry = it.second;
        PendingJob       job;
        job.id                = entry.get<std::string>( "id" );
        job.kind              = parse_pending_kind( entry.get<std::string>( "kind" ) );
        job.content_path      = entry.get<std::string>( "content" );
        job.title             = entry.get<std::string>( "title", "Print Job" );
        job.created_ms        = entry.get<uint64_t>( "created_ms" );
        job.sequence          = entry.get<uint64_t>( "sequence", 0 );
        job.style.align       = Alignment( entry.get<int>( "style.align", 0 ) );
        job.style.bold        = entry.get<bool>( "style.bold", false );
        job.style.underline   = entry.get<bool>( "style.underline", false );
        job.style.double_size = entry.get<bool>( "style.double_size", false );

        if( !fs::exists( job.content_path ) ){
          printwarn( devname, ( boost::format(
            "Content of pending job [%s] is missing at [%s]" )
                                % job.id % job.content_path ).str() );
        }
        next_sequence = std::max( next_sequence, job.sequence+1 );
        jobs.push_back( job );
      }
    }
  } catch( pt::ptree_error& e ){
    throw persistence_error( ( boost::format(
      "Failed to read pending job index [%s]: %s" ) % index % e.what() ).str() );
  }

  std::sort( jobs.begin(), jobs.end(),
             []( const PendingJob& a, const PendingJob& b ){
    return a.created_ms != b.created_ms ?
           a.created_ms < b.created_ms :
           a.sequence < b.sequence;
  } );

  printmsg( devname, ( boost::format( "Loaded %u pending jobs from [%s]" )
                       % jobs.size() % spool_dir ).str() );
}


void
JobStore::save_unlocked() const
{
  pt::ptree tree;
  pt::ptree list;
  for( const auto& job : jobs ){
    pt::ptree entry;
    entry.put( "id",         job.id );
    entry.put( "kind",       pending_kind_name( job.kind ) );
    entry.put( "title",      job.title );
    entry.put( "content",    job.content_path );
    entry.put( "created_ms", job.created_ms );
    entry.put( "sequence",   job.sequence );
    if( job.kind == PendingKind::TEXT ){
      entry.put( "style.align",       int( job.style.align ) );
      entry.put( "style.bold",        job.style.bold );
      entry.put( "style.underline",   job.style.underline );
      entry.put( "style.double_size", job.style.double_size );
    }
    list.push_back( std::make_pair( "", entry ) );
  }
  tree.add_child( "jobs", list );

  const std::string index = IndexPath();
  const std::string tmp   = index+".tmp";
  try {
    pt::write_json( tmp, tree );
    fs::rename( tmp, index );
  } catch( pt::json_parser_error& e ){
    throw persistence_error( ( boost::format(
      "Failed to write pending job index [%s]: %s" ) % index % e.what() ).str() );
  } catch( fs::filesystem_error& e ){
    throw persistence_error( ( boost::format(
      "Failed to write pending job index [%s]: %s" ) % index % e.what() ).str() );
  }
}


PendingJob
JobStore::make_record( const std::string& id,
                       const PendingKind  kind,
                       const std::string& title,
                       const std::string& source,
                       const TextStyle&   style )
{
  PendingJob job;
  job.id           = id;
  job.kind         = kind;
  job.title        = title.empty() ? "Print Job" : title;
  job.created_ms   = now_ms();
  job.sequence     = next_sequence++;
  job.style        = style;
  job.content_path = ( fs::path( spool_dir )
                       / ( "pending_"+id+content_extension( kind, source ) ) ).string();
  return job;
}


/**
 * @brief Refusing to add a record whose id is already stored, as replacing it
 * would silently drop the earlier job.
 */
void
JobStore::check_unique_unlocked( const std::string& id ) const
{
  for( const auto& j : jobs ){
    if( j.id == id ){
      throw persistence_error( ( boost::format(
        "Pending job [%s] is already stored" ) % id ).str() );
    }
  }
}


/**
 * @brief Adding the record to the index, rolling back on failure so that the
 * in-memory list always mirrors the index file.
 */
void
JobStore::insert_unlocked( const PendingJob& job )
{
  const std::vector<PendingJob> backup = jobs;
  jobs.push_back( job );

  try {
    save_unlocked();
  } catch( persistence_error& ){
    jobs = backup;
    boost::system::error_code ec;
    fs::remove( job.content_path, ec );
    throw;
  }
  printmsg( devname, ( boost::format( "Stored pending job [%s] \"%s\"" )
                       % job.id % job.title ).str() );
}


PendingJob
JobStore::AddFile( const std::string& id,
                   const PendingKind  kind,
                   const std::string& title,
                   const std::string& source,
                   const TextStyle&   style )
{
  check_id( id );
  std::lock_guard<std::mutex> lock( store_mutex );
  check_unique_unlocked( id );
  const PendingJob            job = make_record( id, kind, title, source, style );

  try {
    fs::copy_file( source, job.content_path, fs::copy_options::overwrite_existing );
  } catch( fs::filesystem_error& e ){
    throw persistence_error( ( boost::format(
      "Failed to copy [%s] into the spool directory: %s" )
                               % source % e.what() ).str() );
  }

  insert_unlocked( job );
  return job;
}


PendingJob
JobStore::AddBytes( const std::string&          id,
                    const PendingKind           kind,
                    const std::string&          title,
                    const std::vector<uint8_t>& content,
                    const TextStyle&            style )
{
  check_id( id );
  std::lock_guard<std::mutex> lock( store_mutex );
  check_unique_unlocked( id );
  const PendingJob            job = make_record( id, kind, title, "", style );

  std::ofstream out( job.content_path, std::ios::binary | std::ios::trunc );
  out.write( reinterpret_cast<const char*>( content.data() ), content.size() );
  out.close();
  if( !out ){
    boost::system::error_code ec;
    fs::remove( job.content_path, ec );
    throw persistence_error( ( boost::format( "Failed to write [%s]" )
                               % job.content_path ).str() );
  }

  insert_unlocked( job );
  return job;
}


std::vector<PendingJob>
JobStore::List() const
{
  std::lock_guard<std::mutex> lock( store_mutex );
  return jobs;
}


bool
JobStore::Has( const std::string& id ) const
{
  std::lock_guard<std::mutex> lock( store_mutex );
  for( const auto& job : jobs ){
    if( job.id == id ){ return true; }
  }
  return false;
}


PendingJob
JobStore::Get( const std::string& id ) const
{
  std::lock_guard<std::mutex> lock( store_mutex );
  for( const auto& job : jobs ){
    if( job.id == id ){ return job; }
  }
  throw input_error( ( boost::format( "No pending job [%s]" ) % id ).str() );
}


std::size_t
JobStore::Size() const
{
  std::lock_guard<std::mutex> lock( store_mutex );
  return jobs.size();
}


/**
 * @brief Removing a record together with its content copy.
 */
void
JobStore::Remove( const std::string& id )
{
  std::lock_guard<std::mutex> lock( store_mutex );
  auto it = std::find_if( jobs.begin(), jobs.end(),
                          [&id]( const PendingJob& x ){ return x.id == id; } );
  if( it == jobs.end() ){
    throw input_error( ( boost::format( "No pending job [%s]" ) % id ).str() );
  }

  const PendingJob              job    = *it;
  const std::vector<PendingJob> backup = jobs;
  jobs.erase( it );
  try {
    save_unlocked();
  } catch( persistence_error& ){
    jobs = backup;
    throw;
  }

  boost::system::error_code ec;
  fs::remove( job.content_path, ec );
  if( ec ){
    printwarn( devname, ( boost::format( "Failed to remove [%s]: %s" )
                          % job.content_path % ec.message() ).str() );
  }
  printmsg( devname, ( boost::format( "Removed pending job [%s]" ) % id ).str() );
}


void
JobStore::Clear()
{
  std::lock_guard<std::mutex> lock( store_mutex );
  const std::vector<PendingJob> old = jobs;
  jobs.clear();
  try {
    save_unlocked();
  } catch( persistence_error& ){
    jobs = old;
    throw;
  }

  for( const auto& job : old ){
    boost::system::error_code ec;
    fs::remove( job.content_path, ec );
    if( ec ){
      printwarn( devname, ( boost::format( "Failed to remove [%s]: %s" )
                            % job.content_path % ec.message() ).str() );
    }
  }
  printmsg( devname, ( boost::format( "Cleared %u pending jobs" ) % old.size() ).str() );
}


std::vector<uint8_t>
JobStore::ReadContent( const PendingJob& job ) const
{
  std::ifstream in( job.content_path, std::ios::binary );
  if( !in ){
    throw persistence_error( ( boost::format(
      "Content of pending job [%s] is not readable at [%s]" )
                               % job.id % job.content_path ).str() );
  }
  return std::vector<uint8_t>( std::istreambuf_iterator<char>( in ),
                               std::istreambuf_iterator<char>() );
}
