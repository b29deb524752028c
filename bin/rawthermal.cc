#include "config.hpp"
#include "errors.hpp"
#include "imagerenderer.hpp"
#include "jobstore.hpp"
#include "link.hpp"
#include "logger.hpp"
#include "printservice.hpp"
#include "receipts.hpp"
#include "seriallink.hpp"

#include <boost/format.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

static const char usage[] =
  "Usage: rawthermal <config.json> <command> [args...]\n"
  "\n"
  "Commands:\n"
  "  text <text> [--align left|center|right] [--bold] [--underline] [--double]\n"
  "  image <file>              Print an image document, one page per frame\n"
  "  raw <file>                Send a file of printer commands as is\n"
  "  testpage                  Print the test page\n"
  "  qr <content> [size]       Print a QR code (size 1-16)\n"
  "  barcode <content> [type]  Print a barcode (CODE128, EAN13, CODE39, ...)\n"
  "  pending                   List jobs waiting for a printer\n"
  "  resume                    Print all pending jobs on the current printer\n"
  "  discard <id>|all          Drop pending jobs\n"
  "  printers [scan [seconds]] List saved printers, or scan for new ones\n"
  "  add <id> <device> [58|80] [name]\n"
  "                            Save a printer\n"
  "  use <id>                  Select the current printer\n";

/**
 * @brief Reporting job outcomes on the terminal.
 */
class TerminalListener : public JobListener
{
public:
  void
  OnSetupRequired( const PrintJob& job ) override
  {
    std::cout << boost::format( "Job [%s] stored as pending: select a printer with "
                                "`use <id>` and run `resume`" ) % job.id
              << std::endl;
  }

  void
  OnCompleted( const PrintJob& job ) override
  {
    std::cout << GREEN( ( boost::format( "Job [%s] completed" ) % job.id ).str() )
              << std::endl;
  }

  void
  OnFailed( const PrintJob& job ) override
  {
    std::cout << RED( ( boost::format( "Job [%s] failed (%s, last page %d): %s" )
                        % job.id % error_class_name( job.error_class )
                        % job.last_page % job.error ).str() )
              << std::endl;
  }

  void
  OnCanceled( const PrintJob& job ) override
  {
    std::cout << YELLOW( ( boost::format( "Job [%s] canceled" ) % job.id ).str() )
              << std::endl;
  }
};


static std::vector<uint8_t>
read_file( const std::string& path )
{
  std::ifstream in( path, std::ios::binary );
  if( !in ){
    throw input_error( ( boost::format( "Cannot read [%s]" ) % path ).str() );
  }
  return std::vector<uint8_t>( std::istreambuf_iterator<char>( in ),
                               std::istreambuf_iterator<char>() );
}


static void
setup_logging( const LogSettings& log )
{
  set_log_level( parse_log_level( log.level ) );
  if( !log.file.empty() ){
    const int fd = open( log.file.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644 );
    if( fd < 0 ){
      throw std::runtime_error( ( boost::format( "Cannot open log file [%s]" )
                                  % log.file ).str() );
    }
    set_logging_descriptor( fd );
  }
}


static int
wait_for( PrintService& service, const std::string& id )
{
  service.WaitIdle();
  const PrintJob job = service.GetJob( id );
  switch( job.state ){
  case JobState::COMPLETED: return 0;
  case JobState::BLOCKED:   return 2;
  default:                  return 1;
  }
}


static TextStyle
parse_style( const std::vector<std::string>& args, const std::size_t start )
{
  TextStyle style;
  for( std::size_t i = start; i < args.size(); ++i ){
    if( args[i] == "--align" && i+1 < args.size() ){
      style.align = parse_alignment( args[++i] );
    } else if( args[i] == "--bold" ){
      style.bold = true;
    } else if( args[i] == "--underline" ){
      style.underline = true;
    } else if( args[i] == "--double" ){
      style.double_size = true;
    } else {
      throw input_error( "Unknown text option ["+args[i]+"]" );
    }
  }
  return style;
}


static int
run( const std::vector<std::string>& args )
{
  PrinterConfig config( args[0] );
  setup_logging( config.Log() );

  const std::string cmd = args[1];

  // Commands that only touch the configuration.
  if( cmd == "add" ){
    if( args.size() < 4 ){ throw input_error( "add requires <id> <device>" ); }
    SavedPrinter p;
    p.id          = args[2];
    p.address     = args[3];
    p.paper_width = args.size() > 4 ? std::stoul( args[4] ) : 58;
    p.name        = args.size() > 5 ? args[5] : args[2];
    config.SavePrinter( p );
    return 0;
  }

  const LinkSettings ls = config.Link();
  SerialLink         device( ls.baud, ls.max_payload );
  PrinterLink        link( device );

  if( cmd == "printers" ){
    if( args.size() > 2 && args[2] == "scan" ){
      const unsigned seconds = args.size() > 3 ? std::stoul( args[3] ) : 5;
      for( const auto& r : link.ScanFor( seconds ) ){
        std::cout << boost::format( "%-24s %s" ) % r.address % r.name << std::endl;
      }
      return 0;
    }
    const std::string current = config.CurrentPrinterId();
    for( const auto& p : config.Printers() ){
      std::cout << boost::format( "%s %-12s %-20s %-16s %umm" )
        % ( p.id == current ? "*" : " " ) % p.id % p.name % p.address
        % p.paper_width << std::endl;
    }
    return 0;
  }

  JobStore         store( config.SpoolDir() );
  PrintService     service( config, link, store, &ImageRenderer::Open );
  TerminalListener listener;
  service.SetListener( &listener );

  if( cmd == "pending" ){
    for( const auto& p : service.PendingJobs() ){
      std::cout << boost::format( "%-28s %-9s %s" )
        % p.id % pending_kind_name( p.kind ) % p.title << std::endl;
    }
    return 0;
  } else if( cmd == "resume" ){
    const unsigned n = service.ResumePending();
    service.WaitIdle();
    std::cout << boost::format( "%u pending jobs processed, %u remaining" )
      % n % store.Size() << std::endl;
    return store.Size() == 0 ? 0 : 1;
  } else if( cmd == "discard" ){
    if( args.size() < 3 ){ throw input_error( "discard requires <id> or all" ); }
    if( args[2] == "all" ){
      service.ClearPending();
    } else {
      service.DiscardPending( args[2] );
    }
    return 0;
  } else if( cmd == "use" ){
    if( args.size() < 3 ){ throw input_error( "use requires <id>" ); }
    service.SetCurrentPrinter( args[2] );
    service.WaitIdle();
    return 0;
  }

  const ConfigSnapshot snap = config.Snapshot();
  PrintRequest         request;

  if( cmd == "text" ){
    if( args.size() < 3 ){ throw input_error( "text requires <text>" ); }
    request.kind  = JobKind::TEXT;
    request.title = "Text";
    request.text  = args[2];
    request.style = parse_style( args, 3 );
  } else if( cmd == "image" ){
    if( args.size() < 3 ){ throw input_error( "image requires <file>" ); }
    request.kind          = JobKind::DOCUMENT;
    request.title         = args[2];
    request.document_path = args[2];
  } else if( cmd == "raw" ){
    if( args.size() < 3 ){ throw input_error( "raw requires <file>" ); }
    request.kind  = JobKind::RAW;
    request.title = args[2];
    request.raw   = read_file( args[2] );
  } else if( cmd == "testpage" ){
    request.kind  = JobKind::RAW;
    request.title = "Test Page";
    request.raw   = MakeTestPage( snap, local_timestamp() );
  } else if( cmd == "qr" ){
    if( args.size() < 3 ){ throw input_error( "qr requires <content>" ); }
    request.kind  = JobKind::RAW;
    request.title = "QR Code";
    request.raw   = MakeQRJob( args[2], args.size() > 3 ? std::stoi( args[3] ) : 6, snap );
  } else if( cmd == "barcode" ){
    if( args.size() < 3 ){ throw input_error( "barcode requires <content>" ); }
    request.kind  = JobKind::RAW;
    request.title = "Barcode";
    request.raw   = MakeBarcodeJob( args[2],
                                    args.size() > 3 ? parse_symbology( args[3] ) :
                                    Symbology::CODE128,
                                    snap );
  } else {
    std::cerr << usage;
    return 1;
  }

  return wait_for( service, service.Submit( request ) );
}


int
main( int argc, char* argv[] )
{
  if( argc < 3 ){
    std::cerr << usage;
    return 1;
  }

  const std::vector<std::string> args( argv+1, argv+argc );
  try {
    return run( args );
  } catch( input_error& e ){
    std::cerr << RED( "Invalid input: " ) << e.what() << std::endl;
    return 1;
  } catch( std::exception& e ){
    std::cerr << RED( "Error: " ) << e.what() << std::endl;
    return 1;
  }
}
