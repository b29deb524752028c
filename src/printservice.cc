/**
 * @file printservice.cc
 * @brief Print job lifecycle and queue handling.
 *
 * @class PrintService
 * @brief Orchestration of print jobs from submission to delivery.
 *
 * @details Jobs are submitted as abstract requests (plain text, a document to
 * be rasterized page by page, or raw printer commands) and go through the
 * following states:
 *
 * ```
 * Queued -> Printing -> Completed | Failed | Canceled
 * Queued -> Blocked  -> Queued -> Printing -> ...
 * ```
 *
 * If no printer is selected when a job arrives, its content is copied into
 * the pending job store, the job is Blocked and the host is told that printer
 * setup is required. Once a printer is selected, every pending job is
 * replayed in creation order, its record being removed only once the job was
 * delivered or canceled. Pending records are loaded back as Blocked jobs on
 * startup, and are queued ahead of the next submitted job once a printer is
 * selected.
 *
 * Stopping the service never loses a job: the job being printed is
 * interrupted at its next chunk boundary and, like every job still queued, is
 * moved to the pending store as Blocked for the next session.
 *
 * A single worker thread processes the queue in strict FIFO order, handling
 * the full lifecycle of one job (render, quantize, encode, write) before
 * starting the next. The configuration is snapshotted when a job starts, so
 * changes made while a job prints only apply to the following jobs. Any error
 * aborts the remaining pages of a job, nothing is rolled back, and the failure
 * is recorded with its error class and the last page that was delivered.
 *
 * ## Worker thread management
 *
 * The thread follows the same pattern as the other looping components: a
 * std::thread running the main loop, an atomic flag indicating whether the
 * loop should continue, and a mutex guarding the data shared with the caller
 * threads. The loop waits on a condition variable until a job is queued
 * instead of polling.
 */
#include "printservice.hpp"

#include "logger.hpp"
#include "quantizer.hpp"

#include <boost/filesystem.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>

static const std::string devname = "PrintService";

static const std::string not_configured = "Printer not configured";
static const std::string not_resumed    = "Pending from a previous session";
static const std::string stopped        = "Print service stopped";

static uint64_t
now_ms()
{
  using namespace std::chrono;
  return duration_cast<milliseconds>( system_clock::now().time_since_epoch() ).count();
}


std::string
job_kind_name( const JobKind k )
{
  switch( k ){
  case JobKind::TEXT:     return "text";
  case JobKind::DOCUMENT: return "document";
  default:                return "raw";
  }
}


std::string
job_state_name( const JobState s )
{
  switch( s ){
  case JobState::QUEUED:    return "queued";
  case JobState::BLOCKED:   return "blocked";
  case JobState::PRINTING:  return "printing";
  case JobState::COMPLETED: return "completed";
  case JobState::FAILED:    return "failed";
  default:                  return "canceled";
  }
}


static JobKind
kind_of( const PendingKind k )
{
  switch( k ){
  case PendingKind::TEXT: return JobKind::TEXT;
  case PendingKind::RAW:  return JobKind::RAW;
  default:                return JobKind::DOCUMENT;
  }
}


namespace {

/**
 * @brief Closing the printer connection when a job leaves scope, whichever
 * way it ends.
 */
struct ConnectionGuard
{
  explicit ConnectionGuard( PrinterLink& l ) : link( l ){}
  ~ConnectionGuard(){ link.Disconnect(); }
  PrinterLink& link;
};

}


PrintService::PrintService( PrinterConfig&  c,
                            PrinterLink&    l,
                            JobStore&       s,
                            RendererFactory f ) :
  config  ( c ),
  link    ( l ),
  store   ( s ),
  factory ( f ),
  listener( nullptr ),
  active  ( "" ),
  run_loop( false )
{
  LoadPending();
  StartLoopThread();
}


PrintService::~PrintService()
{
  printdebug( devname, "Ending the print worker thread" );
  EndLoopThread();
}


void
PrintService::SetListener( JobListener* l )
{
  std::lock_guard<std::mutex> lock( job_mutex );
  listener = l;
}


void
PrintService::Notify( void ( JobListener::*method )( const PrintJob& ),
                      const PrintJob& job )
{
  JobListener* l = nullptr;
  {
    std::lock_guard<std::mutex> lock( job_mutex );
    l = listener;
  }
  if( l != nullptr ){
    ( l->*method )( job );
  }
}


/**
 * @brief Job ids are random UUIDs, so that ids never collide with pending
 * records written by another service instance or process.
 */
std::string
PrintService::NewJobId()
{
  std::lock_guard<std::mutex> lock( job_mutex );
  return "job-"+boost::uuids::to_string( id_generator() );
}


/**
 * @brief Pending records left by a previous session become Blocked jobs.
 * Nothing is reported to the listener for them, the host learns about them by
 * listing the jobs.
 */
void
PrintService::LoadPending()
{
  std::lock_guard<std::mutex> lock( job_mutex );
  for( const auto& p : store.List() ){
    PrintJob job;
    job.id             = p.id;
    job.kind           = kind_of( p.kind );
    job.title          = p.title;
    job.state          = JobState::BLOCKED;
    job.blocked_reason = config.HasCurrentPrinter() ? not_resumed : not_configured;
    job.created_ms     = p.created_ms;
    job.pending        = true;
    jobs[job.id]       = job;
    order.push_back( job.id );
  }
}


/**
 * @brief Input checks run before the job is accepted, so that malformed
 * requests are rejected synchronously and never reach the printer.
 */
void
PrintService::ValidateRequest( const PrintRequest& request ) const
{
  switch( request.kind ){
  case JobKind::TEXT:
    if( request.text.empty() ){
      throw input_error( "Text job without text" );
    }
    EscPosEncoder( config.Settings().encoding ).TranscodeText( request.text );
    break;
  case JobKind::DOCUMENT:
    if( request.document_path.empty() ||
        !boost::filesystem::is_regular_file( request.document_path ) ){
      throw input_error( fmt::format( "Document [{}] does not exist",
                                      request.document_path ) );
    }
    break;
  case JobKind::RAW:
    if( request.raw.empty() ){
      throw input_error( "Raw job without data" );
    }
    break;
  }
}


std::string
PrintService::Submit( const PrintRequest& request )
{
  ValidateRequest( request );

  PrintJob job;
  job.id         = NewJobId();
  job.kind       = request.kind;
  job.title      = request.title.empty() ? "Print Job" : request.title;
  job.state      = JobState::QUEUED;
  job.created_ms = now_ms();

  {
    std::lock_guard<std::mutex> lock( job_mutex );
    jobs[job.id]     = job;
    requests[job.id] = request;
    order.push_back( job.id );
  }
  printmsg( devname, fmt::format( "Job [{}] \"{}\" ({}) submitted",
                                  job.id, job.title, job_kind_name( job.kind ) ) );
  Notify( &JobListener::OnQueued, job );

  if( !config.HasCurrentPrinter() ){
    BlockJob( job.id, request, not_configured );
    return job.id;
  }

  // Jobs left over from an earlier session print first.
  QueuePending( false );
  {
    std::lock_guard<std::mutex> lock( job_mutex );
    queue.push_back( job.id );
  }
  queue_cv.notify_one();
  return job.id;
}


/**
 * @brief Moving a job into the pending store. Failing to store the content
 * fails the job immediately. The host is only asked for printer setup when no
 * printer is configured.
 */
void
PrintService::BlockJob( const std::string&  id,
                        const PrintRequest& request,
                        const std::string&  reason )
{
  PrintJob job;
  try {
    switch( request.kind ){
    case JobKind::DOCUMENT:
      store.AddFile( id, PendingKind::DOCUMENT, request.title, request.document_path );
      break;
    case JobKind::TEXT:
      store.AddBytes( id, PendingKind::TEXT, request.title,
                      std::vector<uint8_t>( request.text.begin(), request.text.end() ),
                      request.style );
      break;
    case JobKind::RAW:
      store.AddBytes( id, PendingKind::RAW, request.title, request.raw );
      break;
    }
  } catch( persistence_error& e ){
    {
      std::lock_guard<std::mutex> lock( job_mutex );
      PrintJob& j = jobs.at( id );
      j.state        = JobState::FAILED;
      j.error_class  = ErrorClass::PERSISTENCE;
      j.error        = e.what();
      j.completed_ms = now_ms();
      requests.erase( id );
      job = j;
    }
    printerr( devname, fmt::format( "Job [{}] failed: {}", id, e.what() ) );
    idle_cv.notify_all();
    Notify( &JobListener::OnFailed, job );
    return;
  }

  {
    std::lock_guard<std::mutex> lock( job_mutex );
    PrintJob& j = jobs.at( id );
    j.state          = JobState::BLOCKED;
    j.blocked_reason = reason;
    j.pending        = true;
    requests.erase( id );
    job = j;
  }
  printwarn( devname, fmt::format( "Job [{}] blocked: {}", id, reason ) );
  Notify( &JobListener::OnBlocked, job );
  if( reason == not_configured ){
    Notify( &JobListener::OnSetupRequired, job );
  }
}


bool
PrintService::Cancel( const std::string& id )
{
  PrintJob job;
  bool     remove_pending = false;
  {
    std::lock_guard<std::mutex> lock( job_mutex );
    auto                        it = jobs.find( id );
    if( it == jobs.end() ){
      throw input_error( fmt::format( "No job [{}]", id ) );
    }
    PrintJob& j = it->second;
    switch( j.state ){
    case JobState::QUEUED:
      queue.erase( std::remove( queue.begin(), queue.end(), id ), queue.end() );
      remove_pending = j.pending;
      break;
    case JobState::BLOCKED:
      remove_pending = true;
      break;
    case JobState::PRINTING:
      // The worker stops at the next chunk or page boundary.
      cancel_requested.insert( id );
      cancel_flags.at( id )->store( true );
      printmsg( devname, fmt::format( "Cancel requested for job [{}]", id ) );
      return true;
    default:
      return false;
    }
    j.state        = JobState::CANCELED;
    j.error_class  = ErrorClass::CANCELED;
    j.completed_ms = now_ms();
    requests.erase( id );
    job = j;
  }

  printmsg( devname, fmt::format( "Job [{}] canceled", id ) );
  idle_cv.notify_all();
  Notify( &JobListener::OnCanceled, job );
  if( remove_pending && store.Has( id ) ){
    store.Remove( id );
  }
  return true;
}


void
PrintService::SetCurrentPrinter( const std::string& printer_id )
{
  config.SetCurrentPrinter( printer_id );
  ResumePending();
}


/**
 * @brief Queuing every pending job, in creation order, for delivery to the
 * current printer. Returns the number of jobs queued.
 */
unsigned
PrintService::ResumePending()
{
  if( !config.HasCurrentPrinter() ){
    printwarn( devname, "Cannot resume pending jobs without a selected printer" );
    return 0;
  }
  return QueuePending( true );
}


/**
 * @brief Queuing the stored jobs that are not already queued or printing.
 * Jobs whose last attempt failed are only retried on an explicit resume.
 */
unsigned
PrintService::QueuePending( const bool retry_failed )
{
  std::vector<PrintJob> resumed;
  {
    std::lock_guard<std::mutex> lock( job_mutex );
    for( const auto& p : store.List() ){
      auto it = jobs.find( p.id );
      if( it == jobs.end() ){
        PrintJob job;
        job.id         = p.id;
        job.kind       = kind_of( p.kind );
        job.title      = p.title;
        job.created_ms = p.created_ms;
        job.pending    = true;
        it             = jobs.insert( std::make_pair( p.id, job ) ).first;
        order.push_back( p.id );
      } else if( it->second.state == JobState::QUEUED ||
                 it->second.state == JobState::PRINTING ){
        continue;
      } else if( it->second.state == JobState::FAILED && !retry_failed ){
        continue;
      }

      PrintJob& job = it->second;
      job.state          = JobState::QUEUED;
      job.blocked_reason = "";
      job.error_class    = ErrorClass::NONE;
      job.error          = "";
      job.last_page      = -1;
      job.completed_ms   = 0;
      queue.push_back( job.id );
      resumed.push_back( job );
    }
  }
  queue_cv.notify_one();

  for( const auto& job : resumed ){
    Notify( &JobListener::OnQueued, job );
  }
  if( !resumed.empty() ){
    printmsg( devname, fmt::format( "Resuming {} pending jobs", resumed.size() ) );
  }
  return resumed.size();
}


/**
 * @brief Dropping a pending job and its stored content. A job still waiting
 * is canceled first.
 */
void
PrintService::DiscardPending( const std::string& id )
{
  if( !store.Has( id ) ){
    throw input_error( fmt::format( "No pending job [{}]", id ) );
  }

  bool unfinished = false;
  {
    std::lock_guard<std::mutex> lock( job_mutex );
    auto                        it = jobs.find( id );
    unfinished = it != jobs.end() && !it->second.Finished();
  }
  if( unfinished ){
    Cancel( id );
  }
  if( store.Has( id ) ){
    store.Remove( id );
  }
}


void
PrintService::ClearPending()
{
  for( const auto& p : store.List() ){
    DiscardPending( p.id );
  }
}


std::vector<PendingJob>
PrintService::PendingJobs() const
{
  return store.List();
}


std::vector<PrintJob>
PrintService::ListJobs() const
{
  std::lock_guard<std::mutex> lock( job_mutex );
  std::vector<PrintJob>       ans;
  for( const auto& id : order ){
    ans.push_back( jobs.at( id ) );
  }
  return ans;
}


PrintJob
PrintService::GetJob( const std::string& id ) const
{
  std::lock_guard<std::mutex> lock( job_mutex );
  auto                        it = jobs.find( id );
  if( it == jobs.end() ){
    throw input_error( fmt::format( "No job [{}]", id ) );
  }
  return it->second;
}


void
PrintService::Dequeue( const std::string& id )
{
  std::lock_guard<std::mutex> lock( job_mutex );
  auto                        it = jobs.find( id );
  if( it == jobs.end() ){
    throw input_error( fmt::format( "No job [{}]", id ) );
  }
  if( !it->second.Finished() ){
    throw input_error( fmt::format( "Job [{}] is still {}", id,
                                    job_state_name( it->second.state ) ) );
  }
  jobs.erase( it );
  order.erase( std::remove( order.begin(), order.end(), id ), order.end() );
}


bool
PrintService::Idle() const
{
  std::lock_guard<std::mutex> lock( job_mutex );
  return queue.empty() && active.empty();
}


/**
 * @brief Blocking until the queue is drained. A timeout of 0 waits forever.
 * Returns false if the timeout expired first.
 */
bool
PrintService::WaitIdle( const unsigned timeout_ms )
{
  std::unique_lock<std::mutex> lock( job_mutex );
  auto                         idle = [this]{
                                        return queue.empty() && active.empty();
                                      };
  if( timeout_ms == 0 ){
    idle_cv.wait( lock, idle );
    return true;
  }
  return idle_cv.wait_for( lock, std::chrono::milliseconds( timeout_ms ), idle );
}


/********************************************************************************
 *
 * JOB PROCESSING
 *
 *******************************************************************************/

PrintRequest
PrintService::RequestFromPending( const PendingJob& p ) const
{
  PrintRequest request;
  request.kind  = kind_of( p.kind );
  request.title = p.title;
  request.style = p.style;
  switch( p.kind ){
  case PendingKind::DOCUMENT:
    request.document_path = p.content_path;
    break;
  case PendingKind::TEXT: {
    const std::vector<uint8_t> bytes = store.ReadContent( p );
    request.text = std::string( bytes.begin(), bytes.end() );
    break;
  }
  case PendingKind::RAW:
    request.raw = store.ReadContent( p );
    break;
  }
  return request;
}


void
PrintService::ProcessJob( const std::string& id )
{
  PrintJob                           job;
  PrintRequest                       request;
  std::shared_ptr<std::atomic<bool> > cancel;
  {
    std::lock_guard<std::mutex> lock( job_mutex );
    auto                        it = jobs.find( id );
    if( it == jobs.end() || it->second.state != JobState::QUEUED ){
      return;
    }
    job = it->second;
    if( requests.count( id ) ){
      request = requests.at( id );
    }
  }

  const ConfigSnapshot snap = config.Snapshot();

  // The printer was deselected after the job was queued.
  if( !snap.has_printer ){
    if( !job.pending ){
      BlockJob( id, request, not_configured );
      return;
    }
    {
      std::lock_guard<std::mutex> lock( job_mutex );
      PrintJob& j = jobs.at( id );
      if( j.state != JobState::QUEUED ){ return; }
      j.state          = JobState::BLOCKED;
      j.blocked_reason = not_configured;
      job              = j;
    }
    Notify( &JobListener::OnBlocked,       job );
    Notify( &JobListener::OnSetupRequired, job );
    return;
  }

  {
    std::lock_guard<std::mutex> lock( job_mutex );
    PrintJob& j = jobs.at( id );
    if( j.state != JobState::QUEUED ){ return; }
    cancel           = std::make_shared<std::atomic<bool> >( !run_loop );
    cancel_flags[id] = cancel;
    j.state          = JobState::PRINTING;
    job     = j;
  }
  printmsg( devname, fmt::format( "Printing job [{}] on [{}]", id, snap.printer.id ) );
  Notify( &JobListener::OnStarted, job );

  JobState    final_state = JobState::COMPLETED;
  ErrorClass  error_class = ErrorClass::NONE;
  std::string error       = "";
  int         last_page   = -1;
  unsigned    pages       = 0;
  bool        interrupted = false;

  try {
    if( job.pending ){
      request = RequestFromPending( store.Get( id ) );
    }
    Deliver( job, request, snap, *cancel, last_page, pages );
  } catch( job_canceled& e ){
    {
      // Raised by the service stopping rather than by the host.
      std::lock_guard<std::mutex> lock( job_mutex );
      interrupted = !run_loop && !cancel_requested.count( id );
    }
    final_state = JobState::CANCELED;
    error_class = ErrorClass::CANCELED;
    error       = e.what();
  } catch( std::exception& e ){
    const thermal_error* t = dynamic_cast<const thermal_error*>( &e );
    final_state = JobState::FAILED;
    error_class = t != nullptr ? t->error_class() : ErrorClass::NONE;
    error       = e.what();
  }

  if( interrupted ){
    SuspendJob( id, request, last_page );
    return;
  }

  // Delivered or canceled pending jobs release their stored content, failed
  // ones keep it for a later attempt.
  if( final_state != JobState::FAILED && job.pending && store.Has( id ) ){
    try {
      store.Remove( id );
    } catch( persistence_error& e ){
      printerr( devname, fmt::format(
        "Pending record of job [{}] could not be removed: {}", id, e.what() ) );
    }
  }

  {
    std::lock_guard<std::mutex> lock( job_mutex );
    cancel_flags.erase( id );
    cancel_requested.erase( id );
    requests.erase( id );
    PrintJob& j = jobs.at( id );
    j.state        = final_state;
    j.error_class  = error_class;
    j.error        = error;
    j.last_page    = last_page;
    j.page_count   = pages;
    j.completed_ms = now_ms();
    if( final_state != JobState::FAILED ){ j.pending = false; }
    job = j;
  }

  switch( final_state ){
  case JobState::COMPLETED:
    printmsg( devname, GREEN( fmt::format( "Job [{}] completed", id ) ) );
    Notify( &JobListener::OnCompleted, job );
    break;
  case JobState::CANCELED:
    printmsg( devname, fmt::format( "Job [{}] canceled after page {}", id, last_page ) );
    Notify( &JobListener::OnCanceled, job );
    break;
  default:
    printerr( devname, fmt::format( "Job [{}] failed ({}) after page {}: {}", id,
                                    error_class_name( error_class ), last_page,
                                    error ) );
    Notify( &JobListener::OnFailed, job );
    break;
  }
}


/**
 * @brief Parking a job that was interrupted or left queued by the service
 * stopping. Its content is kept in the pending store so the next session
 * prints it again from the start.
 */
void
PrintService::SuspendJob( const std::string&  id,
                          const PrintRequest& request,
                          const int           last_page )
{
  PrintJob job;
  bool     stored = false;
  {
    std::lock_guard<std::mutex> lock( job_mutex );
    cancel_flags.erase( id );
    cancel_requested.erase( id );
    PrintJob& j = jobs.at( id );
    j.last_page = last_page;
    stored      = j.pending;
    if( stored ){
      j.state          = JobState::BLOCKED;
      j.blocked_reason = stopped;
      requests.erase( id );
      job = j;
    }
  }

  // Content only held in memory goes to the pending store first.
  if( !stored ){
    BlockJob( id, request, stopped );
    return;
  }
  printwarn( devname, fmt::format( "Job [{}] blocked: {}", id, stopped ) );
  Notify( &JobListener::OnBlocked, job );
}


/**
 * @brief Encoding and sending one job to the printer selected in the snapshot.
 * The connection is opened for the job and always closed afterwards.
 */
void
PrintService::Deliver( const PrintJob&          job,
                       const PrintRequest&      request,
                       const ConfigSnapshot&    snap,
                       const std::atomic<bool>& cancel,
                       int&                     last_page,
                       unsigned&                pages )
{
  link.SetTimeouts( snap.link.connect_timeout_ms, snap.link.write_timeout_ms );
  link.SetChunkDelay( snap.link.chunk_delay_ms );
  link.SetRequestedPayload( snap.link.max_payload );

  if( cancel ){
    throw job_canceled( "Canceled before printing" );
  }

  if( request.kind == JobKind::DOCUMENT ){
    DeliverDocument( request.document_path, snap, cancel, last_page, pages );
    return;
  }

  const CommandBuffer data = request.kind == JobKind::TEXT ?
                             MakeTextJob( request.text, request.style, snap ) :
                             request.raw;
  pages = 1;

  link.Connect( snap.printer.address, snap.PaperWidth(),
                snap.printer.service_uuid, snap.printer.characteristic_uuid );
  ConnectionGuard guard( link );
  link.Write( data, &cancel );
  last_page = 0;
  printdebug( devname, fmt::format( "Job [{}] sent {} bytes", job.id, data.size() ) );
}


/**
 * @brief Printing a document page by page: each page is rendered to the paper
 * width, quantized and sent as a raster image followed by the feed lines. With
 * auto-cut, a cut separates consecutive pages and a final feed and cut closes
 * the job.
 */
void
PrintService::DeliverDocument( const std::string&       path,
                               const ConfigSnapshot&    snap,
                               const std::atomic<bool>& cancel,
                               int&                     last_page,
                               unsigned&                pages )
{
  if( !factory ){
    throw render_error( "No document renderer available" );
  }
  std::unique_ptr<PageRenderer> renderer = factory( path );
  if( !renderer ){
    throw render_error( fmt::format( "Cannot render document [{}]", path ) );
  }
  pages = renderer->PageCount();
  if( pages == 0 ){
    throw render_error( fmt::format( "Document [{}] has no pages", path ) );
  }

  link.Connect( snap.printer.address, snap.PaperWidth(),
                snap.printer.service_uuid, snap.printer.characteristic_uuid );
  ConnectionGuard guard( link );

  for( unsigned i = 0; i < pages; ++i ){
    if( cancel ){
      throw job_canceled( fmt::format( "Canceled before page {}", i ) );
    }
    printdebug( devname, fmt::format( "Processing page {}/{}", i+1, pages ) );

    const ThermalRaster raster = Quantize( renderer->RenderPage( i, snap.PaperDots() ) );

    EscPosEncoder enc( snap.settings.encoding );
    enc.Initialize();
    if( snap.settings.density != Density::NORMAL ){
      enc.SetDensity( snap.DensityLevel() );
    }
    enc.Raster( raster ).Feed( snap.settings.feed_lines );
    if( snap.settings.auto_cut && i+1 < pages ){
      enc.Cut();
    }
    link.Write( enc.Encode(), &cancel );
    last_page = i;

    if( i+1 < pages && snap.link.page_delay_ms > 0 ){
      std::this_thread::sleep_for( std::chrono::milliseconds( snap.link.page_delay_ms ) );
    }
  }

  if( snap.settings.auto_cut ){
    link.Write( EscPosEncoder().Feed( 2 ).Cut().Encode(), &cancel );
  }
}


/********************************************************************************
 *
 * THREAD MANAGEMENT FUNCTIONS
 *
 *******************************************************************************/

void
PrintService::RunMainLoop( std::atomic<bool>& run_loop )
{
  while( run_loop == true ){
    std::string id;
    {
      std::unique_lock<std::mutex> lock( job_mutex );
      queue_cv.wait( lock, [this, &run_loop]{
        return !run_loop || !queue.empty();
      } );
      if( !run_loop ){ return; }
      id     = queue.front();
      active = id;
      queue.pop_front();
    }

    ProcessJob( id );

    {
      std::lock_guard<std::mutex> lock( job_mutex );
      active = "";
    }
    idle_cv.notify_all();
  }
}


void
PrintService::StartLoopThread()
{
  run_loop    = true;
  loop_thread = std::thread( [this]{
    this->RunMainLoop( std::ref( run_loop ) );
  } );
}


/**
 * @brief Stopping the worker. A job being printed is interrupted at its next
 * chunk boundary. It and every job still queued are suspended into the pending
 * store.
 */
void
PrintService::EndLoopThread()
{
  {
    std::lock_guard<std::mutex> lock( job_mutex );
    run_loop = false;
    for( auto& flag : cancel_flags ){
      flag.second->store( true );
    }
  }
  queue_cv.notify_all();
  if( loop_thread.joinable() ){
    loop_thread.join();
  }

  std::vector<std::pair<std::string, PrintRequest> > leftover;
  {
    std::lock_guard<std::mutex> lock( job_mutex );
    for( const auto& id : queue ){
      const auto it = requests.find( id );
      leftover.push_back( std::make_pair( id, it != requests.end() ?
                                          it->second : PrintRequest() ) );
    }
    queue.clear();
  }
  for( const auto& q : leftover ){
    SuspendJob( q.first, q.second, -1 );
  }
  idle_cv.notify_all();
}
