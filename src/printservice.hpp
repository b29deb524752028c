#ifndef PRINTSERVICE_HPP
#define PRINTSERVICE_HPP

#include "config.hpp"
#include "errors.hpp"
#include "jobstore.hpp"
#include "link.hpp"
#include "receipts.hpp"
#include "renderer.hpp"

#include <boost/uuid/uuid_generators.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

enum class JobKind
{
  TEXT,
  DOCUMENT,
  RAW
};

enum class JobState
{
  QUEUED,
  BLOCKED,
  PRINTING,
  COMPLETED,
  FAILED,
  CANCELED
};

extern std::string job_kind_name( const JobKind );
extern std::string job_state_name( const JobState );

/**
 * @brief Content of a print job as submitted by the host.
 */
struct PrintRequest
{
  JobKind       kind = JobKind::RAW;
  std::string   title;
  std::string   text;// TEXT jobs
  TextStyle     style;
  std::string   document_path;// DOCUMENT jobs
  CommandBuffer raw;// RAW jobs
};

struct PrintJob
{
  std::string id;
  JobKind     kind;
  std::string title;
  JobState    state;
  std::string blocked_reason;
  uint64_t    created_ms;
  uint64_t    completed_ms;
  ErrorClass  error_class;
  std::string error;
  int         last_page;// Last page delivered, -1 if none
  unsigned    page_count;
  bool        pending;// Content is held by the pending job store

  PrintJob() :
    kind        ( JobKind::RAW ),
    state       ( JobState::QUEUED ),
    created_ms  ( 0 ),
    completed_ms( 0 ),
    error_class ( ErrorClass::NONE ),
    last_page   ( -1 ),
    page_count  ( 0 ),
    pending     ( false ){}

  bool Finished() const
  {
    return state == JobState::COMPLETED || state == JobState::FAILED ||
           state == JobState::CANCELED;
  }
};

/**
 * @brief Notifications to the host print subsystem.
 *
 * Every job reaches exactly one of OnCompleted, OnFailed and OnCanceled per
 * delivery attempt, or OnBlocked when the service stops before it finishes. Callbacks are invoked without any internal lock held, from
 * either the submitting thread or the worker thread.
 */
class JobListener
{
public:
  virtual ~JobListener(){}

  virtual void OnQueued( const PrintJob& ){}
  virtual void OnBlocked( const PrintJob& ){}
  virtual void OnSetupRequired( const PrintJob& ){}
  virtual void OnStarted( const PrintJob& ){}
  virtual void OnCompleted( const PrintJob& ){}
  virtual void OnFailed( const PrintJob& ){}
  virtual void OnCanceled( const PrintJob& ){}
};

class PrintService
{
public:
  PrintService( PrinterConfig&  config,
                PrinterLink&    link,
                JobStore&       store,
                RendererFactory factory );
  ~PrintService();

  PrintService( const PrintService& ) = delete;
  PrintService& operator=( const PrintService& ) = delete;

  void SetListener( JobListener* listener );

  std::string Submit( const PrintRequest& request );
  bool        Cancel( const std::string& id );

  void     SetCurrentPrinter( const std::string& printer_id );
  unsigned ResumePending();
  void     DiscardPending( const std::string& id );
  void     ClearPending();

  std::vector<PendingJob> PendingJobs() const;
  std::vector<PrintJob>   ListJobs() const;
  PrintJob                GetJob( const std::string& id ) const;
  void                    Dequeue( const std::string& id );

  bool WaitIdle( const unsigned timeout_ms = 0 );
  bool Idle() const;

private:
  PrinterConfig&  config;
  PrinterLink&    link;
  JobStore&       store;
  RendererFactory factory;
  JobListener*    listener;

  std::map<std::string, PrintJob>                           jobs;
  std::vector<std::string>                                  order;
  std::map<std::string, PrintRequest>                       requests;
  std::map<std::string, std::shared_ptr<std::atomic<bool> > > cancel_flags;
  std::set<std::string>                                     cancel_requested;
  std::deque<std::string>                                   queue;
  std::string                                               active;
  boost::uuids::random_generator                            id_generator;

  mutable std::mutex      job_mutex;
  std::condition_variable queue_cv;
  std::condition_variable idle_cv;

  // Variables for storing the thread handling
  std::thread       loop_thread;
  std::atomic<bool> run_loop;

  void StartLoopThread();
  void EndLoopThread();
  void RunMainLoop( std::atomic<bool>& );

  void ValidateRequest( const PrintRequest& ) const;
  void LoadPending();
  unsigned QueuePending( const bool retry_failed );
  void BlockJob( const std::string& id, const PrintRequest&,
                 const std::string& reason );
  void SuspendJob( const std::string& id, const PrintRequest&, const int last_page );
  void ProcessJob( const std::string& id );
  void Deliver( const PrintJob&, const PrintRequest&, const ConfigSnapshot&,
                const std::atomic<bool>& cancel, int& last_page, unsigned& pages );
  void DeliverDocument( const std::string& path, const ConfigSnapshot&,
                        const std::atomic<bool>& cancel,
                        int& last_page, unsigned& pages );
  PrintRequest RequestFromPending( const PendingJob& ) const;

  std::string NewJobId();
  void        Notify( void ( JobListener::*method )( const PrintJob& ),
                      const PrintJob& );
};

#endif
