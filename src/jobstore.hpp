#ifndef JOBSTORE_HPP
#define JOBSTORE_HPP

#include "receipts.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

enum class PendingKind
{
  DOCUMENT,
  RAW,
  TEXT
};

extern std::string pending_kind_name( const PendingKind );
extern PendingKind parse_pending_kind( const std::string& );

/**
 * @brief Job waiting for a printer to be configured.
 *
 * The content path always points to a copy held by the store, which stays
 * valid until the record is removed.
 */
struct PendingJob
{
  std::string id;
  PendingKind kind;
  std::string content_path;
  std::string title;
  uint64_t    created_ms;
  uint64_t    sequence;
  TextStyle   style;// Only meaningful for text jobs

  PendingJob() : kind( PendingKind::DOCUMENT ), created_ms( 0 ), sequence( 0 ){}
};

class JobStore
{
public:
  explicit JobStore( const std::string& spool_dir );

  PendingJob AddFile( const std::string& id,
                      const PendingKind  kind,
                      const std::string& title,
                      const std::string& source_path,
                      const TextStyle&   style = TextStyle() );
  PendingJob AddBytes( const std::string&          id,
                       const PendingKind           kind,
                       const std::string&          title,
                       const std::vector<uint8_t>& content,
                       const TextStyle&            style = TextStyle() );

  std::vector<PendingJob> List() const;
  bool                    Has( const std::string& id ) const;
  PendingJob              Get( const std::string& id ) const;
  std::size_t             Size() const;

  void Remove( const std::string& id );
  void Clear();

  std::vector<uint8_t> ReadContent( const PendingJob& ) const;

  const std::string& SpoolDir() const { return spool_dir; }
  std::string        IndexPath() const;

private:
  std::string             spool_dir;
  std::vector<PendingJob> jobs;
  uint64_t                next_sequence;
  mutable std::mutex      store_mutex;

  void       Load();
  void       save_unlocked() const;
  PendingJob make_record( const std::string&, const PendingKind,
                          const std::string&, const std::string&,
                          const TextStyle& );
  void       check_unique_unlocked( const std::string& id ) const;
  void       insert_unlocked( const PendingJob& );
};

#endif
