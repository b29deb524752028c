#ifndef LINK_HPP
#define LINK_HPP

#include "escpos.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct CharacteristicInfo
{
  std::string uuid;
  bool        writable;

  CharacteristicInfo( const std::string& u = "", const bool w = false ) :
    uuid    ( u ),
    writable( w ){}
};

struct ServiceInfo
{
  std::string                     uuid;
  std::vector<CharacteristicInfo> characteristics;
};

struct ScanResult
{
  std::string              address;
  std::string              name;
  std::vector<std::string> service_uuids;
  int                      rssi;

  ScanResult() : rssi( 0 ){}
};

/**
 * @brief Interface of the physical link to a printer.
 *
 * Implementations present the link as a set of services, each exposing
 * characteristics that may accept writes. Every blocking call takes a timeout
 * and fails with a connection_error (Open, Scan) or transport_error (Write)
 * once it expires. A link that drops while open is reported through the link
 * loss handler, which may be invoked from an internal thread of the device.
 */
class LinkDevice
{
public:
  virtual ~LinkDevice(){}

  virtual bool IsEnabled() const = 0;
  virtual void Open( const std::string& address, const unsigned timeout_ms ) = 0;
  virtual void Close()                                                       = 0;

  virtual std::vector<ServiceInfo> Services() const = 0;

  /**
   * @brief Requesting a maximum transmission unit. Returns the granted MTU, or
   * 0 if the link does not support negotiation.
   */
  virtual unsigned NegotiateMtu( const unsigned requested ) = 0;

  virtual void Write( const std::string& service,
                      const std::string& characteristic,
                      const uint8_t*     data,
                      const std::size_t  len,
                      const unsigned     timeout_ms ) = 0;

  virtual void SetLinkLossHandler( std::function<void()> handler ) = 0;

  /**
   * @brief Reporting reachable endpoints until the timeout expires or the stop
   * flag is raised.
   */
  virtual void Scan( const unsigned                          timeout_ms,
                     std::function<void( const ScanResult& )> found,
                     const std::atomic<bool>&                 stop ) = 0;
};

enum class LinkState
{
  DISCONNECTED,
  CONNECTING,
  CONNECTED
};

extern std::string link_state_name( const LinkState );

/**
 * @brief The printer currently attached to the transport.
 */
struct PrinterEndpoint
{
  std::string address;
  unsigned    paper_width;
  std::string service_uuid;
  std::string characteristic_uuid;
  unsigned    mtu;
  unsigned    max_payload;

  PrinterEndpoint() : paper_width( 58 ), mtu( 0 ), max_payload( 0 ){}
};

class PrinterLink
{
public:
  static const std::string printer_service_uuid;
  static const std::string vendor_service_uuid;

  // ATT protocol header carried by every write.
  static constexpr unsigned header_overhead = 3;
  static constexpr unsigned min_mtu         = 23;
  static constexpr unsigned max_mtu         = 515;

  explicit PrinterLink( LinkDevice& device );
  ~PrinterLink();

  PrinterLink( const PrinterLink& ) = delete;
  PrinterLink& operator=( const PrinterLink& ) = delete;

  void Connect( const std::string& address,
                const unsigned     paper_width         = 58,
                const std::string& service_uuid        = "",
                const std::string& characteristic_uuid = "" );
  void Disconnect();
  void Write( const CommandBuffer&     data,
              const std::atomic<bool>* cancel = nullptr );

  LinkState       State() const { return state; }
  bool            IsConnected() const { return state == LinkState::CONNECTED; }
  bool            LinkLost() const { return link_lost; }
  PrinterEndpoint Endpoint() const;

  void SetTimeouts( const unsigned connect_ms, const unsigned write_ms );
  void SetChunkDelay( const unsigned ms );
  void SetRequestedPayload( const unsigned payload );
  void SetLinkLossListener( std::function<void()> listener );

  typedef std::function<void( const ScanResult& )>  ScanCallback;
  typedef std::function<void( const std::string& )> ScanDoneCallback;

  void Scan( const unsigned   seconds,
             ScanCallback     found,
             ScanDoneCallback done = nullptr );
  void StopScan();
  bool Scanning() const { return scan_running; }
  std::vector<ScanResult> ScanFor( const unsigned seconds );

  static unsigned PayloadForMtu( const unsigned mtu );
  static bool     IsProbablyPrinter( const ScanResult& );
  static void     SelectInterface( const std::vector<ServiceInfo>& services,
                                   const std::string&              preferred_service,
                                   const std::string&              preferred_char,
                                   std::string&                    service,
                                   std::string&                    characteristic );

private:
  LinkDevice& device;

  std::atomic<LinkState> state;
  std::atomic<bool>      link_lost;
  PrinterEndpoint        endpoint;

  mutable std::mutex connect_mutex;
  std::mutex         write_mutex;
  std::mutex         listener_mutex;

  unsigned connect_timeout_ms;
  unsigned write_timeout_ms;
  unsigned chunk_delay_ms;
  unsigned requested_payload;

  std::function<void()> loss_listener;

  std::thread       scan_thread;
  std::atomic<bool> scan_stop;
  std::atomic<bool> scan_running;

  void OnLinkLoss();
  void close_unlocked();
};

#endif
