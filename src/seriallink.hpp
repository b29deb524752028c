#ifndef SERIALLINK_HPP
#define SERIALLINK_HPP

#include "link.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

/**
 * @brief LinkDevice on a serial character device: a Bluetooth RFCOMM binding
 * (`/dev/rfcommN`) or a USB serial adapter (`/dev/ttyUSBN`, `/dev/ttyACMN`).
 */
class SerialLink : public LinkDevice
{
public:
  static const std::string spp_service_uuid;

  explicit SerialLink( const unsigned baud = 9600, const unsigned max_payload = 512 );
  ~SerialLink();

  bool IsEnabled() const override;
  void Open( const std::string& address, const unsigned timeout_ms ) override;
  void Close() override;

  std::vector<ServiceInfo> Services() const override;
  unsigned                 NegotiateMtu( const unsigned requested ) override;

  void Write( const std::string& service,
              const std::string& characteristic,
              const uint8_t*     data,
              const std::size_t  len,
              const unsigned     timeout_ms ) override;

  void SetLinkLossHandler( std::function<void()> handler ) override;
  void Scan( const unsigned                          timeout_ms,
             std::function<void( const ScanResult& )> found,
             const std::atomic<bool>&                 stop ) override;

  const std::string& DevPath() const { return dev_path; }
  std::string        DeviceName() const;

private:
  std::string dev_path;
  int         serial_IO;
  unsigned    baud;
  unsigned    max_payload;

  std::function<void()> loss_handler;
  std::mutex            handler_mutex;

  // Watch thread reporting hang-ups of the device.
  std::thread       loop_thread;
  std::atomic<bool> run_loop;

  void StartLoopThread();
  void EndLoopThread();
  void RunMainLoop( std::atomic<bool>& );
  void ReportLinkLoss();
};

#endif
