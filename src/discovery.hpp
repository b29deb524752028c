#ifndef DISCOVERY_HPP
#define DISCOVERY_HPP

#include "config.hpp"

#include <mutex>
#include <set>
#include <string>
#include <vector>

struct MediaSize
{
  std::string id;
  std::string label;
  unsigned    width_mils;
  unsigned    height_mils;
  bool        is_default;
};

struct Resolution
{
  std::string id;
  std::string label;
  unsigned    horizontal_dpi;
  unsigned    vertical_dpi;
};

enum class ColorMode
{
  MONOCHROME,
  COLOR
};

enum class PrinterStatus
{
  IDLE,
  BUSY,
  UNAVAILABLE
};

struct PrinterCapabilities
{
  std::vector<MediaSize> media;
  Resolution             resolution;
  std::vector<ColorMode> color_modes;
  ColorMode              default_color;
};

struct PrinterInfo
{
  std::string         id;
  std::string         name;
  std::string         description;
  PrinterStatus       status;
  PrinterCapabilities capabilities;
};

/**
 * @brief Receiver of the printers advertised to the host print subsystem.
 */
class DiscoveryListener
{
public:
  virtual ~DiscoveryListener(){}
  virtual void OnPrintersAdded( const std::vector<PrinterInfo>& ) = 0;
};

class DiscoverySession
{
public:
  static const std::string virtual_printer_id;
  static const std::string virtual_printer_name;

  DiscoverySession( const PrinterConfig& config, DiscoveryListener& listener );
  ~DiscoverySession();

  void                     StartDiscovery( const std::vector<std::string>& priority = {} );
  void                     StopDiscovery();
  std::vector<std::string> ValidatePrinters( const std::vector<std::string>& ids );
  void                     StartTracking( const std::string& id );
  void                     StopTracking( const std::string& id );
  void                     Destroy();

  bool                  Discovering() const;
  bool                  Destroyed() const;
  std::set<std::string> Tracked() const;

  PrinterInfo                VirtualPrinter() const;
  static PrinterCapabilities BuildCapabilities( const unsigned paper_width );

private:
  const PrinterConfig& config;
  DiscoveryListener&   listener;

  bool                  discovering;
  bool                  destroyed;
  std::set<std::string> tracked;
  mutable std::mutex    session_mutex;

  void ReportPrinters();
  void CheckAlive() const;
};

#endif
