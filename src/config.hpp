#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "escpos.hpp"

#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Printer entry as stored in the list of saved printers.
 */
struct SavedPrinter
{
  std::string id;
  std::string name;
  std::string type;// "bluetooth" or "serial"
  std::string address;
  unsigned    paper_width;// in mm, 58 or 80
  std::string service_uuid;
  std::string characteristic_uuid;

  SavedPrinter() : type( "serial" ), paper_width( 58 ){}
};

enum class Density
{
  LIGHT,
  NORMAL,
  DARK
};

extern Density     parse_density( const std::string& );
extern std::string density_name( const Density );

struct PrintSettings
{
  unsigned     paper_width = 58;
  bool         auto_cut    = true;
  unsigned     feed_lines  = 3;
  Density      density     = Density::NORMAL;
  TextEncoding encoding    = TextEncoding::UTF8;
};

struct LinkSettings
{
  unsigned baud               = 9600;
  unsigned connect_timeout_ms = 10000;
  unsigned write_timeout_ms   = 5000;
  unsigned chunk_delay_ms     = 1;
  unsigned page_delay_ms      = 500;
  unsigned max_payload        = 512;
};

struct LogSettings
{
  std::string level = "info";
  std::string file  = "";
};

/**
 * @brief Consistent copy of the configuration, taken once per print job.
 */
struct ConfigSnapshot
{
  bool          has_printer = false;
  SavedPrinter  printer;
  PrintSettings settings;
  LinkSettings  link;
  std::string   spool_dir;

  unsigned PaperWidth() const;
  unsigned PaperDots() const;
  unsigned LineWidth() const;
  int      DensityLevel() const;
};

/**
 * @brief Paper geometry of 203 dpi print heads.
 * @{
 */
extern unsigned paper_dots( const unsigned paper_width_mm );
extern unsigned line_columns( const unsigned paper_width_mm );
/** @} */

class PrinterConfig
{
public:
  PrinterConfig();
  explicit PrinterConfig( const std::string& path );

  void Load( const std::string& path );
  void Save() const;

  ConfigSnapshot Snapshot() const;

  std::vector<SavedPrinter> Printers() const;
  void                      SavePrinter( const SavedPrinter& );
  void                      RemovePrinter( const std::string& id );
  bool                      HasPrinter( const std::string& id ) const;

  void         SetCurrentPrinter( const std::string& id );
  void         ClearCurrentPrinter();
  std::string  CurrentPrinterId() const;
  bool         HasCurrentPrinter() const;
  SavedPrinter CurrentPrinter() const;

  PrintSettings Settings() const;
  void          SetSettings( const PrintSettings& );
  LinkSettings  Link() const;
  void          SetLink( const LinkSettings& );
  LogSettings   Log() const;
  std::string   SpoolDir() const;
  void          SetSpoolDir( const std::string& );

  const std::string& Path() const { return path; }

private:
  mutable std::mutex config_mutex;

  std::string               path;
  std::vector<SavedPrinter> printers;
  std::string               current_id;
  PrintSettings             settings;
  LinkSettings              link;
  LogSettings               log;
  std::string               spool_dir;

  void InitVarDefault();
  void save_unlocked() const;
  bool has_printer_unlocked( const std::string& ) const;
};

#endif
