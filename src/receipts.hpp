#ifndef RECEIPTS_HPP
#define RECEIPTS_HPP

#include "config.hpp"
#include "escpos.hpp"

#include <string>
#include <vector>

/**
 * @brief Formatting applied to a plain text job.
 */
struct TextStyle
{
  Alignment align       = Alignment::LEFT;
  bool      bold        = false;
  bool      underline   = false;
  bool      double_size = false;
};

struct ReceiptItem
{
  std::string name;
  std::string price;
};

struct Receipt
{
  std::string              header;
  std::string              subheader;
  std::vector<ReceiptItem> items;
  std::string              total;
  std::string              footer;
};

/**
 * @defgroup Templates Job templates
 * @brief Complete command streams for the standard job types.
 *
 * Every template starts with a printer reset (followed by the density command
 * when the configured density is not the firmware default), and ends with the
 * configured number of feed lines and a full cut when auto-cut is enabled.
 * @{
 */
extern CommandBuffer MakeTextJob( const std::string&    text,
                                  const TextStyle&      style,
                                  const ConfigSnapshot& config );
extern CommandBuffer MakeTestPage( const ConfigSnapshot& config,
                                   const std::string&    timestamp );
extern CommandBuffer MakeReceipt( const Receipt&        receipt,
                                  const ConfigSnapshot& config );
extern CommandBuffer MakeQRJob( const std::string&    content,
                                const int             size,
                                const ConfigSnapshot& config );
extern CommandBuffer MakeBarcodeJob( const std::string&    content,
                                     const Symbology       type,
                                     const ConfigSnapshot& config );
/** @} */

extern std::string local_timestamp();

#endif
