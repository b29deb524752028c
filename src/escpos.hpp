#ifndef ESCPOS_HPP
#define ESCPOS_HPP

#include "quantizer.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

typedef std::vector<uint8_t> CommandBuffer;

enum class Alignment : uint8_t
{
  LEFT   = 0,
  CENTER = 1,
  RIGHT  = 2
};

enum class FontSize : uint8_t
{
  NORMAL        = 0x00,
  DOUBLE_HEIGHT = 0x01,
  DOUBLE_WIDTH  = 0x10,
  DOUBLE        = 0x11
};

enum class CutMode : uint8_t
{
  FULL    = 0x00,
  PARTIAL = 0x01
};

/**
 * @brief 1D barcode symbologies, values are the `GS k` function B codes.
 */
enum class Symbology : uint8_t
{
  UPC_A   = 65,
  UPC_E   = 66,
  EAN13   = 67,
  EAN8    = 68,
  CODE39  = 69,
  ITF     = 70,
  CODABAR = 71,
  CODE93  = 72,
  CODE128 = 73
};

enum class TextEncoding
{
  UTF8,
  GB2312,
  CP437
};

extern Symbology    parse_symbology( const std::string& );
extern TextEncoding parse_encoding( const std::string& );
extern std::string  encoding_name( const TextEncoding );
extern Alignment    parse_alignment( const std::string& );
extern FontSize     parse_font_size( const std::string& );

class EscPosEncoder
{
public:
  explicit EscPosEncoder( const TextEncoding enc = TextEncoding::UTF8 );

  EscPosEncoder& Initialize();
  EscPosEncoder& Align( const Alignment );
  EscPosEncoder& Bold( const bool );
  EscPosEncoder& Underline( const bool );
  EscPosEncoder& SetFontSize( const FontSize );
  EscPosEncoder& Text( const std::string& );
  EscPosEncoder& Line( const std::string& );
  EscPosEncoder& Newline();
  EscPosEncoder& Feed( const int lines );
  EscPosEncoder& Cut( const CutMode mode = CutMode::FULL );
  EscPosEncoder& Raster( const ThermalRaster& );
  EscPosEncoder& Barcode( const std::string& content,
                          const Symbology    type   = Symbology::CODE128,
                          const int          height = 80 );
  EscPosEncoder& QRCode( const std::string& content, const int size = 6 );
  EscPosEncoder& OpenDrawer( const int pin = 0 );
  EscPosEncoder& Beep( const int times = 1, const int duration_ms = 100 );
  EscPosEncoder& SetDensity( const int level );

  // Receipt layout helpers
  EscPosEncoder& HorizontalRule( const char ch = '-', const unsigned width = 32 );
  EscPosEncoder& KeyValue( const std::string& key,
                           const std::string& value,
                           const unsigned     width = 32 );
  EscPosEncoder& Header( const std::string& title,
                         const std::string& subtitle = "" );

  CommandBuffer  Encode() const;
  EscPosEncoder& Clear();
  std::size_t    Size() const;

  TextEncoding Encoding() const { return encoding; }
  void         SetEncoding( const TextEncoding enc ){ encoding = enc; }

  std::string TranscodeText( const std::string& ) const;

private:
  CommandBuffer buffer;
  TextEncoding  encoding;

  void push( std::initializer_list<uint8_t> );
  void push( const std::string& );
};

#endif
