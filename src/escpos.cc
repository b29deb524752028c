/**
 * @file escpos.cc
 * @brief Encoder for the ESC/POS command subset understood by thermal receipt
 * printers.
 *
 * @class EscPosEncoder
 * @brief Builder of printer command streams.
 *
 * @details Every method appends the fixed-format opcode bytes of one printer
 * command to an internal buffer and returns the encoder, so that commands can
 * be chained:
 *
 * ```
 * EscPosEncoder().Initialize().Align( Alignment::CENTER ).Bold( true )
 *                .Line( "TOTAL" ).Bold( false ).Feed( 3 ).Cut().Encode();
 * ```
 *
 * The encoder never performs I/O. Numeric arguments outside of the range
 * accepted by the printer are clamped rather than rejected, which matches how
 * the printer firmware itself tolerates out-of-range values. Arguments that
 * cannot be clamped into something meaningful (unknown barcode symbology,
 * payloads exceeding the length field, text that cannot be represented in the
 * selected character encoding) are rejected as input errors before anything
 * is appended.
 *
 * Command reference used for the byte layouts:
 * https://reference.epson-biz.com/modules/ref_escpos/index.php
 */
#include "escpos.hpp"

#include "errors.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/locale/encoding.hpp>

#include <algorithm>

namespace {

constexpr uint8_t ESC = 0x1B;
constexpr uint8_t GS  = 0x1D;
constexpr uint8_t LF  = 0x0A;

int
clamp( const int x, const int lo, const int hi )
{
  return std::max( lo, std::min( x, hi ) );
}

// Number of displayed characters of a UTF-8 string, used for column padding.
std::size_t
display_length( const std::string& str )
{
  std::size_t n = 0;
  for( const char c : str ){
    if( ( static_cast<uint8_t>( c ) & 0xC0 ) != 0x80 ){ ++n; }
  }
  return n;
}

}


EscPosEncoder::EscPosEncoder( const TextEncoding enc ) :
  encoding( enc )
{}


void
EscPosEncoder::push( std::initializer_list<uint8_t> bytes )
{
  buffer.insert( buffer.end(), bytes.begin(), bytes.end() );
}


void
EscPosEncoder::push( const std::string& bytes )
{
  buffer.insert( buffer.end(), bytes.begin(), bytes.end() );
}


/**
 * @brief ESC @, resetting the printer to its power-on state.
 */
EscPosEncoder&
EscPosEncoder::Initialize()
{
  push( { ESC, 0x40 } );
  return *this;
}


EscPosEncoder&
EscPosEncoder::Align( const Alignment a )
{
  push( { ESC, 0x61, static_cast<uint8_t>( a ) } );
  return *this;
}


EscPosEncoder&
EscPosEncoder::Bold( const bool enable )
{
  push( { ESC, 0x45, uint8_t( enable ? 1 : 0 ) } );
  return *this;
}


EscPosEncoder&
EscPosEncoder::Underline( const bool enable )
{
  push( { ESC, 0x2D, uint8_t( enable ? 1 : 0 ) } );
  return *this;
}


/**
 * @brief GS ! n. The lower nibble of n is the height magnification, the upper
 * nibble the width magnification.
 */
EscPosEncoder&
EscPosEncoder::SetFontSize( const FontSize s )
{
  push( { GS, 0x21, static_cast<uint8_t>( s ) } );
  return *this;
}


/**
 * @brief Converting a UTF-8 string to the byte representation of the selected
 * character encoding.
 *
 * UTF-8 output is passed through after validation. For the legacy code pages
 * the conversion is strict: a character that has no representation in the
 * target code page (or malformed UTF-8 input) is an input error rather than a
 * silently substituted character.
 */
std::string
EscPosEncoder::TranscodeText( const std::string& content ) const
{
  namespace conv = boost::locale::conv;
  try {
    switch( encoding ){
    case TextEncoding::GB2312:
      return conv::from_utf<char>( content, "GB2312", conv::stop );
    case TextEncoding::CP437:
      return conv::from_utf<char>( content, "CP437", conv::stop );
    default:
      return conv::utf_to_utf<char>( content, conv::stop );
    }
  } catch( conv::conversion_error& e ){
    throw input_error( ( boost::format(
      "Text cannot be encoded as %s: %s" )
                         % encoding_name( encoding ) % e.what() ).str() );
  } catch( conv::invalid_charset_error& e ){
    throw input_error( ( boost::format(
      "Character set %s is not available: %s" )
                         % encoding_name( encoding ) % e.what() ).str() );
  }
}


EscPosEncoder&
EscPosEncoder::Text( const std::string& content )
{
  push( TranscodeText( content ) );
  return *this;
}


EscPosEncoder&
EscPosEncoder::Line( const std::string& content )
{
  return Text( content ).Newline();
}


EscPosEncoder&
EscPosEncoder::Newline()
{
  push( { LF } );
  return *this;
}


/**
 * @brief ESC d n, feeding n lines. The count is a single byte on the wire.
 */
EscPosEncoder&
EscPosEncoder::Feed( const int lines )
{
  push( { ESC, 0x64, uint8_t( clamp( lines, 0, 255 ) ) } );
  return *this;
}


EscPosEncoder&
EscPosEncoder::Cut( const CutMode mode )
{
  push( { GS, 0x56, static_cast<uint8_t>( mode ) } );
  return *this;
}


/**
 * @brief GS v 0, printing a raster bit image in normal density mode.
 *
 * The 8 byte header holds the width in bytes and the height in dots, both as
 * little-endian 16 bit values, and is followed by the packed raster rows.
 */
EscPosEncoder&
EscPosEncoder::Raster( const ThermalRaster& img )
{
  const unsigned widthbytes = img.WidthBytes();
  if( widthbytes == 0 || img.height == 0 ){
    throw input_error( "Raster image has no pixels" );
  }
  if( widthbytes > 0xFFFF || img.height > 0xFFFF ){
    throw input_error( ( boost::format(
      "Raster image [%ux%u] exceeds the 16 bit size fields" )
                         % img.width % img.height ).str() );
  }
  if( img.data.size() != std::size_t( widthbytes ) * img.height ){
    throw input_error( ( boost::format(
      "Raster data holds %u bytes, expected %u" )
                         % img.data.size()
                         % ( std::size_t( widthbytes ) * img.height ) ).str() );
  }

  push( { GS, 0x76, 0x30, 0x00,
          uint8_t( widthbytes & 0xFF ), uint8_t( ( widthbytes >> 8 ) & 0xFF ),
          uint8_t( img.height & 0xFF ), uint8_t( ( img.height >> 8 ) & 0xFF ) } );
  buffer.insert( buffer.end(), img.data.begin(), img.data.end() );
  return *this;
}


/**
 * @brief Printing a 1D barcode.
 *
 * Sets the bar height (GS h, clamped to 1-255 dots), a medium module width
 * (GS w 2) and the human readable text below the bars (GS H 2), then issues
 * GS k in function B form, where the data length is sent as a single byte.
 */
EscPosEncoder&
EscPosEncoder::Barcode( const std::string& content,
                        const Symbology    type,
                        const int          height )
{
  const uint8_t code = static_cast<uint8_t>( type );
  if( code < static_cast<uint8_t>( Symbology::UPC_A ) ||
      code > static_cast<uint8_t>( Symbology::CODE128 ) ){
    throw input_error( ( boost::format( "Unsupported barcode symbology [%d]" )
                         % int( code ) ).str() );
  }
  if( content.empty() || content.length() > 255 ){
    throw input_error( ( boost::format(
      "Barcode content length %u is outside of [1,255]" )
                         % content.length() ).str() );
  }

  push( { GS, 0x68, uint8_t( clamp( height, 1, 255 ) ) } );
  push( { GS, 0x77, 2 } );
  push( { GS, 0x48, 2 } );
  push( { GS, 0x6B, code, uint8_t( content.length() ) } );
  push( content );
  return *this;
}


/**
 * @brief Printing a QR code with the GS ( k function sequence.
 *
 * Model 2, module size clamped to 1-16, error correction level L, then the
 * store-data and print functions.
 */
EscPosEncoder&
EscPosEncoder::QRCode( const std::string& content, const int size )
{
  if( content.empty() || content.length()+3 > 0xFFFF ){
    throw input_error( ( boost::format(
      "QR code content length %u is not printable" )
                         % content.length() ).str() );
  }
  const std::size_t len = content.length()+3;

  push( { GS, 0x28, 0x6B, 0x04, 0x00, 0x31, 0x41, 0x32, 0x00 } );
  push( { GS, 0x28, 0x6B, 0x03, 0x00, 0x31, 0x43, uint8_t( clamp( size, 1, 16 ) ) } );
  push( { GS, 0x28, 0x6B, 0x03, 0x00, 0x31, 0x45, 0x30 } );
  push( { GS, 0x28, 0x6B,
          uint8_t( len & 0xFF ), uint8_t( ( len >> 8 ) & 0xFF ),
          0x31, 0x50, 0x30 } );
  push( content );
  push( { GS, 0x28, 0x6B, 0x03, 0x00, 0x31, 0x51, 0x30 } );
  return *this;
}


/**
 * @brief ESC p m t1 t2: pulse to the cash drawer connector pin (0 or 1), 50ms
 * on and 500ms off.
 */
EscPosEncoder&
EscPosEncoder::OpenDrawer( const int pin )
{
  push( { ESC, 0x70, uint8_t( clamp( pin, 0, 1 ) ), 25, 250 } );
  return *this;
}


/**
 * @brief ESC B n t, with the duration given in milliseconds and sent in units
 * of 50ms. Both values are limited to 1-9 by the command.
 */
EscPosEncoder&
EscPosEncoder::Beep( const int times, const int duration_ms )
{
  push( { ESC, 0x42,
          uint8_t( clamp( times, 1, 9 ) ),
          uint8_t( clamp( duration_ms / 50, 1, 9 ) ) } );
  return *this;
}


/**
 * @brief GS | n, print density from 0 (lightest) to 7 (darkest).
 */
EscPosEncoder&
EscPosEncoder::SetDensity( const int level )
{
  push( { GS, 0x7C, uint8_t( clamp( level, 0, 7 ) ) } );
  return *this;
}


EscPosEncoder&
EscPosEncoder::HorizontalRule( const char ch, const unsigned width )
{
  return Line( std::string( width, ch ) );
}


/**
 * @brief Printing a key on the left and a value on the right of the same line,
 * padded to the given column width. At least one space always separates the
 * two.
 */
EscPosEncoder&
EscPosEncoder::KeyValue( const std::string& key,
                         const std::string& value,
                         const unsigned     width )
{
  const std::size_t used    = display_length( key )+display_length( value );
  const std::size_t padding = used < width ? width-used : 1;
  return Line( key+std::string( padding, ' ' )+value );
}


EscPosEncoder&
EscPosEncoder::Header( const std::string& title, const std::string& subtitle )
{
  Align( Alignment::CENTER ).SetFontSize( FontSize::DOUBLE ).Bold( true );
  Line( title ).SetFontSize( FontSize::NORMAL ).Bold( false );
  if( !subtitle.empty() ){
    Line( subtitle );
  }
  return HorizontalRule().Align( Alignment::LEFT );
}


CommandBuffer
EscPosEncoder::Encode() const
{
  return buffer;
}


EscPosEncoder&
EscPosEncoder::Clear()
{
  buffer.clear();
  return *this;
}


std::size_t
EscPosEncoder::Size() const
{
  return buffer.size();
}


/********************************************************************************
 *
 * PARSING OF USER FACING NAMES
 *
 *******************************************************************************/

Symbology
parse_symbology( const std::string& name )
{
  const std::string n = boost::algorithm::to_upper_copy( name );
  if( n == "UPC-A" || n == "UPCA" ){ return Symbology::UPC_A; }
  if( n == "UPC-E" || n == "UPCE" ){ return Symbology::UPC_E; }
  if( n == "EAN13" ){ return Symbology::EAN13; }
  if( n == "EAN8" ){ return Symbology::EAN8; }
  if( n == "CODE39" ){ return Symbology::CODE39; }
  if( n == "ITF" ){ return Symbology::ITF; }
  if( n == "CODABAR" ){ return Symbology::CODABAR; }
  if( n == "CODE93" ){ return Symbology::CODE93; }
  if( n == "CODE128" ){ return Symbology::CODE128; }
  throw input_error( ( boost::format( "Unsupported barcode symbology [%s]" )
                       % name ).str() );
}


TextEncoding
parse_encoding( const std::string& name )
{
  const std::string n = boost::algorithm::to_upper_copy( name );
  if( n == "UTF-8" || n == "UTF8" ){ return TextEncoding::UTF8; }
  if( n == "GB2312" ){ return TextEncoding::GB2312; }
  if( n == "CP437" ){ return TextEncoding::CP437; }
  throw input_error( ( boost::format( "Unsupported text encoding [%s]" )
                       % name ).str() );
}


std::string
encoding_name( const TextEncoding enc )
{
  switch( enc ){
  case TextEncoding::GB2312: return "GB2312";
  case TextEncoding::CP437:  return "CP437";
  default:                   return "UTF-8";
  }
}


Alignment
parse_alignment( const std::string& name )
{
  const std::string n = boost::algorithm::to_lower_copy( name );
  if( n == "left" ){ return Alignment::LEFT; }
  if( n == "center" ){ return Alignment::CENTER; }
  if( n == "right" ){ return Alignment::RIGHT; }
  throw input_error( ( boost::format( "Unknown alignment [%s]" ) % name ).str() );
}


FontSize
parse_font_size( const std::string& name )
{
  const std::string n = boost::algorithm::to_lower_copy( name );
  if( n == "normal" ){ return FontSize::NORMAL; }
  if( n == "double-height" ){ return FontSize::DOUBLE_HEIGHT; }
  if( n == "double-width" ){ return FontSize::DOUBLE_WIDTH; }
  if( n == "double" ){ return FontSize::DOUBLE; }
  throw input_error( ( boost::format( "Unknown font size [%s]" ) % name ).str() );
}
