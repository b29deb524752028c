#include "errors.hpp"
#include "escpos.hpp"

#include <gtest/gtest.h>

#include <algorithm>

static CommandBuffer
bytes( std::initializer_list<uint8_t> b )
{
  return CommandBuffer( b );
}


// Position of a byte sequence inside a buffer, or -1.
static long
find( const CommandBuffer& buf, const CommandBuffer& seq, const std::size_t from = 0 )
{
  const auto it = std::search( buf.begin()+from, buf.end(), seq.begin(), seq.end() );
  return it == buf.end() ? -1 : it-buf.begin();
}


TEST( EscPosEncoder, BasicCommands )
{
  EXPECT_EQ( EscPosEncoder().Initialize().Encode(), bytes( { 0x1B, 0x40 } ) );
  EXPECT_EQ( EscPosEncoder().Align( Alignment::RIGHT ).Encode(),
             bytes( { 0x1B, 0x61, 0x02 } ) );
  EXPECT_EQ( EscPosEncoder().Bold( true ).Bold( false ).Encode(),
             bytes( { 0x1B, 0x45, 0x01, 0x1B, 0x45, 0x00 } ) );
  EXPECT_EQ( EscPosEncoder().Underline( true ).Encode(),
             bytes( { 0x1B, 0x2D, 0x01 } ) );
  EXPECT_EQ( EscPosEncoder().SetFontSize( FontSize::DOUBLE_WIDTH ).Encode(),
             bytes( { 0x1D, 0x21, 0x10 } ) );
  EXPECT_EQ( EscPosEncoder().Cut().Cut( CutMode::PARTIAL ).Encode(),
             bytes( { 0x1D, 0x56, 0x00, 0x1D, 0x56, 0x01 } ) );
  EXPECT_EQ( EscPosEncoder().Line( "ab" ).Encode(), bytes( { 'a', 'b', 0x0A } ) );
}


TEST( EscPosEncoder, ClampsNumericArguments )
{
  EXPECT_EQ( EscPosEncoder().Feed( 300 ).Encode(), bytes( { 0x1B, 0x64, 0xFF } ) );
  EXPECT_EQ( EscPosEncoder().Feed( -2 ).Encode(), bytes( { 0x1B, 0x64, 0x00 } ) );
  EXPECT_EQ( EscPosEncoder().SetDensity( 12 ).Encode(), bytes( { 0x1D, 0x7C, 0x07 } ) );
  EXPECT_EQ( EscPosEncoder().Beep( 20, 10 ).Encode(),
             bytes( { 0x1B, 0x42, 0x09, 0x01 } ) );
  EXPECT_EQ( EscPosEncoder().Beep( 2, 200 ).Encode(),
             bytes( { 0x1B, 0x42, 0x02, 0x04 } ) );
  EXPECT_EQ( EscPosEncoder().OpenDrawer( 5 ).Encode(),
             bytes( { 0x1B, 0x70, 0x01, 0x19, 0xFA } ) );
}


TEST( EscPosEncoder, BoldCenteredTotalLine )
{
  const CommandBuffer out = EscPosEncoder()
                            .Initialize()
                            .Align( Alignment::CENTER )
                            .Bold( true )
                            .Line( "TOTAL" )
                            .Bold( false )
                            .Feed( 3 )
                            .Cut()
                            .Encode();

  ASSERT_GE( out.size(), 2u );
  EXPECT_EQ( out[0], 0x1B );
  EXPECT_EQ( out[1], 0x40 );

  const long text   = find( out, bytes( { 'T', 'O', 'T', 'A', 'L' } ) );
  const long center = find( out, bytes( { 0x1B, 0x61, 0x01 } ) );
  const long bold   = find( out, bytes( { 0x1B, 0x45, 0x01 } ) );
  const long unbold = find( out, bytes( { 0x1B, 0x45, 0x00 } ) );
  ASSERT_GE( text, 0 );
  EXPECT_GE( center, 0 );
  EXPECT_LT( center, text );
  EXPECT_GE( bold, 0 );
  EXPECT_LT( bold, text );
  EXPECT_GT( unbold, text );

  const CommandBuffer tail( out.end()-6, out.end() );
  EXPECT_EQ( tail, bytes( { 0x1B, 0x64, 0x03, 0x1D, 0x56, 0x00 } ) );
}


TEST( EscPosEncoder, RasterHeader )
{
  ThermalRaster r;
  r.width  = 16;
  r.height = 8;
  r.data.assign( 16, 0xFF );

  const CommandBuffer out = EscPosEncoder().Raster( r ).Encode();
  ASSERT_EQ( out.size(), 8u+16u );
  EXPECT_EQ( CommandBuffer( out.begin(), out.begin()+8 ),
             bytes( { 0x1D, 0x76, 0x30, 0x00, 0x02, 0x00, 0x08, 0x00 } ) );
  EXPECT_TRUE( std::all_of( out.begin()+8, out.end(),
                            []( uint8_t b ){ return b == 0xFF; } ) );
}


TEST( EscPosEncoder, RasterRejectsInconsistentData )
{
  ThermalRaster r;
  r.width  = 16;
  r.height = 2;
  r.data.assign( 3, 0 );
  EscPosEncoder enc;
  EXPECT_THROW( enc.Raster( r ), input_error );
  EXPECT_EQ( enc.Size(), 0u );
}


TEST( EscPosEncoder, Barcode )
{
  const CommandBuffer out = EscPosEncoder()
                            .Barcode( "12345", Symbology::CODE39, 500 )
                            .Encode();
  EXPECT_EQ( out, bytes( { 0x1D, 0x68, 0xFF,
                           0x1D, 0x77, 0x02,
                           0x1D, 0x48, 0x02,
                           0x1D, 0x6B, 69, 5, '1', '2', '3', '4', '5' } ) );
}


TEST( EscPosEncoder, BarcodeRejectsBadInput )
{
  EscPosEncoder enc;
  EXPECT_THROW( enc.Barcode( "" ), input_error );
  EXPECT_THROW( enc.Barcode( std::string( 256, '1' ) ), input_error );
  EXPECT_THROW( enc.Barcode( "123", static_cast<Symbology>( 80 ) ), input_error );
  EXPECT_EQ( enc.Size(), 0u );
}


TEST( EscPosEncoder, QRCodeSequence )
{
  const CommandBuffer out = EscPosEncoder().QRCode( "hi", 20 ).Encode();
  const CommandBuffer expected = bytes( {
    0x1D, 0x28, 0x6B, 0x04, 0x00, 0x31, 0x41, 0x32, 0x00,
    0x1D, 0x28, 0x6B, 0x03, 0x00, 0x31, 0x43, 0x10,
    0x1D, 0x28, 0x6B, 0x03, 0x00, 0x31, 0x45, 0x30,
    0x1D, 0x28, 0x6B, 0x05, 0x00, 0x31, 0x50, 0x30, 'h', 'i',
    0x1D, 0x28, 0x6B, 0x03, 0x00, 0x31, 0x51, 0x30 } );
  EXPECT_EQ( out, expected );
}


TEST( EscPosEncoder, QRCodeLongPayloadLength )
{
  const CommandBuffer out = EscPosEncoder().QRCode( std::string( 300, 'x' ) ).Encode();
  // 303 = 0x012F
  EXPECT_GE( find( out, bytes( { 0x1D, 0x28, 0x6B, 0x2F, 0x01, 0x31, 0x50, 0x30 } ) ), 0 );
  EXPECT_THROW( EscPosEncoder().QRCode( "" ), input_error );
}


TEST( EscPosEncoder, KeyValuePadding )
{
  EXPECT_EQ( EscPosEncoder().KeyValue( "Tea", "$2.00", 12 ).Encode(),
             bytes( { 'T', 'e', 'a', ' ', ' ', ' ', ' ', '$', '2', '.', '0', '0', 0x0A } ) );

  // Always at least one separating space
  EXPECT_EQ( EscPosEncoder().KeyValue( "Long item", "9.99", 8 ).Encode(),
             bytes( { 'L', 'o', 'n', 'g', ' ', 'i', 't', 'e', 'm', ' ',
                      '9', '.', '9', '9', 0x0A } ) );

  // Multi-byte characters count as a single column
  const CommandBuffer out = EscPosEncoder().KeyValue( "Caf\xC3\xA9", "1", 6 ).Encode();
  EXPECT_EQ( out.size(), 5u+1u+1u+1u );
}


TEST( EscPosEncoder, HeaderLayout )
{
  const CommandBuffer out = EscPosEncoder().Header( "Shop", "Main st" ).Encode();
  EXPECT_EQ( CommandBuffer( out.begin(), out.begin()+9 ),
             bytes( { 0x1B, 0x61, 0x01, 0x1D, 0x21, 0x11, 0x1B, 0x45, 0x01 } ) );
  EXPECT_GE( find( out, bytes( { 'M', 'a', 'i', 'n', ' ', 's', 't', 0x0A } ) ), 0 );
  EXPECT_GE( find( out, CommandBuffer( 32, '-' ) ), 0 );
  EXPECT_EQ( CommandBuffer( out.end()-3, out.end() ), bytes( { 0x1B, 0x61, 0x00 } ) );
}


TEST( EscPosEncoder, TextEncodings )
{
  // Box drawing character U+2500 is 0xC4 in code page 437.
  EscPosEncoder cp437( TextEncoding::CP437 );
  EXPECT_EQ( cp437.Text( "\xE2\x94\x80" ).Encode(), bytes( { 0xC4 } ) );

  // U+4E2D is 0xD6D0 in GB2312.
  EscPosEncoder gb( TextEncoding::GB2312 );
  EXPECT_EQ( gb.Text( "\xE4\xB8\xAD" ).Encode(), bytes( { 0xD6, 0xD0 } ) );

  EscPosEncoder utf8;
  EXPECT_EQ( utf8.Text( "\xE4\xB8\xAD" ).Encode(), bytes( { 0xE4, 0xB8, 0xAD } ) );
}


TEST( EscPosEncoder, RejectsUnencodableText )
{
  EscPosEncoder cp437( TextEncoding::CP437 );
  EXPECT_THROW( cp437.Text( "\xE4\xB8\xAD" ), input_error );

  EscPosEncoder utf8;
  EXPECT_THROW( utf8.Text( "\xFF\xFE" ), input_error );
  EXPECT_EQ( utf8.Size(), 0u );
}


TEST( EscPosEncoder, ClearResetsBuffer )
{
  EscPosEncoder enc;
  enc.Initialize().Line( "x" );
  EXPECT_EQ( enc.Size(), 4u );
  EXPECT_EQ( enc.Clear().Size(), 0u );
}


TEST( EscPosNames, Parsing )
{
  EXPECT_EQ( parse_symbology( "code128" ), Symbology::CODE128 );
  EXPECT_EQ( parse_symbology( "UPC-A" ), Symbology::UPC_A );
  EXPECT_THROW( parse_symbology( "PDF417" ), input_error );

  EXPECT_EQ( parse_encoding( "utf-8" ), TextEncoding::UTF8 );
  EXPECT_EQ( parse_encoding( "GB2312" ), TextEncoding::GB2312 );
  EXPECT_THROW( parse_encoding( "latin1" ), input_error );
  EXPECT_EQ( encoding_name( TextEncoding::CP437 ), "CP437" );

  EXPECT_EQ( parse_alignment( "Center" ), Alignment::CENTER );
  EXPECT_THROW( parse_alignment( "justify" ), input_error );
  EXPECT_EQ( parse_font_size( "double-height" ), FontSize::DOUBLE_HEIGHT );
  EXPECT_THROW( parse_font_size( "huge" ), input_error );
}
