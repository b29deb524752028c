#include "errors.hpp"
#include "receipts.hpp"

#include <gtest/gtest.h>

#include <algorithm>

static bool
contains( const CommandBuffer& buf, const CommandBuffer& seq )
{
  return std::search( buf.begin(), buf.end(), seq.begin(), seq.end() ) != buf.end();
}


static bool
ends_with( const CommandBuffer& buf, const CommandBuffer& seq )
{
  return buf.size() >= seq.size() &&
         std::equal( seq.begin(), seq.end(), buf.end()-seq.size() );
}


TEST( TextJob, BoldCenteredWithCut )
{
  ConfigSnapshot cfg;
  TextStyle      style;
  style.align = Alignment::CENTER;
  style.bold  = true;

  const CommandBuffer out = MakeTextJob( "TOTAL", style, cfg );
  EXPECT_EQ( CommandBuffer( out.begin(), out.begin()+8 ),
             CommandBuffer( { 0x1B, 0x40, 0x1B, 0x61, 0x01, 0x1B, 0x45, 0x01 } ) );
  EXPECT_TRUE( contains( out, { 'T', 'O', 'T', 'A', 'L', 0x0A, 0x1B, 0x45, 0x00 } ) );
  EXPECT_TRUE( ends_with( out, { 0x1B, 0x64, 0x03, 0x1D, 0x56, 0x00 } ) );
}


TEST( TextJob, PlainTextHasNoStyleEnable )
{
  ConfigSnapshot cfg;
  cfg.settings.auto_cut   = false;
  cfg.settings.feed_lines = 1;

  const CommandBuffer out = MakeTextJob( "hello", TextStyle(), cfg );
  EXPECT_FALSE( contains( out, { 0x1B, 0x45, 0x01 } ) );
  EXPECT_FALSE( contains( out, { 0x1B, 0x2D, 0x01 } ) );
  EXPECT_FALSE( contains( out, { 0x1D, 0x56 } ) );
  EXPECT_FALSE( contains( out, { 0x1D, 0x7C } ) );
  EXPECT_TRUE( ends_with( out, { 0x1B, 0x64, 0x01 } ) );
}


TEST( TextJob, DensityFollowsReset )
{
  ConfigSnapshot cfg;
  cfg.settings.density = Density::DARK;
  const CommandBuffer out = MakeTextJob( "x", TextStyle(), cfg );
  EXPECT_EQ( CommandBuffer( out.begin(), out.begin()+5 ),
             CommandBuffer( { 0x1B, 0x40, 0x1D, 0x7C, 0x06 } ) );
}


TEST( TextJob, EncodingFromSettings )
{
  ConfigSnapshot cfg;
  cfg.settings.encoding = TextEncoding::CP437;
  EXPECT_THROW( MakeTextJob( "\xE4\xB8\xAD", TextStyle(), cfg ), input_error );
}


TEST( TestPage, UsesPaperColumns )
{
  ConfigSnapshot cfg;
  const CommandBuffer narrow = MakeTestPage( cfg, "2024-01-01 12:00:00" );
  EXPECT_TRUE( contains( narrow, CommandBuffer( 32, '=' ) ) );
  EXPECT_FALSE( contains( narrow, CommandBuffer( 33, '=' ) ) );

  cfg.settings.paper_width = 80;
  const CommandBuffer wide = MakeTestPage( cfg, "2024-01-01 12:00:00" );
  EXPECT_TRUE( contains( wide, CommandBuffer( 48, '=' ) ) );

  const std::string ts = "2024-01-01 12:00:00";
  EXPECT_TRUE( contains( wide, CommandBuffer( ts.begin(), ts.end() ) ) );
  EXPECT_TRUE( ends_with( wide, { 0x1B, 0x64, 0x03, 0x1D, 0x56, 0x00 } ) );
}


TEST( Receipt, ItemsAndTotal )
{
  ConfigSnapshot cfg;
  Receipt        r;
  r.header    = "Corner Shop";
  r.subheader = "Receipt #12";
  r.items     = { { "Coffee", "3.50" }, { "Bagel", "2.25" } };
  r.total     = "5.75";
  r.footer    = "Thank you";

  const CommandBuffer out = MakeReceipt( r, cfg );

  const std::string coffee = "Coffee"+std::string( 32-6-4, ' ' )+"3.50\n";
  const std::string total  = "TOTAL"+std::string( 32-5-4, ' ' )+"5.75\n";
  EXPECT_TRUE( contains( out, CommandBuffer( coffee.begin(), coffee.end() ) ) );
  EXPECT_TRUE( contains( out, CommandBuffer( total.begin(), total.end() ) ) );
  EXPECT_TRUE( contains( out, { 'T', 'h', 'a', 'n', 'k', ' ', 'y', 'o', 'u' } ) );
}


TEST( CodeJobs, QRAndBarcode )
{
  ConfigSnapshot cfg;
  const CommandBuffer qr = MakeQRJob( "https://example.com", 8, cfg );
  EXPECT_TRUE( contains( qr, { 0x1B, 0x61, 0x01, 0x1D, 0x28, 0x6B } ) );
  EXPECT_TRUE( contains( qr, { 0x31, 0x43, 0x08 } ) );

  const CommandBuffer bc = MakeBarcodeJob( "4006381333931", Symbology::EAN13, cfg );
  EXPECT_TRUE( contains( bc, { 0x1D, 0x6B, 67, 13 } ) );

  EXPECT_THROW( MakeBarcodeJob( "", Symbology::EAN13, cfg ), input_error );
}


TEST( Timestamp, Format )
{
  const std::string ts = local_timestamp();
  ASSERT_EQ( ts.size(), 19u );
  EXPECT_EQ( ts[4], '-' );
  EXPECT_EQ( ts[10], ' ' );
  EXPECT_EQ( ts[13], ':' );
}
