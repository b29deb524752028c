#include "receipts.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <ctime>

static void
begin_job( EscPosEncoder& enc, const ConfigSnapshot& config )
{
  enc.Initialize();
  if( config.settings.density != Density::NORMAL ){
    enc.SetDensity( config.DensityLevel() );
  }
}


static void
finish_job( EscPosEncoder& enc, const ConfigSnapshot& config )
{
  enc.Feed( config.settings.feed_lines );
  if( config.settings.auto_cut ){
    enc.Cut();
  }
}


/**
 * @brief A single block of text. All formatting is reset after the text so
 * that the printer is left in its default state for the next job.
 */
CommandBuffer
MakeTextJob( const std::string&    text,
             const TextStyle&      style,
             const ConfigSnapshot& config )
{
  EscPosEncoder enc( config.settings.encoding );
  begin_job( enc, config );

  if( style.align != Alignment::LEFT ){ enc.Align( style.align ); }
  if( style.bold ){ enc.Bold( true ); }
  if( style.underline ){ enc.Underline( true ); }
  if( style.double_size ){ enc.SetFontSize( FontSize::DOUBLE ); }

  enc.Line( text )
  .Bold( false )
  .Underline( false )
  .SetFontSize( FontSize::NORMAL )
  .Align( Alignment::LEFT );

  finish_job( enc, config );
  return enc.Encode();
}


CommandBuffer
MakeTestPage( const ConfigSnapshot& config, const std::string& timestamp )
{
  const unsigned width = config.LineWidth();
  EscPosEncoder  enc( config.settings.encoding );
  begin_job( enc, config );

  enc.Align( Alignment::CENTER )
  .SetFontSize( FontSize::DOUBLE )
  .Bold( true )
  .Line( "Raw Thermal" )
  .SetFontSize( FontSize::NORMAL )
  .Bold( false )
  .Line( "Test Print" )
  .HorizontalRule( '=', width )
  .Newline()
  .Align( Alignment::LEFT )
  .Line( "Normal text" )
  .Bold( true ).Line( "Bold text" ).Bold( false )
  .Underline( true ).Line( "Underlined text" ).Underline( false )
  .Newline()
  .SetFontSize( FontSize::DOUBLE_HEIGHT ).Line( "Double Height" )
  .SetFontSize( FontSize::DOUBLE_WIDTH ).Line( "Double Width" )
  .SetFontSize( FontSize::DOUBLE ).Line( "Double Size" )
  .SetFontSize( FontSize::NORMAL )
  .Newline()
  .Align( Alignment::LEFT ).Line( "Left aligned" )
  .Align( Alignment::CENTER ).Line( "Center aligned" )
  .Align( Alignment::RIGHT ).Line( "Right aligned" )
  .Align( Alignment::LEFT )
  .Newline()
  .HorizontalRule( '-', width )
  .KeyValue( "Item 1", "$10.00", width )
  .KeyValue( "Item 2", "$25.50", width )
  .KeyValue( "Item 3", "$5.25", width )
  .HorizontalRule( '-', width )
  .Bold( true ).KeyValue( "TOTAL", "$40.75", width ).Bold( false )
  .Newline()
  .Align( Alignment::CENTER )
  .Line( timestamp )
  .Newline()
  .Line( "Printer is working!" )
  .Newline();

  finish_job( enc, config );
  return enc.Encode();
}


CommandBuffer
MakeReceipt( const Receipt& receipt, const ConfigSnapshot& config )
{
  const unsigned width = config.LineWidth();
  EscPosEncoder  enc( config.settings.encoding );
  begin_job( enc, config );

  enc.Header( receipt.header, receipt.subheader ).Newline();
  for( const auto& item : receipt.items ){
    enc.KeyValue( item.name, item.price, width );
  }
  enc.HorizontalRule( '-', width )
  .Bold( true )
  .KeyValue( "TOTAL", receipt.total, width )
  .Bold( false )
  .Newline();

  if( !receipt.footer.empty() ){
    enc.Align( Alignment::CENTER ).Line( receipt.footer ).Align( Alignment::LEFT );
  }

  finish_job( enc, config );
  return enc.Encode();
}


CommandBuffer
MakeQRJob( const std::string& content, const int size, const ConfigSnapshot& config )
{
  EscPosEncoder enc( config.settings.encoding );
  begin_job( enc, config );
  enc.Align( Alignment::CENTER ).QRCode( content, size ).Newline();
  finish_job( enc, config );
  return enc.Encode();
}


CommandBuffer
MakeBarcodeJob( const std::string&    content,
                const Symbology       type,
                const ConfigSnapshot& config )
{
  EscPosEncoder enc( config.settings.encoding );
  begin_job( enc, config );
  enc.Align( Alignment::CENTER ).Barcode( content, type ).Newline();
  finish_job( enc, config );
  return enc.Encode();
}


std::string
local_timestamp()
{
  const std::time_t now = std::time( nullptr );
  std::tm           tm_now;
  localtime_r( &now, &tm_now );
  return fmt::format( "{:%Y-%m-%d %H:%M:%S}", tm_now );
}
