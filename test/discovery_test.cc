#include "config.hpp"
#include "discovery.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

class CollectingListener : public DiscoveryListener
{
public:
  void
  OnPrintersAdded( const std::vector<PrinterInfo>& printers ) override
  {
    reports.push_back( printers );
  }

  std::vector<std::vector<PrinterInfo> > reports;
};


static const MediaSize*
find_media( const PrinterCapabilities& caps, const std::string& id )
{
  for( const auto& m : caps.media ){
    if( m.id == id ){ return &m; }
  }
  return nullptr;
}


TEST( DiscoverySession, ReportsSingleVirtualPrinter )
{
  PrinterConfig config;
  SavedPrinter  a, b;
  a.id = "a";
  b.id = "b";
  config.SavePrinter( a );
  config.SavePrinter( b );

  CollectingListener listener;
  DiscoverySession   session( config, listener );
  session.StartDiscovery();
  EXPECT_TRUE( session.Discovering() );

  ASSERT_EQ( listener.reports.size(), 1u );
  ASSERT_EQ( listener.reports[0].size(), 1u );
  const PrinterInfo& info = listener.reports[0][0];
  EXPECT_EQ( info.id, DiscoverySession::virtual_printer_id );
  EXPECT_EQ( info.name, "Raw Thermal" );
  EXPECT_EQ( info.status, PrinterStatus::IDLE );

  session.StopDiscovery();
  EXPECT_FALSE( session.Discovering() );
}


TEST( DiscoverySession, Capabilities )
{
  const PrinterCapabilities caps = DiscoverySession::BuildCapabilities( 80 );
  ASSERT_EQ( caps.media.size(), 4u );

  const MediaSize* roll58 = find_media( caps, "THERMAL_58MM" );
  const MediaSize* roll80 = find_media( caps, "THERMAL_80MM" );
  ASSERT_NE( roll58, nullptr );
  ASSERT_NE( roll80, nullptr );
  EXPECT_EQ( roll58->width_mils, 2283u );
  EXPECT_EQ( roll80->width_mils, 3150u );
  EXPECT_FALSE( roll58->is_default );
  EXPECT_TRUE( roll80->is_default );
  EXPECT_NE( find_media( caps, "ISO_A4" ), nullptr );
  EXPECT_NE( find_media( caps, "NA_LETTER" ), nullptr );

  EXPECT_EQ( caps.resolution.horizontal_dpi, 203u );
  EXPECT_EQ( caps.resolution.vertical_dpi, 203u );
  ASSERT_EQ( caps.color_modes.size(), 1u );
  EXPECT_EQ( caps.color_modes[0], ColorMode::MONOCHROME );
  EXPECT_TRUE( find_media( DiscoverySession::BuildCapabilities( 58 ),
                           "THERMAL_58MM" )->is_default );
}


TEST( DiscoverySession, ValidationAndTracking )
{
  PrinterConfig      config;
  CollectingListener listener;
  DiscoverySession   session( config, listener );

  const std::vector<std::string> valid = session.ValidatePrinters(
    { "raw_thermal_virtual", "something_else" } );
  EXPECT_EQ( valid, std::vector<std::string>( { "raw_thermal_virtual" } ) );

  session.StartTracking( "raw_thermal_virtual" );
  EXPECT_EQ( session.Tracked().count( "raw_thermal_virtual" ), 1u );
  EXPECT_EQ( listener.reports.size(), 1u );

  session.StopTracking( "raw_thermal_virtual" );
  EXPECT_TRUE( session.Tracked().empty() );
}


TEST( DiscoverySession, DestroyedSessionRejectsCalls )
{
  PrinterConfig      config;
  CollectingListener listener;
  DiscoverySession   session( config, listener );
  session.StartDiscovery();
  session.Destroy();

  EXPECT_TRUE( session.Destroyed() );
  EXPECT_FALSE( session.Discovering() );
  EXPECT_THROW( session.StartDiscovery(), input_error );
  EXPECT_THROW( session.StartTracking( "raw_thermal_virtual" ), input_error );
  EXPECT_EQ( listener.reports.size(), 1u );
}
