#include "errors.hpp"
#include "link.hpp"
#include "mocklink.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>

static CommandBuffer
sequence( const std::size_t n )
{
  CommandBuffer ans( n );
  for( std::size_t i = 0; i < n; ++i ){
    ans[i] = uint8_t( i % 251 );
  }
  return ans;
}


TEST( PrinterLink, PayloadForMtu )
{
  EXPECT_EQ( PrinterLink::PayloadForMtu( 0 ), 20u );
  EXPECT_EQ( PrinterLink::PayloadForMtu( 10 ), 20u );
  EXPECT_EQ( PrinterLink::PayloadForMtu( 23 ), 20u );
  EXPECT_EQ( PrinterLink::PayloadForMtu( 185 ), 182u );
  EXPECT_EQ( PrinterLink::PayloadForMtu( 515 ), 512u );
}


TEST( PrinterLink, ConnectNegotiatesChunkSize )
{
  MockLink    dev;
  PrinterLink link( dev );
  EXPECT_EQ( link.State(), LinkState::DISCONNECTED );

  link.Connect( "/dev/rfcomm0", 80 );
  EXPECT_TRUE( link.IsConnected() );
  EXPECT_EQ( dev.last_requested, 515u );

  const PrinterEndpoint ep = link.Endpoint();
  EXPECT_EQ( ep.address, "/dev/rfcomm0" );
  EXPECT_EQ( ep.paper_width, 80u );
  EXPECT_EQ( ep.mtu, 185u );
  EXPECT_EQ( ep.max_payload, 182u );
  EXPECT_EQ( ep.service_uuid, PrinterLink::printer_service_uuid );
}


TEST( PrinterLink, NoNegotiationFallsBackToMinimum )
{
  MockLink dev;
  dev.mtu = 0;
  PrinterLink link( dev );
  link.SetChunkDelay( 0 );
  link.Connect( "addr" );
  EXPECT_EQ( link.Endpoint().max_payload, 20u );

  link.Write( sequence( 45 ) );
  const auto chunks = dev.Chunks();
  ASSERT_EQ( chunks.size(), 3u );
  EXPECT_EQ( chunks[0].size(), 20u );
  EXPECT_EQ( chunks[1].size(), 20u );
  EXPECT_EQ( chunks[2].size(), 5u );
}


TEST( PrinterLink, ChunksPreserveOrder )
{
  MockLink    dev;
  PrinterLink link( dev );
  link.SetChunkDelay( 0 );
  link.Connect( "addr" );

  const CommandBuffer data = sequence( 1000 );
  link.Write( data );
  EXPECT_EQ( dev.Chunks().size(), 6u );// ceil(1000/182)
  EXPECT_EQ( dev.Received(), data );
}


TEST( PrinterLink, RequestedPayloadIsClamped )
{
  MockLink    dev;
  PrinterLink link( dev );
  link.SetRequestedPayload( 5 );
  link.Connect( "addr" );
  EXPECT_EQ( dev.last_requested, 23u );
  EXPECT_EQ( link.Endpoint().max_payload, 20u );

  link.SetRequestedPayload( 100000 );
  link.Connect( "addr" );
  EXPECT_EQ( dev.last_requested, 515u );
}


TEST( PrinterLink, PacingOnlyBetweenChunks )
{
  MockLink dev;
  dev.mtu = 23;
  PrinterLink link( dev );
  link.SetChunkDelay( 20 );
  link.Connect( "addr" );

  const auto start = std::chrono::steady_clock::now();
  link.Write( sequence( 20 ) );
  const auto single = std::chrono::steady_clock::now()-start;
  EXPECT_LT( std::chrono::duration_cast<std::chrono::milliseconds>( single ).count(), 20 );

  const auto start2 = std::chrono::steady_clock::now();
  link.Write( sequence( 60 ) );
  const auto triple = std::chrono::steady_clock::now()-start2;
  EXPECT_GE( std::chrono::duration_cast<std::chrono::milliseconds>( triple ).count(), 40 );
}


TEST( PrinterLink, ReconnectTearsDownFirst )
{
  MockLink    dev;
  PrinterLink link( dev );
  link.Connect( "first" );
  link.Connect( "second" );

  EXPECT_EQ( dev.close_count, 1 );
  EXPECT_EQ( dev.open_count, 2 );
  EXPECT_EQ( link.Endpoint().address, "second" );
  EXPECT_TRUE( link.IsConnected() );
}


TEST( PrinterLink, ReconnectAfterLinkLossClosesDevice )
{
  MockLink    dev;
  PrinterLink link( dev );
  link.Connect( "first" );
  dev.FireLinkLoss();
  ASSERT_EQ( link.State(), LinkState::DISCONNECTED );
  EXPECT_EQ( dev.close_count, 0 );

  link.Connect( "second" );
  EXPECT_EQ( dev.close_count, 1 );
  EXPECT_EQ( dev.open_count, 2 );
  EXPECT_EQ( link.Endpoint().address, "second" );
}


TEST( PrinterLink, DisabledLinkRefusesConnection )
{
  MockLink dev;
  dev.enabled = false;
  PrinterLink link( dev );
  EXPECT_THROW( link.Connect( "addr" ), connection_error );
  EXPECT_EQ( link.State(), LinkState::DISCONNECTED );
  EXPECT_EQ( dev.open_count, 0 );
}


TEST( PrinterLink, UnreachableEndpoint )
{
  MockLink dev;
  dev.fail_open = true;
  PrinterLink link( dev );
  EXPECT_THROW( link.Connect( "addr" ), connection_error );
  EXPECT_EQ( link.State(), LinkState::DISCONNECTED );
}


TEST( PrinterLink, NoWritableInterface )
{
  MockLink dev;
  dev.services[0].characteristics[0].writable = false;
  PrinterLink link( dev );
  EXPECT_THROW( link.Connect( "addr" ), connection_error );
  EXPECT_FALSE( link.IsConnected() );
  EXPECT_FALSE( dev.is_open );
}


TEST( PrinterLink, InterfacePriority )
{
  ServiceInfo other;
  other.uuid            = "0000180a-0000-1000-8000-00805f9b34fb";
  other.characteristics = { CharacteristicInfo( "other-char", true ) };

  ServiceInfo vendor;
  vendor.uuid            = PrinterLink::vendor_service_uuid;
  vendor.characteristics = { CharacteristicInfo( "vendor-read", false ),
                             CharacteristicInfo( "vendor-write", true ) };

  ServiceInfo printer;
  printer.uuid            = "000018F0-0000-1000-8000-00805F9B34FB";
  printer.characteristics = { CharacteristicInfo( "printer-write", true ) };

  std::string service, characteristic;

  PrinterLink::SelectInterface( { other, vendor, printer }, "", "", service, characteristic );
  EXPECT_EQ( characteristic, "printer-write" );

  PrinterLink::SelectInterface( { other, vendor }, "", "", service, characteristic );
  EXPECT_EQ( service, PrinterLink::vendor_service_uuid );
  EXPECT_EQ( characteristic, "vendor-write" );

  PrinterLink::SelectInterface( { other }, "", "", service, characteristic );
  EXPECT_EQ( characteristic, "other-char" );

  // A saved interface is honored when it is writable.
  PrinterLink::SelectInterface( { other, vendor, printer },
                                other.uuid, "other-char", service, characteristic );
  EXPECT_EQ( characteristic, "other-char" );
  PrinterLink::SelectInterface( { other, vendor, printer },
                                vendor.uuid, "vendor-read", service, characteristic );
  EXPECT_EQ( characteristic, "printer-write" );

  EXPECT_THROW( PrinterLink::SelectInterface( {}, "", "", service, characteristic ),
                connection_error );
}


TEST( PrinterLink, WriteWithoutConnection )
{
  MockLink    dev;
  PrinterLink link( dev );
  EXPECT_THROW( link.Write( sequence( 10 ) ), transport_error );
}


TEST( PrinterLink, FailedChunkAbortsAndDisconnects )
{
  MockLink dev;
  dev.fail_write = 2;
  PrinterLink link( dev );
  link.SetChunkDelay( 0 );
  link.Connect( "addr" );

  EXPECT_THROW( link.Write( sequence( 1000 ) ), transport_error );
  EXPECT_EQ( dev.Chunks().size(), 2u );
  EXPECT_FALSE( link.IsConnected() );
  EXPECT_FALSE( dev.is_open );
}


TEST( PrinterLink, LinkLossDuringWrite )
{
  MockLink dev;
  dev.lose_link_at = 1;
  PrinterLink link( dev );
  link.SetChunkDelay( 0 );
  link.Connect( "addr" );

  EXPECT_THROW( link.Write( sequence( 1000 ) ), link_lost_error );
  EXPECT_EQ( dev.Chunks().size(), 1u );
  EXPECT_FALSE( link.IsConnected() );
  EXPECT_TRUE( link.LinkLost() );
}


TEST( PrinterLink, AsynchronousLinkLoss )
{
  MockLink    dev;
  PrinterLink link( dev );
  link.Connect( "addr" );

  std::atomic<int> notified( 0 );
  link.SetLinkLossListener( [&notified](){ ++notified; } );

  dev.FireLinkLoss();
  EXPECT_EQ( link.State(), LinkState::DISCONNECTED );
  EXPECT_TRUE( link.LinkLost() );
  EXPECT_EQ( notified.load(), 1 );

  // A second report on a disconnected link is ignored.
  dev.FireLinkLoss();
  EXPECT_EQ( notified.load(), 1 );

  EXPECT_THROW( link.Write( sequence( 10 ) ), link_lost_error );

  // Reconnecting clears the loss.
  link.Connect( "addr" );
  EXPECT_FALSE( link.LinkLost() );
  link.Write( sequence( 10 ) );
}


TEST( PrinterLink, CancelStopsBeforeNextChunk )
{
  MockLink    dev;
  PrinterLink link( dev );
  link.SetChunkDelay( 0 );
  link.Connect( "addr" );

  std::atomic<bool> cancel( true );
  EXPECT_THROW( link.Write( sequence( 1000 ), &cancel ), job_canceled );
  EXPECT_TRUE( dev.Chunks().empty() );
  EXPECT_TRUE( link.IsConnected() );
}


TEST( PrinterLink, ProbablePrinterFilter )
{
  ScanResult r;
  r.name = "MPT-II";
  EXPECT_TRUE( PrinterLink::IsProbablyPrinter( r ) );

  r.name = "Headphones";
  EXPECT_FALSE( PrinterLink::IsProbablyPrinter( r ) );

  r.service_uuids = { "000018F0-0000-1000-8000-00805F9B34FB" };
  EXPECT_TRUE( PrinterLink::IsProbablyPrinter( r ) );

  r.service_uuids = { "00001101-0000-1000-8000-00805f9b34fb" };
  EXPECT_TRUE( PrinterLink::IsProbablyPrinter( r ) );
}


TEST( PrinterLink, ScanReportsPrinters )
{
  MockLink dev;
  ScanResult a, b;
  a.address = "/dev/rfcomm0";
  a.name    = "Thermal Printer";
  b.address = "/dev/ttyUSB3";
  b.name    = "GPS receiver";
  dev.scan_results = { a, b };

  PrinterLink link( dev );
  const auto  found = link.ScanFor( 1 );
  ASSERT_EQ( found.size(), 1u );
  EXPECT_EQ( found[0].address, "/dev/rfcomm0" );

  std::mutex              m;
  std::condition_variable cv;
  bool                    done = false;
  std::vector<std::string> async_found;
  link.Scan( 1, [&]( const ScanResult& r ){
    std::lock_guard<std::mutex> lock( m );
    async_found.push_back( r.address );
  }, [&]( const std::string& error ){
    std::lock_guard<std::mutex> lock( m );
    EXPECT_EQ( error, "" );
    done = true;
    cv.notify_all();
  } );

  std::unique_lock<std::mutex> lock( m );
  ASSERT_TRUE( cv.wait_for( lock, std::chrono::seconds( 5 ), [&done](){ return done; } ) );
  EXPECT_EQ( async_found, std::vector<std::string>( { "/dev/rfcomm0" } ) );
  lock.unlock();
  link.StopScan();
  EXPECT_FALSE( link.Scanning() );
}
