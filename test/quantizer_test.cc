#include "errors.hpp"
#include "quantizer.hpp"

#include <gtest/gtest.h>

static PixelBuffer
filled( const unsigned w, const unsigned h, const uint8_t v )
{
  PixelBuffer img( w, h );
  for( unsigned y = 0; y < h; ++y ){
    for( unsigned x = 0; x < w; ++x ){
      img.SetPixel( x, y, v, v, v );
    }
  }
  return img;
}


TEST( Quantizer, AllBlackFillsEveryByte )
{
  const ThermalRaster r = Quantize( filled( 16, 8, 0 ) );
  EXPECT_EQ( r.width, 16u );
  EXPECT_EQ( r.height, 8u );
  EXPECT_EQ( r.WidthBytes(), 2u );
  ASSERT_EQ( r.data.size(), 16u );
  for( const auto b : r.data ){
    EXPECT_EQ( b, 0xFF );
  }
}


TEST( Quantizer, AllWhitePrintsNothing )
{
  const ThermalRaster r = Quantize( filled( 16, 4, 255 ) );
  for( const auto b : r.data ){
    EXPECT_EQ( b, 0x00 );
  }
}


TEST( Quantizer, RowsArePaddedToWholeBytes )
{
  const ThermalRaster r = Quantize( filled( 10, 3, 0 ) );
  EXPECT_EQ( r.WidthBytes(), 2u );
  ASSERT_EQ( r.data.size(), 6u );
  for( unsigned y = 0; y < 3; ++y ){
    EXPECT_EQ( r.data[y * 2],   0xFF );
    EXPECT_EQ( r.data[y * 2+1], 0xC0 );// 2 dots, padding clear
  }
}


TEST( Quantizer, MidGrayIsDithered )
{
  const ThermalRaster r = Quantize( filled( 32, 32, 127 ) );
  unsigned dots = 0;
  for( unsigned y = 0; y < r.height; ++y ){
    for( unsigned x = 0; x < r.width; ++x ){
      dots += r.Dot( x, y );
    }
  }
  // Roughly half of the dots are printed.
  EXPECT_GT( dots, 32u * 32u * 2 / 5 );
  EXPECT_LT( dots, 32u * 32u * 3 / 5 );
}


TEST( Quantizer, UsesLuminanceWeights )
{
  // Pure green is bright (0.587 * 255 > 128), pure blue is dark.
  PixelBuffer img( 2, 1 );
  img.SetPixel( 0, 0, 0, 255, 0 );
  img.SetPixel( 1, 0, 0, 0, 255 );
  const ThermalRaster r = Quantize( img );
  EXPECT_FALSE( r.Dot( 0, 0 ) );
  EXPECT_TRUE( r.Dot( 1, 0 ) );
}


TEST( Quantizer, IsDeterministic )
{
  PixelBuffer img( 24, 12 );
  for( unsigned y = 0; y < 12; ++y ){
    for( unsigned x = 0; x < 24; ++x ){
      img.SetPixel( x, y, x * 10, y * 20, ( x+y ) * 5 );
    }
  }
  EXPECT_EQ( Quantize( img ).data, Quantize( img ).data );
}


TEST( Quantizer, RejectsInvalidDimensions )
{
  EXPECT_THROW( Quantize( PixelBuffer() ), input_error );

  PixelBuffer bad( 4, 4 );
  bad.rgba.resize( 10 );
  EXPECT_THROW( Quantize( bad ), input_error );
}
