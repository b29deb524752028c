#include "errors.hpp"
#include "imagerenderer.hpp"
#include "quantizer.hpp"
#include "tempdir.hpp"

#include <gtest/gtest.h>

#include <opencv2/imgcodecs.hpp>

static uint8_t
red_at( const PixelBuffer& img, const unsigned x, const unsigned y )
{
  return img.rgba[( std::size_t( y ) * img.width+x ) * 4];
}


TEST( ImageRenderer, ScalesToWidthKeepingAspect )
{
  const cv::Mat     frame( 100, 200, CV_8UC3, cv::Scalar( 0, 0, 0 ) );
  const PixelBuffer img = ImageRenderer::FromMat( frame, 384 );
  EXPECT_EQ( img.width, 384u );
  EXPECT_EQ( img.height, 192u );
  EXPECT_EQ( red_at( img, 0, 0 ), 0 );

  const PixelBuffer small = ImageRenderer::FromMat( frame, 50 );
  EXPECT_EQ( small.width, 50u );
  EXPECT_EQ( small.height, 25u );
}


TEST( ImageRenderer, TransparencyBecomesWhite )
{
  cv::Mat frame( 10, 10, CV_8UC4, cv::Scalar( 0, 0, 0, 0 ) );
  frame.at<cv::Vec4b>( 0, 0 ) = cv::Vec4b( 0, 0, 0, 255 );

  const PixelBuffer img = ImageRenderer::FromMat( frame, 10 );
  EXPECT_EQ( red_at( img, 0, 0 ), 0 );
  EXPECT_EQ( red_at( img, 5, 5 ), 255 );

  const ThermalRaster r = Quantize( img );
  EXPECT_TRUE( r.Dot( 0, 0 ) );
  EXPECT_FALSE( r.Dot( 5, 5 ) );
}


TEST( ImageRenderer, NormalizesDepthAndChannels )
{
  const cv::Mat gray16( 4, 4, CV_16UC1, cv::Scalar( 65535 ) );
  const PixelBuffer a = ImageRenderer::FromMat( gray16, 4 );
  EXPECT_EQ( red_at( a, 1, 1 ), 255 );

  const cv::Mat gray32( 4, 4, CV_32FC1, cv::Scalar( 0.0 ) );
  const PixelBuffer b = ImageRenderer::FromMat( gray32, 4 );
  EXPECT_EQ( red_at( b, 1, 1 ), 0 );

  // Channel order is converted from BGR to RGB.
  const cv::Mat blue( 2, 2, CV_8UC3, cv::Scalar( 255, 0, 0 ) );
  const PixelBuffer c = ImageRenderer::FromMat( blue, 2 );
  EXPECT_EQ( c.rgba[0], 0 );
  EXPECT_EQ( c.rgba[2], 255 );
}


TEST( ImageRenderer, RejectsEmptyFrames )
{
  EXPECT_THROW( ImageRenderer::FromMat( cv::Mat(), 384 ), render_error );
  EXPECT_THROW( ImageRenderer::FromMat( cv::Mat( 2, 2, CV_8UC1 ), 0 ), render_error );
}


TEST( ImageRenderer, OpensImageFile )
{
  TempDir           dir;
  const std::string path = dir.File( "page.png" );
  ASSERT_TRUE( cv::imwrite( path, cv::Mat( 40, 80, CV_8UC3, cv::Scalar( 255, 255, 255 ) ) ) );

  std::unique_ptr<PageRenderer> r = ImageRenderer::Open( path );
  ASSERT_EQ( r->PageCount(), 1u );
  const PixelBuffer page = r->RenderPage( 0, 384 );
  EXPECT_EQ( page.width, 384u );
  EXPECT_EQ( page.height, 192u );
  EXPECT_THROW( r->RenderPage( 1, 384 ), render_error );
}


TEST( ImageRenderer, UndecodableFile )
{
  TempDir dir;
  EXPECT_THROW( ImageRenderer::Open( dir.Write( "bad.png", "garbage" ) ), render_error );
  EXPECT_THROW( ImageRenderer::Open( dir.File( "missing.png" ) ), render_error );
}
