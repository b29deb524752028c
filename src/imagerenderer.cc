/**
 * @file imagerenderer.cc
 * @brief Rasterization of image documents with OpenCV.
 *
 * @class ImageRenderer
 * @ingroup render
 * @brief Page source for PNG, JPEG, BMP, WebP and multi-page TIFF documents.
 *
 * @details All frames of the document are decoded when the renderer is
 * opened, each frame being one page. Rendering a page goes through the
 * following steps:
 *
 * - Normalize the frame to 8 bit BGRA regardless of the stored depth and
 *   channel count.
 * - Composite the frame onto a white background using its alpha channel, as
 *   the paper is white and transparent regions must not print.
 * - Scale the frame to the requested width in dots, the height following from
 *   the aspect ratio of the frame. Area interpolation is used when shrinking to
 *   preserve thin strokes, linear interpolation when enlarging.
 */
#include "imagerenderer.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <fmt/format.h>
#include <opencv2/core/utils/logger.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>

// Silencing the OpenCV internal logging, decoding failures are reported by
// the renderer itself.
static const auto __dummy_settings = cv::utils::logging::setLogLevel(
  cv::utils::logging::LOG_LEVEL_SILENT );

static const std::string devname = "ImageRenderer";

ImageRenderer::ImageRenderer( const std::string& p ) :
  path( p )
{
  if( !cv::imreadmulti( path, pages, cv::IMREAD_UNCHANGED ) || pages.empty() ){
    pages.clear();
    const cv::Mat single = cv::imread( path, cv::IMREAD_UNCHANGED );
    if( single.empty() ){
      throw render_error( fmt::format( "Cannot decode image document [{}]", path ) );
    }
    pages.push_back( single );
  }
  printdebug( devname, fmt::format( "Opened [{}] with {} pages", path, pages.size() ) );
}


std::unique_ptr<PageRenderer>
ImageRenderer::Open( const std::string& path )
{
  return std::unique_ptr<PageRenderer>( new ImageRenderer( path ) );
}


unsigned
ImageRenderer::PageCount() const
{
  return pages.size();
}


PixelBuffer
ImageRenderer::RenderPage( const unsigned index, const unsigned width )
{
  if( index >= pages.size() ){
    throw render_error( fmt::format( "Page {} out of range for [{}] with {} pages",
                                     index, path, pages.size() ) );
  }
  return FromMat( pages[index], width );
}


PixelBuffer
ImageRenderer::FromMat( const cv::Mat& frame, const unsigned width )
{
  if( frame.empty() || width == 0 ){
    throw render_error( fmt::format( "Cannot render a [{}x{}] frame to width {}",
                                     frame.cols, frame.rows, width ) );
  }

  // Normalizing to 8 bit depth.
  cv::Mat img8;
  if( frame.depth() == CV_16U ){
    frame.convertTo( img8, CV_8U, 1.0 / 257.0 );
  } else if( frame.depth() == CV_32F || frame.depth() == CV_64F ){
    frame.convertTo( img8, CV_8U, 255.0 );
  } else {
    img8 = frame;
  }

  cv::Mat bgra;
  switch( img8.channels() ){
  case 1: cv::cvtColor( img8, bgra, cv::COLOR_GRAY2BGRA ); break;
  case 3: cv::cvtColor( img8, bgra, cv::COLOR_BGR2BGRA );  break;
  case 4: bgra = img8;                                     break;
  default:
    throw render_error( fmt::format( "Unsupported channel count {}", img8.channels() ) );
  }

  // Compositing onto white.
  cv::Mat bgr( bgra.rows, bgra.cols, CV_8UC3 );
  for( int y = 0; y < bgra.rows; ++y ){
    const cv::Vec4b* src = bgra.ptr<cv::Vec4b>( y );
    cv::Vec3b*       dst = bgr.ptr<cv::Vec3b>( y );
    for( int x = 0; x < bgra.cols; ++x ){
      const int a = src[x][3];
      for( int c = 0; c < 3; ++c ){
        dst[x][c] = ( src[x][c] * a+255 * ( 255-a ) +127 ) / 255;
      }
    }
  }

  const unsigned height = std::max( 1, cvRound( double( bgr.rows ) * width / bgr.cols ) );
  cv::Mat        scaled;
  cv::resize( bgr, scaled, cv::Size( width, height ), 0, 0,
              int( width ) < bgr.cols ? cv::INTER_AREA : cv::INTER_LINEAR );

  PixelBuffer ans( width, height );
  for( unsigned y = 0; y < height; ++y ){
    const cv::Vec3b* row = scaled.ptr<cv::Vec3b>( y );
    for( unsigned x = 0; x < width; ++x ){
      ans.SetPixel( x, y, row[x][2], row[x][1], row[x][0] );
    }
  }
  return ans;
}
