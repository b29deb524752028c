/**
 * @file quantizer.cc
 * @brief Conversion of RGBA images into 1-bit thermal rasters.
 *
 * Thermal print heads can only print or not print a dot, so every image has
 * to be reduced to a 1-bit raster before being sent. To preserve the average
 * tone of photographs and anti-aliased text, the reduction uses
 * Floyd-Steinberg error diffusion:
 *
 * - Each pixel is converted to luminance using the fixed weights
 *   0.299R + 0.587G + 0.114B (the alpha channel is ignored, transparency is
 *   expected to be composited onto white by the rasterizer).
 * - Pixels are visited left-to-right, top-to-bottom. A pixel is thresholded at
 *   128 and the quantization error is pushed to the unvisited neighbors:
 *
 * ```
 *          [   *    7/16 ]
 *   [ 3/16   5/16   1/16 ]
 * ```
 *
 *   Error that would fall outside of the image is discarded.
 * - Pixels with a final luminance below 128 are printed (bit set).
 *
 * The function is pure, the same input always yields the same raster.
 */
#include "quantizer.hpp"

#include "errors.hpp"
#include "logger.hpp"

#include <boost/format.hpp>

void
PixelBuffer::SetPixel( const unsigned x,
                       const unsigned y,
                       const uint8_t  r,
                       const uint8_t  g,
                       const uint8_t  b,
                       const uint8_t  a )
{
  const std::size_t idx = ( std::size_t( y ) * width+x ) * 4;
  rgba.at( idx )   = r;
  rgba.at( idx+1 ) = g;
  rgba.at( idx+2 ) = b;
  rgba.at( idx+3 ) = a;
}


bool
ThermalRaster::Dot( const unsigned x, const unsigned y ) const
{
  const uint8_t byte = data.at( std::size_t( y ) * WidthBytes()+x / 8 );
  return byte & ( 0x80 >> ( x % 8 ) );
}


ThermalRaster
Quantize( const PixelBuffer& img )
{
  static const float threshold = 128.0f;

  if( img.width == 0 || img.height == 0 ){
    throw input_error( ( boost::format(
      "Invalid pixel buffer dimensions [%ux%u]" )
                         % img.width % img.height ).str() );
  }
  if( img.rgba.size() != std::size_t( img.width ) * img.height * 4 ){
    throw input_error( ( boost::format(
      "Pixel buffer of [%ux%u] holds %u bytes, expected %u" )
                         % img.width % img.height % img.rgba.size()
                         % ( std::size_t( img.width ) * img.height * 4 ) ).str() );
  }

  const unsigned w = img.width;
  const unsigned h = img.height;

  // Luminance plane used as the error accumulation buffer.
  std::vector<float> gray( std::size_t( w ) * h );
  for( std::size_t i = 0; i < gray.size(); ++i ){
    const uint8_t* p = &img.rgba[i * 4];
    gray[i] = 0.299f * p[0]+0.587f * p[1]+0.114f * p[2];
  }

  for( unsigned y = 0; y < h; ++y ){
    for( unsigned x = 0; x < w; ++x ){
      const std::size_t idx    = std::size_t( y ) * w+x;
      const float       oldpix = gray[idx];
      const float       newpix = oldpix < threshold ? 0.0f : 255.0f;
      const float       err    = oldpix-newpix;
      gray[idx] = newpix;

      if( x+1 < w ){
        gray[idx+1] += err * 7.0f / 16.0f;
      }
      if( y+1 < h ){
        const std::size_t below = idx+w;
        if( x > 0 ){
          gray[below-1] += err * 3.0f / 16.0f;
        }
        gray[below] += err * 5.0f / 16.0f;
        if( x+1 < w ){
          gray[below+1] += err * 1.0f / 16.0f;
        }
      }
    }
  }

  ThermalRaster ans;
  ans.width  = w;
  ans.height = h;
  ans.data.assign( std::size_t( ans.WidthBytes() ) * h, 0 );

  for( unsigned y = 0; y < h; ++y ){
    for( unsigned x = 0; x < w; ++x ){
      if( gray[std::size_t( y ) * w+x] < threshold ){
        ans.data[std::size_t( y ) * ans.WidthBytes()+x / 8] |= 0x80 >> ( x % 8 );
      }
    }
  }

  printdebug( "Quantizer",
              ( boost::format( "Quantized [%ux%u] image into %u raster bytes" )
                % w % h % ans.data.size() ).str() );
  return ans;
}
