#ifndef QUANTIZER_HPP
#define QUANTIZER_HPP

#include <cstdint>
#include <vector>

/**
 * @brief Row-major RGBA image as produced by the page rasterizers.
 */
struct PixelBuffer
{
  PixelBuffer() : width( 0 ), height( 0 ){}
  PixelBuffer( const unsigned w, const unsigned h ) :
    width ( w ),
    height( h ),
    rgba  ( std::size_t( w ) * h * 4, 0xFF ){}

  unsigned             width;
  unsigned             height;
  std::vector<uint8_t> rgba;

  void SetPixel( const unsigned x,
                 const unsigned y,
                 const uint8_t  r,
                 const uint8_t  g,
                 const uint8_t  b,
                 const uint8_t  a = 0xFF );
};

/**
 * @brief Packed 1-bit raster in the format expected by thermal print heads.
 *
 * 8 pixels per byte, most significant bit first, a set bit is a printed dot.
 * Each row is padded to a whole number of bytes.
 */
struct ThermalRaster
{
  unsigned             width;
  unsigned             height;
  std::vector<uint8_t> data;

  unsigned WidthBytes() const { return ( width+7 ) / 8; }
  bool     Dot( const unsigned x, const unsigned y ) const;
};

extern ThermalRaster Quantize( const PixelBuffer& img );

#endif
