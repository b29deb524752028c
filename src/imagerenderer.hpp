#ifndef IMAGERENDERER_HPP
#define IMAGERENDERER_HPP

#include "renderer.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

/**
 * @brief PageRenderer for image documents, one page per image frame.
 */
class ImageRenderer : public PageRenderer
{
public:
  explicit ImageRenderer( const std::string& path );

  unsigned    PageCount() const override;
  PixelBuffer RenderPage( const unsigned index, const unsigned width ) override;

  static std::unique_ptr<PageRenderer> Open( const std::string& path );
  static PixelBuffer                   FromMat( const cv::Mat&, const unsigned width );

private:
  std::string          path;
  std::vector<cv::Mat> pages;
};

#endif
