#ifndef RENDERER_HPP
#define RENDERER_HPP

#include "quantizer.hpp"

#include <functional>
#include <memory>
#include <string>

/**
 * @brief Source of page images for document jobs.
 *
 * RenderPage returns a page scaled to the requested width with its aspect
 * ratio preserved and transparency composited onto white. Failures are
 * reported as render_error.
 */
class PageRenderer
{
public:
  virtual ~PageRenderer(){}

  virtual unsigned    PageCount() const                                    = 0;
  virtual PixelBuffer RenderPage( const unsigned index, const unsigned width ) = 0;
};

typedef std::function<std::unique_ptr<PageRenderer>( const std::string& )>
  RendererFactory;

#endif
