/*
 * Canvas.hpp
 *
 * Drawing surface the compositor renders onto: a base layer plus placed,
 * blended bitmaps.
 */
#ifndef CANVAS_HPP
#define CANVAS_HPP

#include <opencv2/core.hpp>

#include "state/OverlayState.hpp"

//! Canvas
/*! Drawing surface the compositor paints on. Implementations may be backed
    by main memory or by a GPU target; the compositor only needs these
    operations. */
class Canvas {
   public:
    virtual ~Canvas() {}

    //! setBase
    /*! Resizes the canvas to the bitmap and copies it in at the origin. */
    virtual void setBase(const cv::Mat& bgra) = 0;

    //! drawBitmap
    /*! Draws `bgra` mapped through `transform` (source pixels to canvas
        pixels), combined with `mode` and weighted by `alpha`. */
    virtual void drawBitmap(const cv::Mat& bgra, const cv::Matx23d& transform,
                            BlendMode mode, float alpha) = 0;

    virtual cv::Size size() const = 0;

    //! pixels
    /*! Current contents as 8-bit BGRA. */
    virtual cv::Mat pixels() const = 0;
};

//! Canvas backed by a cv::Mat, composited on the CPU.
class CpuCanvas : public Canvas {
   public:
    void setBase(const cv::Mat& bgra) override;
    void drawBitmap(const cv::Mat& bgra, const cv::Matx23d& transform,
                    BlendMode mode, float alpha) override;
    cv::Size size() const override { return buffer_.size(); }
    cv::Mat pixels() const override { return buffer_; }

   private:
    cv::Mat buffer_;
    cv::Mat layer_;  // scratch for the warped bitmap
};

#endif
