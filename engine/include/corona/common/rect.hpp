/*!
  \file rect.hpp
  This module provides double precision Point and Rect objects along with the
  edge accessors that sprites are positioned by
 */

#pragma once

#include <algorithm>
#include <cmath>

namespace corona
{
//! A double precision point
struct Point
{
  double x, y;

  bool operator==(const Point& other) const
  {
    return std::fabs(other.x - x) < 1e-5 && std::fabs(other.y - y) < 1e-5;
  }

  Point operator+(const Point& other) const
  {
    return {x + other.x, y + other.y};
  }

  Point operator-(const Point& other) const
  {
    return {x - other.x, y - other.y};
  }

  Point operator*(double s) const
  {
    return {x * s, y * s};
  }

  Point& operator+=(const Point& other)
  {
    x += other.x;
    y += other.y;
    return *this;
  }
};

/*!
  A double precision rectangle. x and y are the top-left corner, y grows
  downwards like the screen does.
*/
struct Rect
{
  Rect() = default;
  Rect(double x_, double y_, double w_, double h_)
    : x(x_), y(y_), w(w_), h(h_)
  {
  }

  double x = 0, y = 0, w = 0, h = 0;

  bool operator==(const Rect& other) const
  {
    return std::fabs(other.x - x) < 1e-5 &&
        std::fabs(other.y - y) < 1e-5 &&
        std::fabs(other.w - w) < 1e-5 &&
        std::fabs(other.h - h) < 1e-5;
  }

  double left() const { return x; }
  double right() const { return x + w; }
  double top() const { return y; }
  double bottom() const { return y + h; }
  double centerx() const { return x + w / 2.0; }
  double centery() const { return y + h / 2.0; }
  Point midbottom() const { return {centerx(), bottom()}; }

  void set_left(double v) { x = v; }
  void set_right(double v) { x = v - w; }
  void set_top(double v) { y = v; }
  void set_bottom(double v) { y = v - h; }
  void set_centerx(double v) { x = v - w / 2.0; }

  void set_midbottom(const Point& p)
  {
    set_centerx(p.x);
    set_bottom(p.y);
  }

  void move(double dx, double dy)
  {
    x += dx;
    y += dy;
  }

  /*!
    Returns true if the two rectangles share any area. Rectangles that only
    touch along an edge do not intersect.
  */
  bool intersects(const Rect& other) const;
};

//! A rectangle without area never overlaps anything
inline bool rect_empty(const Rect& r, double eps = 1e-5)
{
  return r.w <= eps || r.h <= eps;
}

inline bool Rect::intersects(const Rect& other) const
{
  if (rect_empty(*this) || rect_empty(other)) {
    return false;
  }

  return std::max(left(), other.left()) < std::min(right(), other.right()) &&
      std::max(top(), other.top()) < std::min(bottom(), other.bottom());
}
} // namespace corona
