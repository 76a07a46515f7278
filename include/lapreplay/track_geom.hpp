#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <deque>
#include <numbers>
#include <vector>

namespace lapreplay {

inline constexpr double kPI = std::numbers::pi_v<double>;
inline constexpr double kDegToRad = kPI / 180.0;

struct Vec2 {
  double x{};
  double y{};
};

// Fits a lap's GPS polyline into a pixel box (y down), keeping aspect ratio.
// Longitude is scaled by cos(mid latitude) so the track is not stretched.
class TrackProjection {
public:
  TrackProjection() = default;

  void fit(const std::vector<double>& lat, const std::vector<double>& lon,
           double width_px, double height_px, double padding_px = 20.0) {
    const std::size_t n = std::min(lat.size(), lon.size());
    valid_ = false;
    if (n == 0) return;

    const auto [lat_lo, lat_hi] = std::minmax_element(lat.begin(), lat.begin() + n);
    const auto [lon_lo, lon_hi] = std::minmax_element(lon.begin(), lon.begin() + n);
    min_lat_ = *lat_lo;
    min_lon_ = *lon_lo;
    double lat_range = *lat_hi - *lat_lo;
    double lon_range = *lon_hi - *lon_lo;
    if (lat_range <= 0.0) lat_range = 1e-6;
    if (lon_range <= 0.0) lon_range = 1e-6;

    const double mid_lat = 0.5 * (*lat_lo + *lat_hi);
    lon_scale_ = std::cos(mid_lat * kDegToRad);

    const double data_w = lon_range * lon_scale_;
    const double data_h = lat_range;
    const double avail_w = std::max(1.0, width_px  - 2.0 * padding_px);
    const double avail_h = std::max(1.0, height_px - 2.0 * padding_px);
    scale_ = std::min(avail_w / data_w, avail_h / data_h);

    scaled_h_ = data_h * scale_;
    offset_x_ = padding_px + (avail_w - data_w * scale_) * 0.5;
    offset_y_ = padding_px + (avail_h - scaled_h_) * 0.5;
    valid_ = true;
  }

  bool valid() const { return valid_; }

  Vec2 project(double lat, double lon) const {
    if (!valid_) return {};
    return Vec2{
      offset_x_ + (lon - min_lon_) * lon_scale_ * scale_,
      offset_y_ + scaled_h_ - (lat - min_lat_) * scale_
    };
  }

private:
  bool valid_{false};
  double min_lat_{0.0};
  double min_lon_{0.0};
  double lon_scale_{1.0};
  double scale_{1.0};
  double scaled_h_{0.0};
  double offset_x_{0.0};
  double offset_y_{0.0};
};

// Recent (lateral, longitudinal) g positions, oldest first.
class GTrail {
public:
  static constexpr std::size_t kDefaultLength = 30;

  explicit GTrail(std::size_t cap = kDefaultLength) : cap_(cap > 0 ? cap : 1) {}

  void push(double lateral_g, double longitudinal_g) {
    pts_.push_back(Vec2{lateral_g, longitudinal_g});
    while (pts_.size() > cap_) pts_.pop_front();
  }
  void clear() { pts_.clear(); }

  const std::deque<Vec2>& points() const { return pts_; }
  std::size_t size() const { return pts_.size(); }
  std::size_t capacity() const { return cap_; }

private:
  std::size_t cap_;
  std::deque<Vec2> pts_;
};

} // namespace lapreplay
