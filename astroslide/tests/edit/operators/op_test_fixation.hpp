#pragma once

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <opencv2/core.hpp>
#include <opencv2/core/utils/logger.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

#include "edit/operators/operator_registeration.hpp"
#include "image/pixel_buffer.hpp"
#include "utils/log/logger.hpp"

namespace astroslide {
class OperationTests : public ::testing::Test {
 protected:
  // Run before any unit test runs
  void SetUp() override {
    cv::utils::logging::setLogLevel(cv::utils::logging::LOG_LEVEL_SILENT);
    log::SetLevel("warn");
    RegisterAllOperators();
  }

  static auto Uniform(int rows, int cols, cv::Scalar value, int channels = 3) -> PixelBuffer {
    cv::Mat data(rows, cols, CV_32FC(channels), value);
    return PixelBuffer::FromFloatMat(std::move(data),
                                     channels == 1 ? ColorSpace::GRAY : ColorSpace::RGB);
  }

  // Horizontal ramp from lo to hi, with a tint per channel so that colors differ
  static auto Gradient(int rows, int cols, float lo = 0.05f, float hi = 0.95f) -> PixelBuffer {
    cv::Mat data(rows, cols, CV_32FC3);
    for (int r = 0; r < rows; ++r) {
      auto* row = data.ptr<cv::Vec3f>(r);
      for (int c = 0; c < cols; ++c) {
        const float t = lo + (hi - lo) * static_cast<float>(c) / static_cast<float>(cols - 1);
        const float v = static_cast<float>(r) / static_cast<float>(rows);
        row[c]        = {t, 0.5f * t + 0.4f * v, 0.3f + 0.5f * v};
      }
    }
    return PixelBuffer::FromFloatMat(std::move(data), ColorSpace::RGB);
  }

  static auto Noisy(int rows, int cols, float mean, float sigma, uint64_t seed = 7)
      -> PixelBuffer {
    cv::Mat data(rows, cols, CV_32FC3);
    cv::RNG rng(seed);
    rng.fill(data, cv::RNG::NORMAL, cv::Scalar::all(mean), cv::Scalar::all(sigma));
    auto buffer = PixelBuffer::FromFloatMat(std::move(data), ColorSpace::RGB);
    buffer.Clamp();
    return buffer;
  }

  /**
   * @brief Uniform background with filled disks of the given radius and value at each center
   *
   */
  static auto StarField(int rows, int cols, float background,
                        const std::vector<cv::Point>& centers, int radius, float peak = 1.0f)
      -> PixelBuffer {
    cv::Mat data(rows, cols, CV_32FC3, cv::Scalar::all(background));
    for (const auto& center : centers) {
      cv::circle(data, center, radius, cv::Scalar::all(peak), cv::FILLED, cv::LINE_8);
    }
    return PixelBuffer::FromFloatMat(std::move(data), ColorSpace::RGB);
  }

  /**
   * @brief A textured bright disk on a dark sky, roughly what a lunar capture looks like
   *
   */
  static auto LunarDisk(int size, float sky = 0.01f) -> PixelBuffer {
    cv::Mat data(size, size, CV_32FC3, cv::Scalar::all(sky));
    const cv::Point center(size / 2, size / 2);
    const int       radius = size / 3;
    for (int r = 0; r < size; ++r) {
      auto* row = data.ptr<cv::Vec3f>(r);
      for (int c = 0; c < size; ++c) {
        const int dx = c - center.x;
        const int dy = r - center.y;
        if (dx * dx + dy * dy > radius * radius) {
          continue;
        }
        const float texture = 0.1f * std::sin(0.3f * static_cast<float>(c)) *
                              std::cos(0.2f * static_cast<float>(r));
        row[c]              = {0.55f + texture, 0.5f + texture, 0.45f + texture};
      }
    }
    return PixelBuffer::FromFloatMat(std::move(data), ColorSpace::RGB);
  }

  static auto MaxAbsDiff(const PixelBuffer& a, const PixelBuffer& b) -> double {
    return cv::norm(a.GetCPUData(), b.GetCPUData(), cv::NORM_INF);
  }
};
}  // namespace astroslide
