// Repository: TermReel
// Component: Distance Band Table
// Purpose: Maps a smoothed distance to a clip identifier.
// Copyright (c) 2025 TermReel

#ifndef TERMREEL_SENSOR_DISTANCE_BAND_TABLE_HPP_
#define TERMREEL_SENSOR_DISTANCE_BAND_TABLE_HPP_

#include <string>
#include <vector>

namespace termreel::sensor {

// Default clip identifiers of the mood table.
inline constexpr const char* kDefaultIdleClip = "s1.mp4";
inline constexpr const char* kDefaultLaughClip = "s2.mp4";
inline constexpr const char* kDefaultCuriousClip = "curious.mp4";
inline constexpr const char* kDefaultAnnoyedClip = "annoyed.mp4";
inline constexpr const char* kDefaultAngryClip = "angry.mp4";

struct DistanceBand {
  int upper_bound;  // Exclusive
  std::string identifier;
};

// Bands are checked in ascending bound order; the first with
// int(value) < upper_bound wins, else the fallback identifier.
class DistanceBandTable {
 public:
  // Bands are sorted by upper_bound on construction.
  DistanceBandTable(std::vector<DistanceBand> bands, std::string fallback);

  // <20 laugh, <40 curious, <60 annoyed, <80 angry, otherwise idle.
  static DistanceBandTable Default(const std::string& idle = kDefaultIdleClip,
                                   const std::string& laugh = kDefaultLaughClip,
                                   const std::string& curious = kDefaultCuriousClip,
                                   const std::string& annoyed = kDefaultAnnoyedClip,
                                   const std::string& angry = kDefaultAngryClip);

  const std::string& Lookup(double value) const;

  const std::vector<DistanceBand>& bands() const { return bands_; }
  const std::string& fallback() const { return fallback_; }

 private:
  std::vector<DistanceBand> bands_;
  std::string fallback_;
};

}  // namespace termreel::sensor

#endif  // TERMREEL_SENSOR_DISTANCE_BAND_TABLE_HPP_
