#ifndef ECR_CORE_GPS_LOCATION_HPP
#define ECR_CORE_GPS_LOCATION_HPP

namespace ecr_core
{

/**
 * @brief Position of the metered site, attached to every report request
 */
struct GpsLocation
{
  double latitude{0.0};   // [deg]
  double longitude{0.0};  // [deg]

  bool operator==(const GpsLocation&) const = default;
};

}  // namespace ecr_core

#endif  // ECR_CORE_GPS_LOCATION_HPP
