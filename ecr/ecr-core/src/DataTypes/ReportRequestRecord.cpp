#include "ecr-core/src/DataTypes/ReportRequestRecord.hpp"

#include <stdexcept>

namespace ecr_core
{

std::string toString(RequestStatus status)
{
  switch (status)
  {
    case RequestStatus::Pending:
      return "PENDING";
    case RequestStatus::Computed:
      return "COMPUTED";
    case RequestStatus::Sent:
      return "SENT";
    case RequestStatus::Failed:
      return "FAILED";
  }
  throw std::invalid_argument("Unknown RequestStatus value " +
                              std::to_string(static_cast<int>(status)));
}

RequestStatus requestStatusFromString(const std::string& name)
{
  if (name == "PENDING")
  {
    return RequestStatus::Pending;
  }
  if (name == "COMPUTED")
  {
    return RequestStatus::Computed;
  }
  if (name == "SENT")
  {
    return RequestStatus::Sent;
  }
  if (name == "FAILED")
  {
    return RequestStatus::Failed;
  }
  throw std::invalid_argument("Unknown request status '" + name + "'");
}

}  // namespace ecr_core
