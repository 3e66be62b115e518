#ifndef RIDESAFE_SERIALIZATION_HPP
#define RIDESAFE_SERIALIZATION_HPP

#include <string>

#include "ridesafe/types.hpp"

namespace ridesafe {

// Single-line JSON documents, as written to the record log.
std::string to_json(const RoutePoint& point);
std::string to_json(const MonitoringSession& session);
std::string to_json(const EmergencyIncident& incident);

}  // namespace ridesafe

#endif  // RIDESAFE_SERIALIZATION_HPP
