#pragma once

#include "domain/SystemSnapshot.hpp"

namespace hostlink::ports::output {

class ITelemetrySource {
public:
    virtual ~ITelemetrySource() = default;

    virtual domain::SystemSnapshot snapshot() = 0;
};

} // namespace hostlink::ports::output
