#pragma once

#include "integrator/integrator.hpp"

#include <memory>
#include <string>

namespace integrator {

/// @brief Factory for creating integrators by name
class IntegratorFactory {
public:
    /// @brief Create an integrator
    /// @param name "rk4" or "euler"
    /// @throws std::invalid_argument for an unknown name
    static auto create(const std::string& name) -> std::shared_ptr<IIntegrator>;
};

} // namespace integrator
