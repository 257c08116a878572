#include "integrator/factory.hpp"
#include "integrator/forward_euler.hpp"
#include "integrator/rk4.hpp"

#include <stdexcept>

namespace integrator {

auto IntegratorFactory::create(const std::string& name) -> std::shared_ptr<IIntegrator>
{
    if (name == "rk4") {
        return std::make_shared<RK4Integrator>();
    }
    if (name == "euler") {
        return std::make_shared<ForwardEulerIntegrator>();
    }
    throw std::invalid_argument("Unknown integrator: " + name + " (expected rk4 or euler)");
}

} // namespace integrator
