#include <config/vehicle_config.hpp>
#include <dynamics/flight_dynamics.hpp>
#include <integrator/factory.hpp>
#include <sim/composite_frame.hpp>
#include <sim/simulation.hpp>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <boost/program_options.hpp>

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

namespace po = boost::program_options;

int main(int argc, char* argv[]) {
    // Command-line options
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Produce help message")
        ("config,c", po::value<std::string>()->required(), "Vehicle JSON file")
        ("output,o", po::value<std::string>()->default_value("trajectory.json"), "Output JSON file with trajectory points")
        ("timestep,t", po::value<double>()->default_value(0.005), "Integration timestep (seconds)")
        ("duration,d", po::value<double>()->default_value(10.0), "Simulated time (seconds)")
        ("integrator,i", po::value<std::string>()->default_value("rk4"), "Integrator to use (rk4 or euler)")
        ("pendulum,p", po::bool_switch()->default_value(false), "Simulate the pilot swing as a pendulum")
        ("no-apparent-mass", po::bool_switch()->default_value(false), "Use physical mass and inertia only");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl << desc << std::endl;
        return 1;
    }

    // Simulation parameters
    const double dt = vm["timestep"].as<double>();
    const double duration = vm["duration"].as<double>();
    const bool with_pendulum = vm["pendulum"].as<bool>();
    const bool use_apparent_mass = !vm["no-apparent-mass"].as<bool>();
    const auto integrator_name = vm["integrator"].as<std::string>();
    const auto output_file = vm["output"].as<std::string>();

    try {
        const auto vehicle = config::load_vehicle_config(vm["config"].as<std::string>());
        const auto frame_config = config::to_composite_frame_config(vehicle);
        const auto frame = sim::build_composite_frame(frame_config);

        auto dynamics = std::make_shared<dynamics::FlightDynamics>(
            sim::frame_to_flight_model(frame, frame_config, use_apparent_mass, with_pendulum));
        auto integrator = integrator::IntegratorFactory::create(integrator_name);
        sim::Simulation simulation(dynamics, integrator, dt);

        const Eigen::VectorXd initial_state = config::initial_state_vector(vehicle, with_pendulum);
        const auto trajectory = simulation.run(0.0, initial_state, duration);

        nlohmann::json summary;
        summary["vehicle"] = vehicle.name;
        summary["simulation"]["integrator"] = integrator_name;
        summary["simulation"]["timestep"] = dt;
        summary["simulation"]["duration"] = duration;
        summary["simulation"]["pendulum"] = with_pendulum;
        summary["simulation"]["apparent_mass"] = use_apparent_mass;
        summary["mass"]["total_mass"] = frame.total_mass;
        summary["mass"]["cg"] = {frame.cg.x(), frame.cg.y(), frame.cg.z()};
        summary["state_layout"] = with_pendulum
            ? nlohmann::json{"x", "y", "z", "u", "v", "w", "phi", "theta", "psi", "p", "q", "r", "swing", "swing_rate"}
            : nlohmann::json{"x", "y", "z", "u", "v", "w", "phi", "theta", "psi", "p", "q", "r"};

        config::save_trajectory_json(output_file, trajectory, summary);

        const Eigen::VectorXd& final_state = trajectory.back().second;
        std::cout << std::fixed << std::setprecision(3);
        std::cout << "Simulated " << trajectory.size() - 1 << " steps of " << dt << " s" << std::endl;
        std::cout << "Final position (NED): " << final_state.segment<3>(dynamics::FlightDynamics::POSITION).transpose() << " m" << std::endl;
        std::cout << "Final velocity (body): " << final_state.segment<3>(dynamics::FlightDynamics::VELOCITY).transpose() << " m/s" << std::endl;
        std::cout << "Trajectory data written to " << output_file << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
