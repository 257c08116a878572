#include <config/vehicle_config.hpp>
#include <sim/composite_frame.hpp>
#include <mass/mass_properties.hpp>

#include <Eigen/Dense>
#include <boost/program_options.hpp>

#include <cmath>
#include <iomanip>
#include <iostream>
#include <string>

namespace po = boost::program_options;

namespace {

void print_vector(const std::string& label, const Eigen::Vector3d& v, const std::string& unit) {
    std::cout << "  " << std::left << std::setw(22) << label << std::right
              << std::setw(10) << v.x() << std::setw(10) << v.y() << std::setw(10) << v.z()
              << "  " << unit << std::endl;
}

void print_inertia(const std::string& label, const common::InertiaComponents& I) {
    std::cout << label << " (kg·m²)" << std::endl;
    std::cout << "  Ixx " << std::setw(10) << I.Ixx
              << "  Iyy " << std::setw(10) << I.Iyy
              << "  Izz " << std::setw(10) << I.Izz << std::endl;
    std::cout << "  Ixy " << std::setw(10) << I.Ixy
              << "  Ixz " << std::setw(10) << I.Ixz
              << "  Iyz " << std::setw(10) << I.Iyz << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    // Command-line options
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "Produce help message")
        ("config,c", po::value<std::string>()->required(), "Vehicle JSON file")
        ("swing-deg,s", po::value<double>()->default_value(0.0), "Pilot swing angle about the riser pivot (deg)")
        ("deploy,d", po::value<double>()->default_value(1.0), "Canopy deploy fraction (0 to 1)");

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

    const double swing = vm["swing-deg"].as<double>() * M_PI / 180.0;
    const double deploy = vm["deploy"].as<double>();

    try {
        const auto vehicle = config::load_vehicle_config(vm["config"].as<std::string>());
        const auto frame_config = config::to_composite_frame_config(vehicle);
        const auto frame = sim::build_composite_frame(frame_config, deploy, swing);

        std::cout << std::fixed << std::setprecision(4);
        std::cout << "Vehicle: " << vehicle.name << std::endl;
        std::cout << "  reference length " << vehicle.reference_length << " m, total mass "
                  << vehicle.total_mass << " kg, rho " << vehicle.rho << " kg/m³" << std::endl;
        std::cout << "  weight segments " << frame.weight_segments.size()
                  << ", inertia segments " << frame.inertia_segments.size()
                  << ", aero segments " << frame.aero_segments.size() << std::endl;
        std::cout << "  segment mass sum " << mass::segment_mass_sum(frame.weight_segments, vehicle.total_mass)
                  << " kg" << std::endl << std::endl;

        std::cout << "Center of gravity (NED body)" << std::endl;
        print_vector("cg", frame.cg, "m");
        std::cout << std::endl;

        print_inertia("Inertia about CG", frame.inertia);
        std::cout << std::endl;

        if (vehicle.canopy) {
            const auto& am = frame.apparent_mass;
            std::cout << "Apparent mass (deploy " << deploy << ")" << std::endl;
            print_vector("mass", Eigen::Vector3d(am.mass.x, am.mass.y, am.mass.z), "kg");
            print_vector("inertia", Eigen::Vector3d(am.inertia.Ixx, am.inertia.Iyy, am.inertia.Izz), "kg·m²");
            print_vector("effective mass", frame.effective_mass, "kg");
            std::cout << std::endl;
            print_inertia("Effective inertia", frame.effective_inertia);
            std::cout << std::endl;
        }

        if (vehicle.pilot) {
            const auto& p = frame.pendulum;
            std::cout << "Pilot pendulum (swing " << vm["swing-deg"].as<double>() << " deg)" << std::endl;
            std::cout << "  pilot mass   " << p.pilot_mass << " kg" << std::endl;
            std::cout << "  Iy riser     " << p.Iy_riser << " kg·m²" << std::endl;
            std::cout << "  riser to CG  " << p.riser_to_cg << " m" << std::endl;
            std::cout << "  CG offset    x " << p.cg_offset.x() << "  z " << p.cg_offset.y() << " m" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
