#include "config/vehicle_config.hpp"
#include "dynamics/flight_dynamics.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <memory>
#include <stdexcept>

namespace config {

namespace {

constexpr double DEG_TO_RAD = M_PI / 180.0;

auto read_vector3(const nlohmann::json& node, const char* key) -> Eigen::Vector3d {
    const auto& values = node.at(key);
    if (!values.is_array() || values.size() != 3) {
        throw std::runtime_error(std::string("'") + key + "' must be an array of 3 numbers");
    }
    return {values[0].get<double>(), values[1].get<double>(), values[2].get<double>()};
}

auto read_mass_segments(const nlohmann::json& node) -> common::MassSegments {
    if (!node.is_array()) {
        throw std::runtime_error("Mass segment list must be an array");
    }

    common::MassSegments segments;
    segments.reserve(node.size());
    for (const auto& entry : node) {
        common::MassSegment segment;
        segment.name = entry.at("name").get<std::string>();
        segment.mass_ratio = entry.at("mass_ratio").get<double>();
        segment.normalized_position = read_vector3(entry, "position");

        if (segment.mass_ratio < 0.0) {
            throw std::invalid_argument("Mass ratio cannot be negative: " + segment.name);
        }
        segments.push_back(segment);
    }
    return segments;
}

auto read_aero_segment(const nlohmann::json& entry) -> aero::AeroSegmentPtr {
    aero::LinearPolarSegment::Polar polar;
    polar.cl_alpha = entry.value("cl_alpha", 0.0);
    polar.alpha_0 = entry.value("alpha_0", 0.0) * DEG_TO_RAD;
    polar.cd_0 = entry.value("cd_0", 0.0);
    polar.k = entry.value("k", 0.0);
    polar.cy_beta = entry.value("cy_beta", 0.0);
    polar.cm_0 = entry.value("cm_0", 0.0);
    polar.cm_alpha = entry.value("cm_alpha", 0.0);
    polar.cp = entry.value("cp", 0.25);

    return std::make_shared<aero::LinearPolarSegment>(
        entry.at("name").get<std::string>(),
        read_vector3(entry, "position"),
        entry.at("area").get<double>(),
        entry.at("chord").get<double>(),
        polar,
        entry.value("pitch_offset_deg", 0.0) * DEG_TO_RAD
    );
}

auto read_initial_state(const nlohmann::json& node) -> InitialState {
    InitialState state;
    if (node.contains("velocity")) {
        state.velocity = read_vector3(node, "velocity");
    }
    if (node.contains("attitude_deg")) {
        const Eigen::Vector3d attitude = read_vector3(node, "attitude_deg") * DEG_TO_RAD;
        state.attitude = {attitude.x(), attitude.y(), attitude.z()};
    }
    if (node.contains("rates")) {
        const Eigen::Vector3d rates = read_vector3(node, "rates");
        state.rates = {rates.x(), rates.y(), rates.z()};
    }
    return state;
}

auto contains(const std::vector<std::string>& names, const std::string& name) -> bool {
    return std::find(names.begin(), names.end(), name) != names.end();
}

auto is_pilot_segment(const std::optional<PilotConfig>& pilot, const std::string& name) -> bool {
    return pilot && contains(pilot->segment_names, name);
}

} // namespace

auto load_vehicle_config(const std::string& path) -> VehicleConfig {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open vehicle file " + path);
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Failed to parse vehicle file " + path + ": " + e.what());
    }

    try {
        return parse_vehicle_config(document);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error("Invalid vehicle file " + path + ": " + e.what());
    }
}

auto parse_vehicle_config(const nlohmann::json& document) -> VehicleConfig {
    VehicleConfig vehicle;

    try {
        vehicle.name = document.value("name", std::string("unnamed"));
        vehicle.reference_length = document.at("reference_length").get<double>();
        vehicle.total_mass = document.at("total_mass").get<double>();
        vehicle.rho = document.value("rho", mass::SEA_LEVEL_DENSITY);

        vehicle.mass_segments = read_mass_segments(document.at("mass_segments"));
        if (document.contains("inertia_only_segments")) {
            vehicle.inertia_only_segments = read_mass_segments(document.at("inertia_only_segments"));
        }

        if (document.contains("pilot")) {
            const auto& node = document.at("pilot");
            PilotConfig pilot;
            pilot.segment_names = node.at("segments").get<std::vector<std::string>>();
            if (node.contains("aero_segments")) {
                pilot.aero_segment_names = node.at("aero_segments").get<std::vector<std::string>>();
            }
            const auto& pivot = node.at("pivot");
            if (!pivot.is_array() || pivot.size() != 2) {
                throw std::runtime_error("'pivot' must be an array of 2 numbers [x, z]");
            }
            pilot.pivot = Eigen::Vector2d(pivot[0].get<double>(), pivot[1].get<double>());
            vehicle.pilot = pilot;
        }

        if (document.contains("canopy")) {
            const auto& node = document.at("canopy");
            vehicle.canopy = mass::canopy_geometry_from_area(
                node.at("area").get<double>(), node.at("chord").get<double>());
            if (node.contains("segments")) {
                vehicle.canopy_segment_names = node.at("segments").get<std::vector<std::string>>();
            }
        }

        if (document.contains("aero_segments")) {
            for (const auto& entry : document.at("aero_segments")) {
                vehicle.aero_segments.push_back(read_aero_segment(entry));
            }
        }

        if (document.contains("initial_state")) {
            vehicle.initial_state = read_initial_state(document.at("initial_state"));
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Malformed vehicle definition: ") + e.what());
    }

    if (vehicle.reference_length <= 0.0) {
        throw std::invalid_argument("reference_length must be positive");
    }
    if (vehicle.total_mass <= 0.0) {
        throw std::invalid_argument("total_mass must be positive");
    }
    if (vehicle.rho <= 0.0) {
        throw std::invalid_argument("rho must be positive");
    }

    const auto has_mass_segment = [&vehicle](const std::string& name) {
        return std::any_of(
            vehicle.mass_segments.begin(), vehicle.mass_segments.end(),
            [&name](const common::MassSegment& s) { return s.name == name; });
    };

    if (vehicle.pilot) {
        for (const auto& name : vehicle.pilot->segment_names) {
            if (!has_mass_segment(name)) {
                throw std::invalid_argument("Unknown pilot segment: " + name);
            }
        }
        for (const auto& name : vehicle.pilot->aero_segment_names) {
            const bool found = std::any_of(
                vehicle.aero_segments.begin(), vehicle.aero_segments.end(),
                [&name](const aero::AeroSegmentPtr& s) { return s->name() == name; });
            if (!found) {
                throw std::invalid_argument("Unknown pilot aero segment: " + name);
            }
        }
    }

    for (const auto& name : vehicle.canopy_segment_names) {
        if (!has_mass_segment(name)) {
            throw std::invalid_argument("Unknown canopy segment: " + name);
        }
        if (is_pilot_segment(vehicle.pilot, name)) {
            throw std::invalid_argument("Segment cannot be both pilot and canopy: " + name);
        }
    }

    return vehicle;
}

auto to_composite_frame_config(const VehicleConfig& vehicle) -> sim::CompositeFrameConfig {
    sim::CompositeFrameConfig frame_config;
    frame_config.aero_segments = vehicle.aero_segments;
    frame_config.inertia_only_segments = vehicle.inertia_only_segments;
    frame_config.reference_height = vehicle.reference_length;
    frame_config.total_mass = vehicle.total_mass;
    frame_config.rho = vehicle.rho;
    frame_config.canopy = vehicle.canopy;

    for (const auto& segment : vehicle.mass_segments) {
        if (is_pilot_segment(vehicle.pilot, segment.name)) {
            frame_config.pilot_segments.push_back(segment);
        } else if (contains(vehicle.canopy_segment_names, segment.name)) {
            frame_config.canopy_segments.push_back(segment);
        } else {
            frame_config.body_segments.push_back(segment);
        }
    }
    if (vehicle.pilot) {
        frame_config.pivot = vehicle.pilot->pivot;
        frame_config.pilot_aero_segments = vehicle.pilot->aero_segment_names;
    }

    return frame_config;
}

auto initial_state_vector(const VehicleConfig& vehicle, bool with_pendulum) -> Eigen::VectorXd {
    using dynamics::FlightDynamics;

    const int n = with_pendulum ? FlightDynamics::PENDULUM_STATE_SIZE : FlightDynamics::RIGID_BODY_STATE_SIZE;
    Eigen::VectorXd state = Eigen::VectorXd::Zero(n);

    const InitialState& initial = vehicle.initial_state;
    state.segment<3>(FlightDynamics::VELOCITY) = initial.velocity;
    state.segment<3>(FlightDynamics::ATTITUDE) << initial.attitude.phi, initial.attitude.theta, initial.attitude.psi;
    state.segment<3>(FlightDynamics::RATES) << initial.rates.p, initial.rates.q, initial.rates.r;
    return state;
}

auto trajectory_to_json(const common::Trajectory& trajectory) -> nlohmann::json {
    nlohmann::json points = nlohmann::json::array();
    for (const auto& [t, state] : trajectory) {
        nlohmann::json point;
        point["time"] = t;
        point["state"] = std::vector<double>(state.data(), state.data() + state.size());
        points.push_back(point);
    }
    return points;
}

auto save_trajectory_json(
    const std::string& path,
    const common::Trajectory& trajectory,
    const nlohmann::json& summary
) -> void {
    nlohmann::json data_json = {};
    data_json["summary"] = summary;
    data_json["points"] = trajectory_to_json(trajectory);

    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Could not open output file " + path);
    }
    out << data_json.dump(4);
}

} // namespace config
