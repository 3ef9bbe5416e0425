#pragma once

#include "signspace/types.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace signspace {

enum class Finger : uint8_t {
    Index = 0,
    Middle = 1,
    Ring = 2,
    Pinky = 3,
    Thumb = 4
};

struct FingerConfig {
    Finger finger = Finger::Index;
    double bend = 0.0;      // [0,1]
    double spread = 0.0;    // [0,1]
};

struct HandshapeConfig {
    std::string type;
    std::array<FingerConfig, 5> fingers{{
        {Finger::Index, 0.0, 0.0},
        {Finger::Middle, 0.0, 0.0},
        {Finger::Ring, 0.0, 0.0},
        {Finger::Pinky, 0.0, 0.0},
        {Finger::Thumb, 0.0, 0.0},
    }};
    double tension = 0.5;   // [0,1]
};

struct HandOrientation {
    std::string palm;       // "down", "in", ...
    std::string fingers;    // "forward", "up", ...

    bool complete() const noexcept { return !palm.empty() && !fingers.empty(); }
};

/**
 * Hand-configuration primitive representing a concept.
 */
struct Proforme {
    std::string id;
    std::string name;
    HandshapeConfig handshape;
    HandOrientation orientation;
    std::string represents;
    std::vector<std::string> associated_concepts;
    std::vector<std::string> cultural_context;
    std::optional<Point3D> default_position;
    std::optional<Point3D> position;
};

} // namespace signspace
