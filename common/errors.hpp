#ifndef WASHIWRAP_COMMON_ERRORS_HPP
#define WASHIWRAP_COMMON_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace washiwrap {

// Base class for every failure raised by the unfolding pipeline.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

// The face set does not describe a closed convex shell: an edge bordered by
// other than two faces, a zero-area face, or two faces sharing several edges.
class MalformedMeshError : public Error {
public:
    explicit MalformedMeshError(const std::string& message)
        : Error("Malformed mesh: " + message) {}
};

// A hinge edge whose endpoints coincide; no unfolding direction exists.
class DegenerateEdgeError : public Error {
public:
    DegenerateEdgeError(uint32_t face_a, uint32_t face_b, const std::string& detail)
        : Error("Degenerate edge between faces " + std::to_string(face_a) + " and " +
                std::to_string(face_b) + ": " + detail),
          face_a_(face_a), face_b_(face_b) {}

    uint32_t face_a() const { return face_a_; }
    uint32_t face_b() const { return face_b_; }

private:
    uint32_t face_a_;
    uint32_t face_b_;
};

// A single face is wider than the tape in every direction.
class TapeWidthError : public Error {
public:
    TapeWidthError(uint32_t face_id, double face_width, double tape_width)
        : Error("Face " + std::to_string(face_id) + " needs at least " +
                std::to_string(face_width) + " mm of tape, tape width is " +
                std::to_string(tape_width) + " mm"),
          face_id_(face_id), face_width_(face_width), tape_width_(tape_width) {}

    uint32_t face_id() const { return face_id_; }
    double face_width() const { return face_width_; }
    double tape_width() const { return tape_width_; }

private:
    uint32_t face_id_;
    double face_width_;
    double tape_width_;
};

// The packed sheet exceeds a configured maximum size.
class LayoutOverflowError : public Error {
public:
    explicit LayoutOverflowError(const std::string& message)
        : Error("Layout overflow: " + message) {}
};

// The mesh file could not be read or parsed.
class MeshLoadError : public Error {
public:
    explicit MeshLoadError(const std::string& message)
        : Error("Cannot load mesh: " + message) {}
};

}  // namespace washiwrap

#endif // WASHIWRAP_COMMON_ERRORS_HPP
