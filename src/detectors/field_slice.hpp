// field_slice.hpp - 2D snapshot of one field component on a core-region plane

#pragma once

#include "idetector.hpp"
#include <optional>

namespace Detectors {

enum class SlicePlane { XY = 0, XZ = 1, YZ = 2 };

inline const char* slice_plane_name(SlicePlane p) {
    switch (p) {
    case SlicePlane::XY: return "XY";
    case SlicePlane::XZ: return "XZ";
    case SlicePlane::YZ: return "YZ";
    }
    return "Unknown";
}

inline std::optional<SlicePlane> parse_slice_plane(const std::string& s) {
    if (s == "xy" || s == "XY") return SlicePlane::XY;
    if (s == "xz" || s == "XZ") return SlicePlane::XZ;
    if (s == "yz" || s == "YZ") return SlicePlane::YZ;
    return std::nullopt;
}

// Values are row-major: values[a * dim2 + b], a along dim1, b along dim2
// (XY: x,y  XZ: x,z  YZ: y,z). index is the core cell along the normal axis.
struct FieldSlice {
    SlicePlane plane{SlicePlane::XY};
    FieldComponent component{FieldComponent::Ez};
    std::size_t index{};
    std::size_t dim1{}, dim2{};
    std::size_t step{};
    std::vector<real> values;

    real at(std::size_t a, std::size_t b) const { return values[a * dim2 + b]; }
};

// Number of core cells along the plane normal
inline std::size_t slice_normal_extent(const GridGeometry& geo, SlicePlane plane) {
    switch (plane) {
    case SlicePlane::XY: return geo.Nz;
    case SlicePlane::XZ: return geo.Ny;
    case SlicePlane::YZ: return geo.Nx;
    }
    return 0;
}

inline FieldSlice capture_slice(const GridGeometry& geo, SlicePlane plane,
                                FieldComponent component, std::size_t index, std::size_t step,
                                const std::vector<real>& F)
{
    if (index >= slice_normal_extent(geo, plane)) {
        throw ConfigError("snapshot_index", std::to_string(index) + " outside the "
                          + slice_plane_name(plane) + " normal extent");
    }

    FieldSlice s;
    s.plane = plane;
    s.component = component;
    s.index = index;
    s.step = step;

    const std::size_t NyT = geo.NyT(), NzT = geo.NzT(), p = geo.npml;
    switch (plane) {
    case SlicePlane::XY:
        s.dim1 = geo.Nx; s.dim2 = geo.Ny;
        s.values.reserve(s.dim1 * s.dim2);
        for (std::size_t i = 0; i < geo.Nx; ++i)
            for (std::size_t j = 0; j < geo.Ny; ++j)
                s.values.push_back(F[idx3(i + p, j + p, index + p, NyT, NzT)]);
        break;
    case SlicePlane::XZ:
        s.dim1 = geo.Nx; s.dim2 = geo.Nz;
        s.values.reserve(s.dim1 * s.dim2);
        for (std::size_t i = 0; i < geo.Nx; ++i)
            for (std::size_t k = 0; k < geo.Nz; ++k)
                s.values.push_back(F[idx3(i + p, index + p, k + p, NyT, NzT)]);
        break;
    case SlicePlane::YZ:
        s.dim1 = geo.Ny; s.dim2 = geo.Nz;
        s.values.reserve(s.dim1 * s.dim2);
        for (std::size_t j = 0; j < geo.Ny; ++j)
            for (std::size_t k = 0; k < geo.Nz; ++k)
                s.values.push_back(F[idx3(index + p, j + p, k + p, NyT, NzT)]);
        break;
    }
    return s;
}

// <dir>/slice_<plane>_<comp>.raw (float64) plus slice_metadata.json
inline void write_slice(const fs::path& dir, const FieldSlice& s) {
    create_detector_directory(dir);

    const std::string stem = std::string("slice_") + slice_plane_name(s.plane) + "_"
                           + field_component_name(s.component);
    const fs::path raw_path = dir / (stem + ".raw");
    std::ofstream ofs(raw_path, std::ios::binary);
    if (!ofs) {
        std::cerr << "[ERR] Failed to open " << raw_path << "\n";
        throw IoError("cannot open " + raw_path.string());
    }
    write_f64_series(ofs, s.values);
    if (!ofs) throw IoError("write failed: " + raw_path.string());

    const fs::path json_path = dir / (stem + "_metadata.json");
    std::ofstream meta(json_path);
    if (!meta) throw IoError("cannot open " + json_path.string());
    meta << "{\n";
    meta << "  \"detector_type\": \"FieldSlice\",\n";
    meta << "  \"field_component\": \"" << field_component_name(s.component) << "\",\n";
    meta << "  \"slice_plane\": \"" << slice_plane_name(s.plane) << "\",\n";
    meta << "  \"slice_index\": " << s.index << ",\n";
    meta << "  \"step\": " << s.step << ",\n";
    meta << "  \"slice_dim1\": " << s.dim1 << ",\n";
    meta << "  \"slice_dim2\": " << s.dim2 << ",\n";
    meta << "  \"dtype\": \"float64\",\n";
    meta << "  \"note\": \"row-major storage, dim2 varies fastest\"\n";
    meta << "}\n";
}

} // namespace Detectors
