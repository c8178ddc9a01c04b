// test_voxelizer.cpp - Unit tests for mesh input and the scan-line voxelizer
//
// This test program validates:
// 1. Sphere volume fraction converging to the mesh volume as cells shrink
// 2. The cell centred on a solid's centroid is always inside
// 3. Exact cell counts for a grid-aligned box (ties on face diagonals resolved)
// 4. Region priority (PEC shell, air interior, dielectric core)
// 5. Non-manifold region classified by three-axis vote
// 6. Degenerate and invalid triangles skipped and reported
// 7. Grid planning and input errors

#include <iostream>
#include <vector>
#include <cmath>
#include <iomanip>
#include <string>
#include <algorithm>

#include "mesh_input.hpp"
#include "voxelizer.hpp"

// ANSI color codes for output
#define GREEN "\033[32m"
#define RED "\033[31m"
#define YELLOW "\033[33m"
#define RESET "\033[0m"
#define BOLD "\033[1m"

struct TestResult {
    std::string name;
    bool passed;
    std::string message;
};

std::vector<TestResult> all_results;

void report_test(const std::string& name, bool passed, const std::string& msg = "") {
    all_results.push_back({name, passed, msg});
    if (passed) {
        std::cout << GREEN << "[PASS] " << RESET << name;
    } else {
        std::cout << RED << "[FAIL] " << RESET << name;
    }
    if (!msg.empty()) {
        std::cout << " - " << msg;
    }
    std::cout << "\n";
}

// Helper: voxelize a mesh quietly on a planned grid
VoxelizeResult voxelize_mesh(const TriangleMesh& mesh, const MaterialLibrary& lib,
                             real cell_size, size_t margin) {
    GridGeometry geo = plan_grid(mesh, cell_size, margin, 0, 1.0);
    return voxelize(mesh, lib, geo, false);
}

// ==================== Test 1: Sphere Volume Convergence ====================
bool test_sphere_volume_convergence() {
    std::cout << "\n" << BOLD << "=== Test 1: Sphere Volume Convergence ===" << RESET << "\n";

    MaterialLibrary lib = MaterialLibrary::with_builtins();
    const MaterialId alumina = *lib.find("alumina");

    TriangleMesh mesh;
    MeshBuilder::append_sphere(mesh, 0.0, 0.0, 0.0, 1.0, alumina, 48, 96);
    const real v_mesh = MeshBuilder::enclosed_volume(mesh, alumina);

    const real sizes[3] = { 0.2, 0.1, 0.05 };
    real errors[3];
    for (int s = 0; s < 3; ++s) {
        auto res = voxelize_mesh(mesh, lib, sizes[s], 1);
        const real h = sizes[s];
        const real v_vox = real(res.grid.count(alumina)) * h * h * h;
        errors[s] = std::abs(v_vox - v_mesh) / v_mesh;
        std::cout << "  h = " << h << ": voxel volume " << v_vox << " vs mesh " << v_mesh
                  << " (rel. error " << std::setprecision(3) << errors[s] * 100 << " %)\n";
        report_test("Sphere voxelization is clean at h=" + std::to_string(h), res.report.clean());
    }

    bool coarse_ok = errors[0] < 0.05;
    bool fine_ok = errors[2] < 0.01;
    bool converges = errors[2] <= errors[0];
    report_test("Coarse volume error < 5%", coarse_ok, std::to_string(errors[0] * 100) + " %");
    report_test("Fine volume error < 1%", fine_ok, std::to_string(errors[2] * 100) + " %");
    report_test("Error shrinks with cell size", converges);

    return coarse_ok && fine_ok && converges;
}

// ==================== Test 2: Centroid Cell Inside ====================
bool test_centroid_inside() {
    std::cout << "\n" << BOLD << "=== Test 2: Centroid Cell Inside ===" << RESET << "\n";

    MaterialLibrary lib = MaterialLibrary::with_builtins();
    const MaterialId ptfe = *lib.find("ptfe");

    // r = 1.05, h = 0.1, margin 1: the centre of cell 11 sits on the centroid
    TriangleMesh sphere;
    MeshBuilder::append_sphere(sphere, 0.0, 0.0, 0.0, 1.05, ptfe);
    auto rs = voxelize_mesh(sphere, lib, 0.1, 1);
    const real cx = rs.grid.cell_center(0, 11);
    bool on_centroid = std::abs(cx) < 1e-4;
    bool sphere_ok = rs.grid.id_at(11, 11, 11) == ptfe;
    report_test("Cell 11 centre is on the sphere centroid", on_centroid, "x = " + std::to_string(cx));
    report_test("Sphere centroid cell inside", sphere_ok);

    // Box [0, 1.1]^3, h = 0.1, margin 2: cell 7 centre = 0.55
    TriangleMesh box;
    MeshBuilder::append_box(box, { 0.0, 1.1, 0.0, 1.1, 0.0, 1.1 }, ptfe);
    auto rb = voxelize_mesh(box, lib, 0.1, 2);
    bool box_ok = rb.grid.id_at(7, 7, 7) == ptfe;
    report_test("Box centroid cell inside", box_ok);

    return on_centroid && sphere_ok && box_ok;
}

// ==================== Test 3: Grid-Aligned Box ====================
bool test_aligned_box_exact() {
    std::cout << "\n" << BOLD << "=== Test 3: Grid-Aligned Box ===" << RESET << "\n";

    MaterialLibrary lib = MaterialLibrary::with_builtins();
    const MaterialId fr4 = *lib.find("fr4");

    TriangleMesh box;
    MeshBuilder::append_box(box, { 0.0, 1.0, 0.0, 1.0, 0.0, 1.0 }, fr4);
    auto res = voxelize_mesh(box, lib, 0.1, 2);

    bool dims_ok = res.grid.nx == 14 && res.grid.ny == 14 && res.grid.nz == 14;
    report_test("Grid is 10 + 2*2 cells per axis", dims_ok,
                std::to_string(res.grid.nx) + " x " + std::to_string(res.grid.ny) + " x " + std::to_string(res.grid.nz));

    const size_t inside = res.grid.count(fr4);
    bool count_ok = inside == 1000;
    report_test("Exactly 1000 cells inside", count_ok, std::to_string(inside));

    // Rays through the face diagonals hit a triangle edge and need a perturbed retry
    bool ties_resolved = res.report.ambiguous_columns_resolved > 0 && res.report.ambiguous_columns_outside == 0;
    report_test("Diagonal ties resolved by perturbation", ties_resolved,
                std::to_string(res.report.ambiguous_columns_resolved) + " columns");

    bool corner_out = res.grid.id_at(1, 1, 1) == 0 && res.grid.id_at(12, 12, 12) == 0;
    bool edge_in = res.grid.id_at(2, 2, 2) == fr4 && res.grid.id_at(11, 11, 11) == fr4;
    report_test("Margin cells outside, first/last layers inside", corner_out && edge_in);

    return dims_ok && count_ok && ties_resolved && corner_out && edge_in;
}

// ==================== Test 4: Region Priority ====================
bool test_region_priority() {
    std::cout << "\n" << BOLD << "=== Test 4: Region Priority ===" << RESET << "\n";

    MaterialLibrary lib = MaterialLibrary::with_builtins();
    Material air = make_dielectric("cavity_air", 1.0);
    air.priority = 1;
    Material core = make_dielectric("core", 9.8);
    core.priority = 2;
    const MaterialId pec = *lib.find("pec");
    const MaterialId air_id = lib.add(air);
    const MaterialId core_id = lib.add(core);

    // Ids are inserted in reverse priority order on purpose
    TriangleMesh mesh;
    MeshBuilder::append_box(mesh, { 0.4, 0.6, 0.4, 0.6, 0.4, 0.6 }, core_id);
    MeshBuilder::append_box(mesh, { 0.1, 0.9, 0.1, 0.9, 0.1, 0.9 }, air_id);
    MeshBuilder::append_box(mesh, { 0.0, 1.0, 0.0, 1.0, 0.0, 1.0 }, pec);

    auto res = voxelize_mesh(mesh, lib, 0.1, 1);
    const auto& g = res.grid;

    // Cell n covers [-0.1 + 0.1 n, 0.1 n)
    bool wall = g.id_at(1, 5, 5) == pec && g.id_at(10, 5, 5) == pec;
    bool interior = g.id_at(3, 3, 3) == air_id && g.id_at(8, 8, 8) == air_id;
    bool centre = g.id_at(5, 5, 5) == core_id && g.id_at(6, 6, 6) == core_id;
    bool outside = g.id_at(0, 5, 5) == 0;

    report_test("PEC shell in the wall layer", wall);
    report_test("Air overrides PEC inside the shell", interior);
    report_test("Core overrides air at the centre", centre);
    report_test("Margin stays vacuum", outside);
    report_test("Three regions processed", res.report.regions == 3, std::to_string(res.report.regions));

    return wall && interior && centre && outside && res.report.regions == 3;
}

// ==================== Test 5: Non-Manifold Region ====================
bool test_non_manifold_vote() {
    std::cout << "\n" << BOLD << "=== Test 5: Non-Manifold Region ===" << RESET << "\n";

    MaterialLibrary lib = MaterialLibrary::with_builtins();
    const MaterialId alumina = *lib.find("alumina");

    TriangleMesh box;
    MeshBuilder::append_box(box, { 0.0, 1.0, 0.0, 1.0, 0.0, 1.0 }, alumina);
    // Drop the +z face (triangles 2 and 3)
    box.triangles.erase(box.triangles.begin() + 2, box.triangles.begin() + 4);
    box.triangle_material.erase(box.triangle_material.begin() + 2, box.triangle_material.begin() + 4);

    auto res = voxelize_mesh(box, lib, 0.1, 2);

    bool flagged = res.report.non_manifold_regions.size() == 1 && res.report.open_edges > 0;
    report_test("Open box flagged non-manifold", flagged,
                std::to_string(res.report.open_edges) + " open edges");
    bool warned = !res.report.warnings.empty();
    report_test("Warning reported, not thrown", warned);

    bool centre_in = res.grid.id_at(7, 7, 7) == alumina;
    bool below_out = res.grid.id_at(7, 7, 0) == 0;     // z parity alone would call this inside
    bool beside_out = res.grid.id_at(0, 7, 7) == 0;
    report_test("Interior classified inside by vote", centre_in);
    report_test("Cells below and beside the box outside", below_out && beside_out);
    report_test("Vote overruled at least one axis", res.report.vote_resolved_cells > 0,
                std::to_string(res.report.vote_resolved_cells) + " cells");

    return flagged && warned && centre_in && below_out && beside_out;
}

// ==================== Test 6: Bad Triangles ====================
bool test_bad_triangles() {
    std::cout << "\n" << BOLD << "=== Test 6: Degenerate and Invalid Triangles ===" << RESET << "\n";

    MaterialLibrary lib = MaterialLibrary::with_builtins();
    const MaterialId fr4 = *lib.find("fr4");

    TriangleMesh box;
    MeshBuilder::append_box(box, { 0.0, 1.0, 0.0, 1.0, 0.0, 1.0 }, fr4);
    box.triangles.push_back({ 0, 0, 0 });          // zero area
    box.triangle_material.push_back(fr4);
    box.triangles.push_back({ 0, 1, 999 });        // missing vertex
    box.triangle_material.push_back(fr4);

    auto res = voxelize_mesh(box, lib, 0.1, 2);

    bool counted = res.report.degenerate_triangles == 1 && res.report.invalid_triangles == 1;
    report_test("One degenerate and one invalid triangle counted", counted);
    bool used = res.report.triangles_used == 12;
    report_test("Valid triangles still used", used, std::to_string(res.report.triangles_used));
    bool still_closed = res.report.non_manifold_regions.empty() && res.grid.count(fr4) == 1000;
    report_test("Box still classified exactly", still_closed, std::to_string(res.grid.count(fr4)));
    report_test("Report carries warnings", res.report.warnings.size() >= 2);

    return counted && used && still_closed;
}

// ==================== Test 7: Planning and Input Errors ====================
bool test_planning_and_errors() {
    std::cout << "\n" << BOLD << "=== Test 7: Grid Planning and Input Errors ===" << RESET << "\n";

    MaterialLibrary lib = MaterialLibrary::with_builtins();
    TriangleMesh box;
    MeshBuilder::append_box(box, { -0.5, 1.5, 0.0, 0.375, 2.0, 2.0625 }, *lib.find("ptfe"));

    GridGeometry geo = plan_grid(box, 0.125, 3, 8, 1e-3);
    bool counts = geo.Nx == 16 + 6 && geo.Ny == 3 + 6 && geo.Nz == 1 + 6;
    report_test("Cell counts = ceil(extent / h) + 2 * margin", counts,
                std::to_string(geo.Nx) + ", " + std::to_string(geo.Ny) + ", " + std::to_string(geo.Nz));
    bool origin = std::abs(geo.origin[0] - (-0.875)) < 1e-9 && std::abs(geo.origin[2] - 1.625) < 1e-9;
    report_test("Origin = bbox min - margin * h", origin);
    bool units = std::abs(geo.dx - 1.25e-4) < 1e-15 && geo.npml == 8 && geo.NxT() == 22 + 16 + 1;
    report_test("dx in meters and total node count", units);

    bool empty_throws = false;
    try {
        TriangleMesh empty;
        plan_grid(empty, 0.1, 2, 0, 1.0);
    } catch (const MeshError&) {
        empty_throws = true;
    }
    report_test("Empty mesh raises MeshError", empty_throws);

    bool bad_size_throws = false;
    try {
        plan_grid(box, 0.0, 2, 0, 1.0);
    } catch (const ConfigError& e) {
        bad_size_throws = e.key() == "cell_size";
    }
    report_test("Zero cell size raises ConfigError(cell_size)", bad_size_throws);

    bool bad_id_throws = false;
    try {
        TriangleMesh tagged = box;
        tagged.triangle_material[0] = MaterialId(200);
        voxelize_mesh(tagged, lib, 0.1, 1);
    } catch (const MeshError&) {
        bad_id_throws = true;
    }
    report_test("Unknown material id raises MeshError", bad_id_throws);

    return counts && origin && units && empty_throws && bad_size_throws && bad_id_throws;
}

int main() {
    std::cout << BOLD << "\n"
              << "======================================================================\n"
              << "     MESH VOXELIZER - UNIT TEST SUITE                                 \n"
              << "======================================================================\n"
              << RESET;

    test_sphere_volume_convergence();
    test_centroid_inside();
    test_aligned_box_exact();
    test_region_priority();
    test_non_manifold_vote();
    test_bad_triangles();
    test_planning_and_errors();

    std::cout << BOLD << "\n"
              << "======================================================================\n"
              << "                       TEST SUMMARY                                   \n"
              << "======================================================================\n"
              << RESET;

    int passed = 0, failed = 0;
    for (const auto& r : all_results) {
        if (r.passed) passed++;
        else failed++;
    }

    std::cout << "\nTotal tests: " << all_results.size() << "\n";
    std::cout << GREEN << "Passed: " << passed << RESET << "\n";
    if (failed > 0) {
        std::cout << RED << "Failed: " << failed << RESET << "\n";
        std::cout << "\nFailed tests:\n";
        for (const auto& r : all_results) {
            if (!r.passed) {
                std::cout << RED << "  - " << r.name << RESET;
                if (!r.message.empty()) std::cout << ": " << r.message;
                std::cout << "\n";
            }
        }
    }

    bool all_passed = (failed == 0);
    std::cout << "\n" << (all_passed ? GREEN : RED) << BOLD
              << "Overall: " << (all_passed ? "ALL TESTS PASSED" : "SOME TESTS FAILED")
              << RESET << "\n\n";

    return all_passed ? 0 : 1;
}
