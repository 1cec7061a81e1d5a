#include "obj_loader.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <vector>

#define TINYOBJ_LOADER_C_IMPLEMENTATION
#include "tinyobj_loader_c.h"

namespace termrast::app {

namespace {

// File reading callback for tinyobj; leaves *buf null on failure
void read_file(void* ctx, const char* filename, int is_mtl, const char* obj_filename,
               char** buf, size_t* len) {
    (void)ctx;
    (void)is_mtl;
    (void)obj_filename;

    *buf = nullptr;
    *len = 0;

    FILE* f = fopen(filename, "rb");
    if (!f) return;

    fseek(f, 0, SEEK_END);
    long size = ftell(f);
    fseek(f, 0, SEEK_SET);
    if (size <= 0) {
        fclose(f);
        return;
    }

    char* data = static_cast<char*>(malloc(static_cast<size_t>(size) + 1));
    if (!data) {
        fclose(f);
        return;
    }
    size_t read = fread(data, 1, static_cast<size_t>(size), f);
    fclose(f);
    if (read != static_cast<size_t>(size)) {
        free(data);
        return;
    }
    data[read] = '\0';
    *buf = data;
    *len = read;
}

}  // namespace

std::shared_ptr<Mesh> load_obj(const char* filename, Color color) {
    tinyobj_attrib_t attrib;
    tinyobj_shape_t* shapes = nullptr;
    size_t num_shapes = 0;
    tinyobj_material_t* materials = nullptr;
    size_t num_materials = 0;

    int result = tinyobj_parse_obj(&attrib, &shapes, &num_shapes,
                                   &materials, &num_materials,
                                   filename, read_file, nullptr,
                                   TINYOBJ_FLAG_TRIANGULATE);
    if (result != TINYOBJ_SUCCESS) {
        std::cerr << "Failed to load OBJ: " << filename << std::endl;
        return nullptr;
    }

    std::vector<Vector3> verts;
    verts.reserve(attrib.num_vertices);
    for (unsigned int i = 0; i < attrib.num_vertices; i++) {
        verts.emplace_back(attrib.vertices[3 * i + 0],
                           attrib.vertices[3 * i + 1],
                           attrib.vertices[3 * i + 2]);
    }

    // Positions are shared through v_idx; only whole triangles are kept
    std::vector<Face> faces;
    size_t skipped = 0;
    size_t offset = 0;
    for (unsigned int f = 0; f < attrib.num_face_num_verts; f++) {
        int count = attrib.face_num_verts[f];
        if (count == 3) {
            int a = attrib.faces[offset + 0].v_idx;
            int b = attrib.faces[offset + 1].v_idx;
            int c = attrib.faces[offset + 2].v_idx;
            bool in_range = a >= 0 && b >= 0 && c >= 0 &&
                            static_cast<size_t>(a) < verts.size() &&
                            static_cast<size_t>(b) < verts.size() &&
                            static_cast<size_t>(c) < verts.size();
            if (in_range) {
                faces.push_back({static_cast<unsigned int>(a), static_cast<unsigned int>(b),
                                 static_cast<unsigned int>(c)});
            } else {
                skipped++;
            }
        } else {
            skipped++;
        }
        offset += static_cast<size_t>(count);
    }

    tinyobj_attrib_free(&attrib);
    tinyobj_shapes_free(shapes, num_shapes);
    tinyobj_materials_free(materials, num_materials);

    if (skipped > 0) {
        std::cerr << "Warning: skipped " << skipped << " malformed faces in " << filename
                  << std::endl;
    }

    std::vector<Color> colors(verts.size(), color);
    std::shared_ptr<Mesh> mesh;
    try {
        mesh = std::make_shared<Mesh>(std::move(verts), std::move(faces), std::move(colors),
                                      Material::Flat);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Failed to build mesh from " << filename << ": " << e.what() << std::endl;
        return nullptr;
    }

    std::cout << "Loaded mesh with " << mesh->verts().size() << " vertices and "
              << mesh->faces().size() << " triangles" << std::endl;
    return mesh;
}

}  // namespace termrast::app
