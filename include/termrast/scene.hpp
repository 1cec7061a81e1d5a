#ifndef TERMRAST_SCENE_HPP
#define TERMRAST_SCENE_HPP

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "termrast/color.hpp"
#include "termrast/light.hpp"
#include "termrast/mesh.hpp"
#include "termrast/node.hpp"

namespace termrast {

constexpr Color DEFAULT_AMBIENT(50, 50, 60);

// Glob match supporting '*' (any run) and '?' (any single character)
bool glob_match(const std::string& pattern, const std::string& text);

struct SceneStats {
    size_t nodes = 0;
    size_t meshes = 0;
    size_t vertices = 0;
    size_t triangles = 0;
    size_t lights = 0;
};

// ============================================================================
// Scene - owns the node tree and the flat name index
// ============================================================================
//
// Nodes created, attached, re-parented or removed through the Scene stay in
// the name index. Structural edits made directly through Node bypass the
// index; call reindex() afterwards.

class Scene {
public:
    Scene();

    Node& root() { return *root_; }
    const Node& root() const { return *root_; }

    // Creates an empty node under `parent` (root when null). An empty name
    // is replaced by "node_<id>". Throws std::invalid_argument if the name is
    // already taken.
    Node* create_node(const std::string& name, Node* parent = nullptr);
    Node* add_mesh_node(std::shared_ptr<Mesh> mesh, const std::string& name, Node* parent = nullptr);
    Node* add_light_node(const Light& light, const std::string& name, Node* parent = nullptr);

    // Adopts a detached subtree and indexes every node in it
    Node* attach(std::unique_ptr<Node> subtree, Node* parent = nullptr);

    // Removes `node` and its subtree from the graph and the index and hands
    // back ownership. The root cannot be detached.
    std::unique_ptr<Node> detach(Node* node);

    // Destroys `node` and its subtree. Returns false if it is not in the scene.
    bool remove_node(Node* node);

    void reparent(Node* node, Node* new_parent);

    void rename(Node* node, const std::string& name);

    // Rebuilds the name index from the tree
    void reindex();

    // --- Queries (linear scans over the name index, ordered by name) ---
    Node* find(const std::string& name) const;
    std::vector<Node*> find_by_name(const std::string& pattern) const;
    std::vector<Node*> find_by_tag_any(const std::vector<std::string>& tags) const;
    std::vector<Node*> find_by_tag_all(const std::vector<std::string>& tags) const;

    // --- Derived views (pre-order) ---
    std::vector<Node*> mesh_nodes() const;
    std::vector<Node*> light_nodes() const;

    SceneStats statistics() const;

    template <typename Fn>
    void traverse(Fn&& fn) { root_->traverse(std::forward<Fn>(fn)); }

    template <typename Fn>
    void traverse(Fn&& fn) const { static_cast<const Node&>(*root_).traverse(std::forward<Fn>(fn)); }

    const Color& ambient_light() const { return ambient_; }
    void set_ambient_light(int r, int g, int b) { ambient_ = Color::clamped(r, g, b); }

private:
    void index_subtree(Node& subtree);
    void unindex_subtree(Node& subtree);
    bool contains(const Node* node) const;

    std::unique_ptr<Node> root_;
    std::map<std::string, Node*> index_;
    Color ambient_ = DEFAULT_AMBIENT;
};

}  // namespace termrast

#endif  // TERMRAST_SCENE_HPP
