#ifndef TERMRAST_NODE_HPP
#define TERMRAST_NODE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "termrast/light.hpp"
#include "termrast/matrix4.hpp"
#include "termrast/mesh.hpp"
#include "termrast/transform.hpp"

namespace termrast {

class Scene;

// ============================================================================
// Node - scene graph element
// ============================================================================
//
// A node owns its children; the parent pointer is non-owning and null for a
// root (or a subtree that has been detached). World matrices are recomputed
// on every call, so edits to any ancestor are picked up immediately.

class Node {
public:
    using Id = uint64_t;

    explicit Node(std::string name = "");

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    Id id() const { return id_; }
    const std::string& name() const { return name_; }

    Transform transform;
    std::shared_ptr<Mesh> mesh;
    std::optional<Light> light;
    bool visible = true;

    // --- Transform helpers ---
    void set_pos(double x, double y, double z) { transform.pos = Vector3(x, y, z); }
    void set_rot(double x, double y, double z) { transform.rot = Vector3(x, y, z); }
    void set_scale(double x, double y, double z) { transform.scale = Vector3(x, y, z); }
    void set_pivot(double x, double y, double z) { transform.pivot = Vector3(x, y, z); }
    void move(double dx, double dy, double dz) { transform.pos += Vector3(dx, dy, dz); }
    void rotate(double dx, double dy, double dz) { transform.rot += Vector3(dx, dy, dz); }

    // --- Tags ---
    void add_tag(const std::string& tag) { tags_.insert(tag); }
    void remove_tag(const std::string& tag) { tags_.erase(tag); }
    bool has_tag(const std::string& tag) const { return tags_.count(tag) != 0; }
    const std::set<std::string>& tags() const { return tags_; }

    // --- Hierarchy ---
    Node* parent() const { return parent_; }
    const std::vector<std::unique_ptr<Node>>& children() const { return children_; }

    // Takes ownership and appends after existing children. Returns the child.
    Node* add_child(std::unique_ptr<Node> child);

    // Releases a direct child, or returns nullptr if `child` is not one.
    std::unique_ptr<Node> remove_child(Node* child);

    // Detaches this node from its parent and re-attaches it under
    // `new_parent`. Throws std::invalid_argument for a null target or one that
    // would create a cycle, std::logic_error when this node has no parent.
    void set_parent(Node* new_parent);

    bool is_ancestor_of(const Node* node) const;

    // Pre-order, children in insertion order, excluding this node
    std::vector<Node*> descendants() const;

    Matrix4 local_matrix() const { return transform.matrix(); }

    // Root-to-node product of local matrices
    Matrix4 world_matrix() const;

    // Depth-first pre-order visit of this node and its subtree
    template <typename Fn>
    void traverse(Fn&& fn) {
        fn(*this);
        for (auto& child : children_) {
            child->traverse(fn);
        }
    }

    template <typename Fn>
    void traverse(Fn&& fn) const {
        fn(static_cast<const Node&>(*this));
        for (const auto& child : children_) {
            static_cast<const Node&>(*child).traverse(fn);
        }
    }

private:
    friend class Scene;

    Id id_;
    std::string name_;
    std::set<std::string> tags_;
    Node* parent_ = nullptr;
    std::vector<std::unique_ptr<Node>> children_;
};

}  // namespace termrast

#endif  // TERMRAST_NODE_HPP
