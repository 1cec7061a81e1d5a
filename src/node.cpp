#include "termrast/node.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <utility>

namespace termrast {

namespace {

Node::Id next_node_id() {
    static std::atomic<Node::Id> counter{1};
    return counter++;
}

}  // namespace

Node::Node(std::string name) : id_(next_node_id()), name_(std::move(name)) {}

Node* Node::add_child(std::unique_ptr<Node> child) {
    if (!child) {
        throw std::invalid_argument("Node::add_child: null child");
    }
    if (child.get() == this || child->is_ancestor_of(this)) {
        throw std::invalid_argument("Node::add_child: '" + child->name_ +
                                    "' cannot become a child of its own subtree");
    }
    child->parent_ = this;
    children_.push_back(std::move(child));
    return children_.back().get();
}

std::unique_ptr<Node> Node::remove_child(Node* child) {
    auto it = std::find_if(children_.begin(), children_.end(),
                           [child](const std::unique_ptr<Node>& c) { return c.get() == child; });
    if (it == children_.end()) {
        return nullptr;
    }
    std::unique_ptr<Node> owned = std::move(*it);
    children_.erase(it);
    owned->parent_ = nullptr;
    return owned;
}

void Node::set_parent(Node* new_parent) {
    if (!new_parent) {
        throw std::invalid_argument("Node::set_parent: '" + name_ + "' needs a parent; use remove_child to detach");
    }
    if (new_parent == parent_) {
        return;
    }
    if (new_parent == this || is_ancestor_of(new_parent)) {
        throw std::invalid_argument("Node::set_parent: '" + name_ +
                                    "' cannot be re-parented under its own subtree");
    }
    if (!parent_) {
        throw std::logic_error("Node::set_parent: '" + name_ + "' is not owned by a parent");
    }
    std::unique_ptr<Node> self = parent_->remove_child(this);
    new_parent->add_child(std::move(self));
}

bool Node::is_ancestor_of(const Node* node) const {
    for (const Node* p = node ? node->parent_ : nullptr; p; p = p->parent_) {
        if (p == this) {
            return true;
        }
    }
    return false;
}

std::vector<Node*> Node::descendants() const {
    std::vector<Node*> result;
    for (const auto& child : children_) {
        child->traverse([&result](Node& n) { result.push_back(&n); });
    }
    return result;
}

Matrix4 Node::world_matrix() const {
    Matrix4 world = local_matrix();
    for (const Node* p = parent_; p; p = p->parent_) {
        world = p->local_matrix() * world;
    }
    return world;
}

}  // namespace termrast
