#include "termrast/scene.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace termrast {

bool glob_match(const std::string& pattern, const std::string& text) {
    size_t p = 0, t = 0;
    size_t star = std::string::npos, resume = 0;

    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            p++;
            t++;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = t;
        } else if (star != std::string::npos) {
            // Let the last '*' swallow one more character
            p = star + 1;
            t = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') {
        p++;
    }
    return p == pattern.size();
}

Scene::Scene() : root_(std::make_unique<Node>("root")) {
    index_[root_->name()] = root_.get();
}

Node* Scene::create_node(const std::string& name, Node* parent) {
    return attach(std::make_unique<Node>(name), parent);
}

Node* Scene::add_mesh_node(std::shared_ptr<Mesh> mesh, const std::string& name, Node* parent) {
    auto node = std::make_unique<Node>(name);
    node->mesh = std::move(mesh);
    return attach(std::move(node), parent);
}

Node* Scene::add_light_node(const Light& light, const std::string& name, Node* parent) {
    auto node = std::make_unique<Node>(name);
    node->light = light;
    return attach(std::move(node), parent);
}

Node* Scene::attach(std::unique_ptr<Node> subtree, Node* parent) {
    if (!subtree) {
        throw std::invalid_argument("Scene::attach: null subtree");
    }
    if (subtree->parent()) {
        throw std::invalid_argument("Scene::attach: '" + subtree->name() + "' already has a parent");
    }
    if (!parent) {
        parent = root_.get();
    } else if (!contains(parent)) {
        throw std::invalid_argument("Scene::attach: parent '" + parent->name() + "' is not in this scene");
    }
    index_subtree(*subtree);
    return parent->add_child(std::move(subtree));
}

std::unique_ptr<Node> Scene::detach(Node* node) {
    if (!node || node == root_.get() || !contains(node)) {
        return nullptr;
    }
    unindex_subtree(*node);
    return node->parent()->remove_child(node);
}

bool Scene::remove_node(Node* node) {
    return detach(node) != nullptr;
}

void Scene::reparent(Node* node, Node* new_parent) {
    if (!node || node == root_.get() || !contains(node)) {
        throw std::invalid_argument("Scene::reparent: node is not a child in this scene");
    }
    if (!new_parent) {
        new_parent = root_.get();
    } else if (!contains(new_parent)) {
        throw std::invalid_argument("Scene::reparent: target '" + new_parent->name() + "' is not in this scene");
    }
    node->set_parent(new_parent);
}

void Scene::rename(Node* node, const std::string& name) {
    if (!node || !contains(node)) {
        throw std::invalid_argument("Scene::rename: node is not in this scene");
    }
    if (name == node->name()) {
        return;
    }
    if (name.empty() || index_.count(name)) {
        throw std::invalid_argument("Scene::rename: name '" + name + "' is empty or already taken");
    }
    index_.erase(node->name_);
    node->name_ = name;
    index_[name] = node;
}

void Scene::reindex() {
    index_.clear();
    root_->traverse([this](Node& n) {
        if (n.name_.empty()) {
            n.name_ = "node_" + std::to_string(n.id());
        }
        if (!index_.emplace(n.name_, &n).second) {
            throw std::invalid_argument("Scene::reindex: duplicate node name '" + n.name_ + "'");
        }
    });
}

void Scene::index_subtree(Node& subtree) {
    // Validate every name first so a failed attach leaves the index untouched
    std::set<std::string> incoming;
    subtree.traverse([&](Node& n) {
        if (n.name_.empty()) {
            n.name_ = "node_" + std::to_string(n.id());
        }
        if (index_.count(n.name_) || !incoming.insert(n.name_).second) {
            throw std::invalid_argument("Scene: duplicate node name '" + n.name_ + "'");
        }
    });
    subtree.traverse([this](Node& n) { index_[n.name_] = &n; });
}

void Scene::unindex_subtree(Node& subtree) {
    subtree.traverse([this](Node& n) { index_.erase(n.name_); });
}

bool Scene::contains(const Node* node) const {
    auto it = index_.find(node->name());
    return it != index_.end() && it->second == node;
}

Node* Scene::find(const std::string& name) const {
    auto it = index_.find(name);
    return it != index_.end() ? it->second : nullptr;
}

std::vector<Node*> Scene::find_by_name(const std::string& pattern) const {
    std::vector<Node*> result;
    for (const auto& [name, node] : index_) {
        if (glob_match(pattern, name)) {
            result.push_back(node);
        }
    }
    return result;
}

std::vector<Node*> Scene::find_by_tag_any(const std::vector<std::string>& tags) const {
    std::vector<Node*> result;
    for (const auto& entry : index_) {
        Node* node = entry.second;
        if (std::any_of(tags.begin(), tags.end(), [node](const std::string& t) { return node->has_tag(t); })) {
            result.push_back(node);
        }
    }
    return result;
}

std::vector<Node*> Scene::find_by_tag_all(const std::vector<std::string>& tags) const {
    std::vector<Node*> result;
    if (tags.empty()) {
        return result;
    }
    for (const auto& entry : index_) {
        Node* node = entry.second;
        if (std::all_of(tags.begin(), tags.end(), [node](const std::string& t) { return node->has_tag(t); })) {
            result.push_back(node);
        }
    }
    return result;
}

std::vector<Node*> Scene::mesh_nodes() const {
    std::vector<Node*> result;
    root_->traverse([&result](Node& n) {
        if (n.mesh) {
            result.push_back(&n);
        }
    });
    return result;
}

std::vector<Node*> Scene::light_nodes() const {
    std::vector<Node*> result;
    root_->traverse([&result](Node& n) {
        if (n.light) {
            result.push_back(&n);
        }
    });
    return result;
}

SceneStats Scene::statistics() const {
    SceneStats stats;
    traverse([&stats](const Node& n) {
        stats.nodes++;
        if (n.mesh) {
            stats.meshes++;
            stats.vertices += n.mesh->verts().size();
            stats.triangles += n.mesh->faces().size();
        }
        if (n.light) {
            stats.lights++;
        }
    });
    return stats;
}

}  // namespace termrast
